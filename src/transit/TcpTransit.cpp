#include "wormhole/transit/TcpTransit.hpp"

#include "wormhole/Errors.hpp"
#include "wormhole/diagnostics/StructuredLogger.hpp"
#include "wormhole/transit/RecordCodec.hpp"
#include "wormhole/transit/TcpRecordPipe.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

namespace wormhole::transit {

namespace {

constexpr std::string_view kGo = "go\n";
constexpr std::string_view kRelayOk = "ok\n";

std::string random_side() {
    std::random_device rd;
    Bytes side(8);
    for (auto& byte : side) {
        byte = static_cast<std::uint8_t>(rd());
    }
    return to_hex(side);
}

void apply_recv_timeout(net::SocketHandle socket, std::chrono::milliseconds timeout) {
    if (!net::set_recv_timeout(socket, timeout)) {
        diagnostics::log_warning("transit.timeout_unset", {{"timeout_ms", std::to_string(timeout.count())}});
    }
}

bool send_text(net::SocketHandle socket, std::string_view text) {
    return net::send_all(socket, reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

}  // namespace

TcpTransit::TcpTransit(const ReceiveConfig& config)
    : side_(random_side()),
      connect_timeout_(config.transit_connect_timeout),
      accept_timeout_(config.transit_accept_timeout) {
    if (!config.transit_helper.empty()) {
        if (auto helper = protocol::parse_endpoint(protocol::json::Value(config.transit_helper))) {
            helper_hints_.push_back(std::move(*helper));
        } else {
            diagnostics::log_warning("transit.helper_ignored", {{"helper", config.transit_helper}});
        }
    }

    if (!config.no_listen) {
        try {
            listener_ = net::listen_tcp(0, listen_port_);
        } catch (const std::runtime_error& ex) {
            diagnostics::log_warning("transit.listen_failed", {{"error", ex.what()}});
            listener_ = net::kInvalidSocket;
            listen_port_ = 0;
        }
    }
}

TcpTransit::~TcpTransit() {
    net::close_socket(listener_);
}

void TcpTransit::set_transit_key(ByteView key) {
    transit_key_.assign(key.begin(), key.end());
}

void TcpTransit::add_peer_direct_hints(const std::vector<protocol::EndpointDescriptor>& hints) {
    peer_direct_hints_.insert(peer_direct_hints_.end(), hints.begin(), hints.end());
}

void TcpTransit::add_peer_relay_hints(const std::vector<protocol::EndpointDescriptor>& hints) {
    peer_relay_hints_.insert(peer_relay_hints_.end(), hints.begin(), hints.end());
}

std::vector<protocol::EndpointDescriptor> TcpTransit::own_direct_hints() {
    std::vector<protocol::EndpointDescriptor> hints;
    if (listener_ == net::kInvalidSocket) {
        return hints;
    }
    for (const auto& address : net::local_ipv4_addresses()) {
        protocol::EndpointDescriptor hint{};
        hint.hostname = address;
        hint.port = listen_port_;
        hints.push_back(std::move(hint));
    }
    return hints;
}

std::vector<protocol::EndpointDescriptor> TcpTransit::own_relay_hints() {
    return helper_hints_;
}

std::unique_ptr<channel::RecordPipe> TcpTransit::connect() {
    if (transit_key_.empty()) {
        throw std::logic_error("transit key must be set before connecting");
    }

    auto direct = peer_direct_hints_;
    std::stable_sort(direct.begin(), direct.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.priority > rhs.priority;
    });
    for (const auto& hint : direct) {
        if (auto pipe = try_direct(hint)) {
            return pipe;
        }
    }

    if (auto pipe = try_inbound()) {
        return pipe;
    }

    auto relays = peer_relay_hints_;
    relays.insert(relays.end(), helper_hints_.begin(), helper_hints_.end());
    for (const auto& hint : relays) {
        if (auto pipe = try_relay(hint)) {
            return pipe;
        }
    }

    throw TransferError("unable to establish a transit connection");
}

std::unique_ptr<channel::RecordPipe> TcpTransit::try_direct(const protocol::EndpointDescriptor& hint) {
    const auto socket = net::connect_tcp(hint.hostname, hint.port, connect_timeout_);
    if (socket == net::kInvalidSocket) {
        diagnostics::log_info("transit.direct_failed", {{"hint", protocol::describe(hint)}});
        return nullptr;
    }
    return negotiate(socket, "->" + protocol::describe(hint));
}

std::unique_ptr<channel::RecordPipe> TcpTransit::try_inbound() {
    if (listener_ == net::kInvalidSocket) {
        return nullptr;
    }
    const auto socket = net::accept_with_timeout(listener_, accept_timeout_);
    if (socket == net::kInvalidSocket) {
        return nullptr;
    }
    return negotiate(socket, "<-tcp:" + net::endpoint_string(socket));
}

std::unique_ptr<channel::RecordPipe> TcpTransit::try_relay(const protocol::EndpointDescriptor& hint) {
    const auto socket = net::connect_tcp(hint.hostname, hint.port, connect_timeout_);
    if (socket == net::kInvalidSocket) {
        diagnostics::log_info("transit.relay_failed", {{"hint", protocol::describe(hint)}});
        return nullptr;
    }

    apply_recv_timeout(socket, accept_timeout_);
    if (!send_text(socket, build_relay_handshake(transit_key_, side_)) ||
        !expect_exact(socket, std::string(kRelayOk))) {
        diagnostics::log_info("transit.relay_refused", {{"hint", protocol::describe(hint)}});
        net::close_socket(socket);
        return nullptr;
    }
    return negotiate(socket, "->relay:" + protocol::describe(hint));
}

std::unique_ptr<channel::RecordPipe> TcpTransit::negotiate(net::SocketHandle socket, std::string description) {
    apply_recv_timeout(socket, accept_timeout_);

    if (!send_text(socket, build_receiver_handshake(transit_key_)) ||
        !expect_exact(socket, build_sender_handshake(transit_key_)) ||
        !expect_exact(socket, std::string(kGo))) {
        diagnostics::log_info("transit.handshake_failed", {{"connection", description}});
        net::close_socket(socket);
        return nullptr;
    }

    // The payload stream may stall for as long as the sender needs.
    apply_recv_timeout(socket, std::chrono::milliseconds(0));
    diagnostics::log_info("transit.connected", {{"connection", description}});
    return std::make_unique<TcpRecordPipe>(socket, RecordCodec(transit_key_, Role::Receiver), std::move(description));
}

bool TcpTransit::expect_exact(net::SocketHandle socket, const std::string& expected) {
    Bytes buffer(expected.size());
    std::size_t received = 0;
    if (!net::recv_all(socket, buffer.data(), buffer.size(), received)) {
        return false;
    }
    return std::equal(buffer.begin(), buffer.end(), expected.begin(), expected.end(),
                      [](std::uint8_t lhs, char rhs) { return lhs == static_cast<std::uint8_t>(rhs); });
}

std::unique_ptr<channel::TransitChannel> make_tcp_transit(const ReceiveConfig& config) {
    return std::make_unique<TcpTransit>(config);
}

}  // namespace wormhole::transit
