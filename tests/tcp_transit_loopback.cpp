#include "wormhole/Errors.hpp"
#include "wormhole/transit/RecordCodec.hpp"
#include "wormhole/transit/Socket.hpp"
#include "wormhole/transit/TcpTransit.hpp"

#include <cassert>
#include <array>
#include <chrono>
#include <future>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using namespace wormhole;

namespace {

class BufferTarget : public channel::TransferTarget {
public:
    void write(ByteView data) override { buffer.insert(buffer.end(), data.begin(), data.end()); }

    Bytes buffer;
};

bool read_exact(transit::net::SocketHandle socket, const std::string& expected) {
    Bytes buffer(expected.size());
    std::size_t received = 0;
    return transit::net::recv_all(socket, buffer.data(), buffer.size(), received) &&
           to_string(buffer) == expected;
}

bool send_text(transit::net::SocketHandle socket, const std::string& text) {
    return transit::net::send_all(socket, reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

// Plays the sending side on an already connected socket.
std::string run_sender(transit::net::SocketHandle socket, const Bytes& key, const std::vector<std::string>& records) {
    if (!read_exact(socket, transit::build_receiver_handshake(key))) {
        return "receiver handshake mismatch";
    }
    if (!send_text(socket, transit::build_sender_handshake(key)) || !send_text(socket, "go\n")) {
        return "failed to send sender handshake";
    }

    transit::RecordCodec codec(key, transit::Role::Sender);
    for (const auto& record : records) {
        const auto framed = codec.frame(to_bytes(record));
        if (!transit::net::send_all(socket, framed.data(), framed.size())) {
            return "failed to send record";
        }
    }

    std::array<std::uint8_t, 4> header{};
    std::size_t received = 0;
    if (!transit::net::recv_all(socket, header.data(), header.size(), received)) {
        return "missing completion record";
    }
    const auto length = (static_cast<std::size_t>(header[0]) << 24) | (static_cast<std::size_t>(header[1]) << 16) |
                        (static_cast<std::size_t>(header[2]) << 8) | header[3];
    Bytes sealed(length);
    if (!transit::net::recv_all(socket, sealed.data(), sealed.size(), received)) {
        return "truncated completion record";
    }
    if (to_string(codec.open(sealed)) != "ok\n") {
        return "unexpected completion record";
    }
    return {};
}

bool check_codec() {
    const Bytes key(32, 0x07);
    transit::RecordCodec sender(key, transit::Role::Sender);
    transit::RecordCodec receiver(key, transit::Role::Receiver);

    const auto first = sender.seal(to_bytes("first"));
    const auto second = sender.seal(to_bytes("second"));
    assert(first.size() == 5 + transit::RecordCodec::kOverhead);

    // Out-of-order delivery is refused.
    try {
        receiver.open(second);
        return false;
    } catch (const TransferError&) {
    }
    assert(to_string(receiver.open(first)) == "first");
    assert(to_string(receiver.open(second)) == "second");

    auto tampered = sender.seal(to_bytes("third"));
    tampered[transit::RecordCodec::kNonceSize] ^= 0x01;
    try {
        receiver.open(tampered);
        return false;
    } catch (const TransferError&) {
    }
    return true;
}

}  // namespace

int main() {
    if (!check_codec()) {
        std::cerr << "[TcpTransit] record codec accepted a bad record" << std::endl;
        return 1;
    }

    const Bytes key(32, 0x5a);
    const std::vector<std::string> records{"hello ", "transit ", "world"};

    // Inbound: the sender dials our advertised listener.
    {
        ReceiveConfig config{};
        config.transit_accept_timeout = 5s;
        transit::TcpTransit receiver(config);
        receiver.set_transit_key(key);
        assert(receiver.listening_port() != 0);

        auto sender = std::async(std::launch::async, [&]() -> std::string {
            const auto socket = transit::net::connect_tcp("127.0.0.1", receiver.listening_port(), 2s);
            if (socket == transit::net::kInvalidSocket) {
                return "sender could not connect";
            }
            auto failure = run_sender(socket, key, records);
            transit::net::close_socket(socket);
            return failure;
        });

        auto pipe = receiver.connect();
        assert(pipe->describe().rfind("<-tcp:", 0) == 0);
        BufferTarget target;
        std::uint64_t progress = 0;
        const auto received = pipe->write_to_file(target, 19, [&](std::uint64_t bytes) { progress += bytes; });
        assert(received == 19);
        assert(progress == 19);
        assert(to_string(target.buffer) == "hello transit world");
        pipe->send_record(to_bytes("ok\n"));
        pipe->close();

        const auto failure = sender.get();
        if (!failure.empty()) {
            std::cerr << "[TcpTransit] inbound: " << failure << std::endl;
            return 1;
        }
    }

    // Direct: we dial the sender's hint.
    {
        std::uint16_t port = 0;
        const auto listener = transit::net::listen_tcp(0, port);

        auto sender = std::async(std::launch::async, [&]() -> std::string {
            const auto socket = transit::net::accept_with_timeout(listener, 5s);
            if (socket == transit::net::kInvalidSocket) {
                return "receiver never connected";
            }
            auto failure = run_sender(socket, key, {"abc"});
            transit::net::close_socket(socket);
            return failure;
        });

        ReceiveConfig config{};
        config.no_listen = true;
        transit::TcpTransit receiver(config);
        receiver.set_transit_key(key);
        assert(receiver.own_direct_hints().empty());

        protocol::EndpointDescriptor hint{};
        hint.hostname = "127.0.0.1";
        hint.port = port;
        receiver.add_peer_direct_hints({hint});

        auto pipe = receiver.connect();
        assert(pipe->describe() == "->tcp:127.0.0.1:" + std::to_string(port));
        BufferTarget target;
        assert(pipe->write_to_file(target, 3, {}) == 3);
        pipe->send_record(to_bytes("ok\n"));
        pipe->close();

        const auto failure = sender.get();
        transit::net::close_socket(listener);
        if (!failure.empty()) {
            std::cerr << "[TcpTransit] direct: " << failure << std::endl;
            return 1;
        }
    }

    // Nothing reachable.
    {
        ReceiveConfig config{};
        config.no_listen = true;
        config.transit_connect_timeout = 500ms;
        transit::TcpTransit receiver(config);
        receiver.set_transit_key(key);
        bool threw = false;
        try {
            receiver.connect();
        } catch (const TransferError&) {
            threw = true;
        }
        assert(threw);
    }

    return 0;
}
