#pragma once

#include "wormhole/Config.hpp"
#include "wormhole/channel/TransitChannel.hpp"
#include "wormhole/transit/Socket.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wormhole::transit {

// Receiver side of the transit protocol over plain TCP. Peer direct hints
// are tried in priority order, then an inbound connection on our own
// listener, then relay hints. The first connection whose handshake
// succeeds becomes the record pipe.
class TcpTransit : public channel::TransitChannel {
public:
    explicit TcpTransit(const ReceiveConfig& config);
    ~TcpTransit() override;

    TcpTransit(const TcpTransit&) = delete;
    TcpTransit& operator=(const TcpTransit&) = delete;

    void set_transit_key(ByteView key) override;

    void add_peer_direct_hints(const std::vector<protocol::EndpointDescriptor>& hints) override;
    void add_peer_relay_hints(const std::vector<protocol::EndpointDescriptor>& hints) override;

    std::vector<protocol::EndpointDescriptor> own_direct_hints() override;
    std::vector<protocol::EndpointDescriptor> own_relay_hints() override;

    std::unique_ptr<channel::RecordPipe> connect() override;

    std::uint16_t listening_port() const noexcept { return listen_port_; }

private:
    std::unique_ptr<channel::RecordPipe> try_direct(const protocol::EndpointDescriptor& hint);
    std::unique_ptr<channel::RecordPipe> try_relay(const protocol::EndpointDescriptor& hint);
    std::unique_ptr<channel::RecordPipe> try_inbound();
    std::unique_ptr<channel::RecordPipe> negotiate(net::SocketHandle socket, std::string description);

    bool expect_exact(net::SocketHandle socket, const std::string& expected);

    Bytes transit_key_;
    std::string side_;
    std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds accept_timeout_;
    net::SocketHandle listener_{net::kInvalidSocket};
    std::uint16_t listen_port_{0};
    std::vector<protocol::EndpointDescriptor> peer_direct_hints_;
    std::vector<protocol::EndpointDescriptor> peer_relay_hints_;
    std::vector<protocol::EndpointDescriptor> helper_hints_;
};

std::unique_ptr<channel::TransitChannel> make_tcp_transit(const ReceiveConfig& config);

}  // namespace wormhole::transit
