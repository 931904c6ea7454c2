#pragma once

#include "wormhole/Types.hpp"
#include "wormhole/channel/RecordPipe.hpp"
#include "wormhole/protocol/Negotiation.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace wormhole::channel {

// Negotiates the bulk connection from exchanged hint sets.
class TransitChannel {
public:
    static constexpr std::size_t kTransitKeyLength = 32;

    virtual ~TransitChannel() = default;

    virtual void set_transit_key(ByteView key) = 0;

    virtual void add_peer_direct_hints(const std::vector<protocol::EndpointDescriptor>& hints) = 0;
    virtual void add_peer_relay_hints(const std::vector<protocol::EndpointDescriptor>& hints) = 0;

    virtual std::vector<protocol::EndpointDescriptor> own_direct_hints() = 0;
    virtual std::vector<protocol::EndpointDescriptor> own_relay_hints() = 0;

    // Throws TransferError when no hint yields a connection.
    virtual std::unique_ptr<RecordPipe> connect() = 0;
};

}  // namespace wormhole::channel
