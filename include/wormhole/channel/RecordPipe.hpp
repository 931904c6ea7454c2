#pragma once

#include "wormhole/Types.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace wormhole::channel {

// Destination for the bulk payload stream.
class TransferTarget {
public:
    virtual ~TransferTarget() = default;

    virtual void write(ByteView data) = 0;
};

// A connected duplex bulk channel carrying encrypted records.
class RecordPipe {
public:
    using ProgressCallback = std::function<void(std::uint64_t bytes)>;

    virtual ~RecordPipe() = default;

    virtual std::string describe() const = 0;

    // Streams records into `target` until at least `expected_size` bytes
    // arrived or the peer closed the pipe. Returns the number of bytes
    // received, which is short when the connection dropped.
    virtual std::uint64_t write_to_file(TransferTarget& target,
                                        std::uint64_t expected_size,
                                        const ProgressCallback& on_progress) = 0;

    virtual void send_record(ByteView record) = 0;

    virtual void close() = 0;
};

}  // namespace wormhole::channel
