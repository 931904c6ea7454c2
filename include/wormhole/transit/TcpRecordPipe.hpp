#pragma once

#include "wormhole/channel/RecordPipe.hpp"
#include "wormhole/transit/RecordCodec.hpp"
#include "wormhole/transit/Socket.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace wormhole::transit {

class TcpRecordPipe : public channel::RecordPipe {
public:
    static constexpr std::size_t kMaxRecordSize = 64 * 1024 * 1024;

    TcpRecordPipe(net::SocketHandle socket, RecordCodec codec, std::string description);
    ~TcpRecordPipe() override;

    TcpRecordPipe(const TcpRecordPipe&) = delete;
    TcpRecordPipe& operator=(const TcpRecordPipe&) = delete;

    std::string describe() const override;

    std::uint64_t write_to_file(channel::TransferTarget& target,
                                std::uint64_t expected_size,
                                const ProgressCallback& on_progress) override;

    void send_record(ByteView record) override;

    void close() override;

    // std::nullopt when the peer closed the stream between records.
    std::optional<Bytes> receive_record();

private:
    net::SocketHandle socket_{net::kInvalidSocket};
    RecordCodec codec_;
    std::string description_;
};

}  // namespace wormhole::transit
