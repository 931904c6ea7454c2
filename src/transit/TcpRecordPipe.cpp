#include "wormhole/transit/TcpRecordPipe.hpp"

#include "wormhole/Errors.hpp"

#include <array>
#include <utility>

namespace wormhole::transit {

TcpRecordPipe::TcpRecordPipe(net::SocketHandle socket, RecordCodec codec, std::string description)
    : socket_(socket),
      codec_(std::move(codec)),
      description_(std::move(description)) {}

TcpRecordPipe::~TcpRecordPipe() {
    close();
}

std::string TcpRecordPipe::describe() const {
    return description_;
}

std::uint64_t TcpRecordPipe::write_to_file(channel::TransferTarget& target,
                                           std::uint64_t expected_size,
                                           const ProgressCallback& on_progress) {
    std::uint64_t received = 0;
    while (received < expected_size) {
        auto record = receive_record();
        if (!record.has_value()) {
            break;
        }
        target.write(*record);
        received += record->size();
        if (on_progress) {
            on_progress(record->size());
        }
    }
    return received;
}

void TcpRecordPipe::send_record(ByteView record) {
    if (socket_ == net::kInvalidSocket) {
        throw TransferError("transit pipe is closed");
    }
    const auto framed = codec_.frame(record);
    if (!net::send_all(socket_, framed.data(), framed.size())) {
        throw TransferError("transit connection lost while sending");
    }
}

void TcpRecordPipe::close() {
    if (socket_ == net::kInvalidSocket) {
        return;
    }
    net::close_socket(socket_);
    socket_ = net::kInvalidSocket;
}

std::optional<Bytes> TcpRecordPipe::receive_record() {
    if (socket_ == net::kInvalidSocket) {
        return std::nullopt;
    }

    std::array<std::uint8_t, 4> header{};
    std::size_t received = 0;
    if (!net::recv_all(socket_, header.data(), header.size(), received)) {
        return std::nullopt;
    }

    const auto length = (static_cast<std::uint32_t>(header[0]) << 24) |
                        (static_cast<std::uint32_t>(header[1]) << 16) |
                        (static_cast<std::uint32_t>(header[2]) << 8) |
                        static_cast<std::uint32_t>(header[3]);
    if (length > kMaxRecordSize) {
        throw TransferError("transit record exceeds maximum size");
    }

    Bytes sealed(length);
    if (!net::recv_all(socket_, sealed.data(), sealed.size(), received)) {
        // A record cut short counts as a dropped connection.
        return std::nullopt;
    }
    return codec_.open(sealed);
}

}  // namespace wormhole::transit
