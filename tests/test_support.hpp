#pragma once

#include "wormhole/Errors.hpp"
#include "wormhole/Types.hpp"
#include "wormhole/channel/RecordPipe.hpp"
#include "wormhole/channel/TransitChannel.hpp"
#include "wormhole/channel/WormholeChannel.hpp"
#include "wormhole/receive/ReceiveSession.hpp"

#include <zlib.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace wormhole::test {

// Scripted wormhole: get() replays `inbox` and then reports a closed channel.
class FakeWormholeChannel : public channel::WormholeChannel {
public:
    void set_code(const std::string& code) override { code_set = code; }

    void input_code(const std::string& prompt, int length) override {
        input_prompt = prompt;
        code_length = length;
    }

    Bytes verify() override {
        if (fail_verify) {
            throw AuthenticationError("wrong password");
        }
        return verifier;
    }

    Bytes derive_key(const std::string& purpose, std::size_t length) override {
        derived_purposes.push_back(purpose);
        return Bytes(length, 0x42);
    }

    void send(ByteView message) override { sent.push_back(to_string(message)); }

    Bytes get() override {
        if (inbox.empty()) {
            throw ChannelClosedError();
        }
        auto next = std::move(inbox.front());
        inbox.pop_front();
        return next;
    }

    void close() override {
        ++close_calls;
        if (fail_close) {
            throw std::runtime_error("close failed");
        }
    }

    void queue(const std::string& json) { inbox.push_back(to_bytes(json)); }

    std::optional<std::string> code_set;
    std::optional<std::string> input_prompt;
    int code_length{0};
    Bytes verifier{0xde, 0xad, 0xbe, 0xef};
    bool fail_verify{false};
    bool fail_close{false};
    int close_calls{0};
    std::deque<Bytes> inbox;
    std::vector<std::string> sent;
    std::vector<std::string> derived_purposes;
};

struct PipeScript {
    std::vector<Bytes> chunks;
    std::vector<std::string> records_sent;
    bool closed{false};
};

// Delivers `chunks` until the expected size is reached or they run out.
class FakeRecordPipe : public channel::RecordPipe {
public:
    explicit FakeRecordPipe(std::shared_ptr<PipeScript> record)
        : record_(std::move(record)) {}

    std::string describe() const override { return "->tcp:fake-peer:4001"; }

    std::uint64_t write_to_file(channel::TransferTarget& target,
                                std::uint64_t expected_size,
                                const ProgressCallback& on_progress) override {
        std::uint64_t received = 0;
        for (const auto& chunk : record_->chunks) {
            if (received >= expected_size) {
                break;
            }
            target.write(chunk);
            received += chunk.size();
            if (on_progress) {
                on_progress(chunk.size());
            }
        }
        return received;
    }

    void send_record(ByteView record) override { record_->records_sent.push_back(to_string(record)); }

    void close() override { record_->closed = true; }

private:
    std::shared_ptr<PipeScript> record_;
};

struct TransitRecord {
    int created{0};
    int connects{0};
    Bytes key;
    std::vector<protocol::EndpointDescriptor> peer_direct;
    std::vector<protocol::EndpointDescriptor> peer_relay;
    std::shared_ptr<PipeScript> pipe;
};

class FakeTransit : public channel::TransitChannel {
public:
    explicit FakeTransit(std::shared_ptr<TransitRecord> record)
        : record_(std::move(record)) {}

    void set_transit_key(ByteView key) override { record_->key.assign(key.begin(), key.end()); }

    void add_peer_direct_hints(const std::vector<protocol::EndpointDescriptor>& hints) override {
        record_->peer_direct.insert(record_->peer_direct.end(), hints.begin(), hints.end());
    }

    void add_peer_relay_hints(const std::vector<protocol::EndpointDescriptor>& hints) override {
        record_->peer_relay.insert(record_->peer_relay.end(), hints.begin(), hints.end());
    }

    std::vector<protocol::EndpointDescriptor> own_direct_hints() override {
        protocol::EndpointDescriptor hint{};
        hint.hostname = "192.0.2.7";
        hint.port = 4002;
        return {hint};
    }

    std::vector<protocol::EndpointDescriptor> own_relay_hints() override { return {}; }

    std::unique_ptr<channel::RecordPipe> connect() override {
        ++record_->connects;
        if (!record_->pipe) {
            throw TransferError("unable to establish a transit connection");
        }
        return std::make_unique<FakeRecordPipe>(record_->pipe);
    }

private:
    std::shared_ptr<TransitRecord> record_;
};

inline receive::TransitFactory fake_transit_factory(const std::shared_ptr<TransitRecord>& record) {
    return [record](const ReceiveConfig&) -> std::unique_ptr<channel::TransitChannel> {
        ++record->created;
        return std::make_unique<FakeTransit>(record);
    };
}

class ScopedTempDir {
public:
    ScopedTempDir() {
        std::random_device rd;
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("wormhole_test_" + std::to_string(stamp) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
}

inline void write_file(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    stream << contents;
}

inline bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

struct ZipEntry {
    std::string name;
    std::string contents;
    bool deflate{true};
};

namespace detail {

inline void put_u16(Bytes& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
    out.push_back(static_cast<std::uint8_t>(value >> 8));
}

inline void put_u32(Bytes& out, std::uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }
}

inline Bytes raw_deflate(const std::string& input) {
    z_stream stream{};
    if (deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    Bytes output(deflateBound(&stream, static_cast<uLong>(input.size())) + 16);
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = output.data();
    stream.avail_out = static_cast<uInt>(output.size());
    const int rc = deflate(&stream, Z_FINISH);
    deflateEnd(&stream);
    if (rc != Z_STREAM_END) {
        throw std::runtime_error("deflate failed");
    }
    output.resize(stream.total_out);
    return output;
}

}  // namespace detail

// Builds a minimal PKZIP archive the way the sending side's zipfile module does.
inline Bytes build_zip(const std::vector<ZipEntry>& entries) {
    Bytes archive;
    Bytes directory;
    for (const auto& entry : entries) {
        const bool is_directory = !entry.name.empty() && entry.name.back() == '/';
        const bool deflated = entry.deflate && !is_directory;
        const Bytes payload = deflated ? detail::raw_deflate(entry.contents) : to_bytes(entry.contents);
        const auto crc = static_cast<std::uint32_t>(
            crc32(crc32(0L, Z_NULL, 0), reinterpret_cast<const Bytef*>(entry.contents.data()),
                  static_cast<uInt>(entry.contents.size())));
        const auto method = static_cast<std::uint16_t>(deflated ? 8 : 0);
        const auto offset = static_cast<std::uint32_t>(archive.size());

        detail::put_u32(archive, 0x04034b50);
        detail::put_u16(archive, 20);
        detail::put_u16(archive, 0);
        detail::put_u16(archive, method);
        detail::put_u16(archive, 0);
        detail::put_u16(archive, 0);
        detail::put_u32(archive, crc);
        detail::put_u32(archive, static_cast<std::uint32_t>(payload.size()));
        detail::put_u32(archive, static_cast<std::uint32_t>(entry.contents.size()));
        detail::put_u16(archive, static_cast<std::uint16_t>(entry.name.size()));
        detail::put_u16(archive, 0);
        archive.insert(archive.end(), entry.name.begin(), entry.name.end());
        archive.insert(archive.end(), payload.begin(), payload.end());

        detail::put_u32(directory, 0x02014b50);
        detail::put_u16(directory, 20);
        detail::put_u16(directory, 20);
        detail::put_u16(directory, 0);
        detail::put_u16(directory, method);
        detail::put_u16(directory, 0);
        detail::put_u16(directory, 0);
        detail::put_u32(directory, crc);
        detail::put_u32(directory, static_cast<std::uint32_t>(payload.size()));
        detail::put_u32(directory, static_cast<std::uint32_t>(entry.contents.size()));
        detail::put_u16(directory, static_cast<std::uint16_t>(entry.name.size()));
        detail::put_u16(directory, 0);
        detail::put_u16(directory, 0);
        detail::put_u16(directory, 0);
        detail::put_u16(directory, 0);
        detail::put_u32(directory, is_directory ? 0x10u : 0u);
        detail::put_u32(directory, offset);
        directory.insert(directory.end(), entry.name.begin(), entry.name.end());
    }

    const auto directory_offset = static_cast<std::uint32_t>(archive.size());
    archive.insert(archive.end(), directory.begin(), directory.end());
    detail::put_u32(archive, 0x06054b50);
    detail::put_u16(archive, 0);
    detail::put_u16(archive, 0);
    detail::put_u16(archive, static_cast<std::uint16_t>(entries.size()));
    detail::put_u16(archive, static_cast<std::uint16_t>(entries.size()));
    detail::put_u32(archive, static_cast<std::uint32_t>(directory.size()));
    detail::put_u32(archive, directory_offset);
    detail::put_u16(archive, 0);
    return archive;
}

// Splits `data` into records of at most `chunk_size` bytes.
inline std::vector<Bytes> chunked(const Bytes& data, std::size_t chunk_size) {
    std::vector<Bytes> chunks;
    for (std::size_t offset = 0; offset < data.size(); offset += chunk_size) {
        const auto end = std::min(data.size(), offset + chunk_size);
        chunks.emplace_back(data.begin() + static_cast<std::ptrdiff_t>(offset),
                            data.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return chunks;
}

}  // namespace wormhole::test
