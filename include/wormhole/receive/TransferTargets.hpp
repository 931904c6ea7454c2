#pragma once

#include "wormhole/Types.hpp"
#include "wormhole/channel/RecordPipe.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>

namespace wormhole::receive {

struct StdioCloser {
    void operator()(std::FILE* file) const noexcept { std::fclose(file); }
};

// Writes a single received file to an exclusively created sibling,
// "<destination>.tmp" or "<destination>.tmp-<random>" when that name is
// taken. The file only takes its final name on commit(), which refuses to
// replace anything that appeared at the destination meanwhile. An
// uncommitted target removes its own temporary file when destroyed.
class FileTarget : public channel::TransferTarget {
public:
    explicit FileTarget(std::filesystem::path destination);
    ~FileTarget() override;

    FileTarget(const FileTarget&) = delete;
    FileTarget& operator=(const FileTarget&) = delete;

    void write(ByteView data) override;

    void commit();

    const std::filesystem::path& destination() const noexcept { return destination_; }
    const std::filesystem::path& temp_path() const noexcept { return temp_path_; }
    std::uint64_t bytes_written() const noexcept { return bytes_written_; }

private:
    std::filesystem::path destination_;
    std::filesystem::path temp_path_;
    std::unique_ptr<std::FILE, StdioCloser> file_;
    std::uint64_t bytes_written_{0};
    bool committed_{false};
};

// Accumulates a directory archive in memory and moves it to an anonymous
// temporary file once it outgrows `memory_limit`.
class SpoolTarget : public channel::TransferTarget {
public:
    static constexpr std::size_t kDefaultMemoryLimit = 10 * 1024 * 1024;

    explicit SpoolTarget(std::size_t memory_limit = kDefaultMemoryLimit);

    void write(ByteView data) override;

    // Throws TransferError when the range lies outside the spooled data.
    void read_at(std::uint64_t offset, std::uint8_t* out, std::size_t length) const;

    std::uint64_t size() const noexcept { return size_; }
    bool spilled() const noexcept { return file_ != nullptr; }

private:
    void spill();
    void seek(std::uint64_t offset) const;

    std::size_t memory_limit_;
    Bytes memory_;
    std::unique_ptr<std::FILE, StdioCloser> file_;
    std::uint64_t size_{0};
};

}  // namespace wormhole::receive
