#include "wormhole/receive/ZipExtractor.hpp"

#include "wormhole/Errors.hpp"
#include "wormhole/diagnostics/StructuredLogger.hpp"
#include "wormhole/receive/PathClaim.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace wormhole::receive {

namespace {

constexpr std::uint32_t kEndOfCentralDirectory = 0x06054b50;
constexpr std::uint32_t kCentralDirectoryEntry = 0x02014b50;
constexpr std::uint32_t kLocalFileHeader = 0x04034b50;

constexpr std::size_t kEndRecordSize = 22;
constexpr std::size_t kMaxCommentSize = 0xFFFF;
constexpr std::size_t kCentralEntrySize = 46;
constexpr std::size_t kLocalHeaderSize = 30;

constexpr std::uint16_t kMethodStored = 0;
constexpr std::uint16_t kMethodDeflated = 8;
constexpr std::uint16_t kFlagEncrypted = 0x0001;

constexpr std::size_t kChunkSize = 64 * 1024;

std::uint16_t read_u16(const std::uint8_t* data) {
    return static_cast<std::uint16_t>(data[0] | (data[1] << 8));
}

std::uint32_t read_u32(const std::uint8_t* data) {
    return static_cast<std::uint32_t>(data[0]) |
           (static_cast<std::uint32_t>(data[1]) << 8) |
           (static_cast<std::uint32_t>(data[2]) << 16) |
           (static_cast<std::uint32_t>(data[3]) << 24);
}

struct CentralEntry {
    std::string name;
    std::uint16_t flags{0};
    std::uint16_t method{0};
    std::uint32_t crc{0};
    std::uint64_t compressed_size{0};
    std::uint64_t uncompressed_size{0};
    std::uint64_t local_header_offset{0};
};

struct EndRecord {
    std::uint64_t entry_count{0};
    std::uint64_t directory_size{0};
    std::uint64_t directory_offset{0};
};

EndRecord read_end_record(const SpoolTarget& archive) {
    const auto size = archive.size();
    if (size < kEndRecordSize) {
        throw TransferError("received archive is not a zip file");
    }

    const auto window = static_cast<std::size_t>(std::min<std::uint64_t>(size, kEndRecordSize + kMaxCommentSize));
    std::vector<std::uint8_t> tail(window);
    archive.read_at(size - window, tail.data(), tail.size());

    for (std::size_t pos = window - kEndRecordSize + 1; pos-- > 0;) {
        if (read_u32(tail.data() + pos) != kEndOfCentralDirectory) {
            continue;
        }
        const auto* record = tail.data() + pos;
        const auto comment_length = read_u16(record + 20);
        if (pos + kEndRecordSize + comment_length != window) {
            continue;
        }

        const auto disk_entries = read_u16(record + 8);
        const auto total_entries = read_u16(record + 10);
        const auto directory_size = read_u32(record + 12);
        const auto directory_offset = read_u32(record + 16);
        if (total_entries == 0xFFFF || directory_size == 0xFFFFFFFFu || directory_offset == 0xFFFFFFFFu) {
            throw TransferError("zip64 archives are not supported");
        }
        if (disk_entries != total_entries || read_u16(record + 4) != 0 || read_u16(record + 6) != 0) {
            throw TransferError("multi-disk archives are not supported");
        }
        if (static_cast<std::uint64_t>(directory_offset) + directory_size > size) {
            throw TransferError("corrupt zip central directory");
        }
        return EndRecord{total_entries, directory_size, directory_offset};
    }
    throw TransferError("received archive is not a zip file");
}

std::vector<CentralEntry> read_central_directory(const SpoolTarget& archive, const EndRecord& end) {
    std::vector<std::uint8_t> directory(static_cast<std::size_t>(end.directory_size));
    archive.read_at(end.directory_offset, directory.data(), directory.size());

    std::vector<CentralEntry> entries;
    entries.reserve(static_cast<std::size_t>(end.entry_count));
    std::size_t pos = 0;
    for (std::uint64_t index = 0; index < end.entry_count; ++index) {
        if (pos + kCentralEntrySize > directory.size() ||
            read_u32(directory.data() + pos) != kCentralDirectoryEntry) {
            throw TransferError("corrupt zip central directory");
        }
        const auto* header = directory.data() + pos;
        const auto name_length = read_u16(header + 28);
        const auto extra_length = read_u16(header + 30);
        const auto comment_length = read_u16(header + 32);
        const auto entry_size = kCentralEntrySize + name_length + extra_length + comment_length;
        if (pos + entry_size > directory.size()) {
            throw TransferError("corrupt zip central directory");
        }

        CentralEntry entry{};
        entry.flags = read_u16(header + 8);
        entry.method = read_u16(header + 10);
        entry.crc = read_u32(header + 16);
        const auto compressed = read_u32(header + 20);
        const auto uncompressed = read_u32(header + 24);
        const auto offset = read_u32(header + 42);
        if (compressed == 0xFFFFFFFFu || uncompressed == 0xFFFFFFFFu || offset == 0xFFFFFFFFu) {
            throw TransferError("zip64 archives are not supported");
        }
        entry.compressed_size = compressed;
        entry.uncompressed_size = uncompressed;
        entry.local_header_offset = offset;
        entry.name.assign(reinterpret_cast<const char*>(header + kCentralEntrySize), name_length);
        entries.push_back(std::move(entry));
        pos += entry_size;
    }
    return entries;
}

std::uint64_t data_offset(const SpoolTarget& archive, const CentralEntry& entry) {
    std::array<std::uint8_t, kLocalHeaderSize> header{};
    if (entry.local_header_offset + header.size() > archive.size()) {
        throw TransferError("corrupt zip entry: " + entry.name);
    }
    archive.read_at(entry.local_header_offset, header.data(), header.size());
    if (read_u32(header.data()) != kLocalFileHeader) {
        throw TransferError("corrupt zip entry: " + entry.name);
    }
    const auto offset = entry.local_header_offset + header.size() + read_u16(header.data() + 26) +
                        read_u16(header.data() + 28);
    if (offset + entry.compressed_size > archive.size()) {
        throw TransferError("corrupt zip entry: " + entry.name);
    }
    return offset;
}

class EntryWriter {
public:
    EntryWriter(const std::filesystem::path& path, const CentralEntry& entry)
        : path_(path), entry_(entry), stream_(path, std::ios::binary | std::ios::trunc) {
        if (!stream_) {
            throw std::filesystem::filesystem_error("failed to create extracted file", path,
                                                    std::make_error_code(std::errc::io_error));
        }
    }

    void write(const std::uint8_t* data, std::size_t length) {
        if (length == 0) {
            return;
        }
        written_ += length;
        if (written_ > entry_.uncompressed_size) {
            throw TransferError("zip entry larger than declared: " + entry_.name);
        }
        crc_ = crc32(crc_, data, static_cast<uInt>(length));
        stream_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
        if (!stream_) {
            throw std::filesystem::filesystem_error("failed to write extracted file", path_,
                                                    std::make_error_code(std::errc::io_error));
        }
    }

    void finish() {
        stream_.flush();
        if (!stream_) {
            throw std::filesystem::filesystem_error("failed to write extracted file", path_,
                                                    std::make_error_code(std::errc::io_error));
        }
        if (written_ != entry_.uncompressed_size || crc_ != entry_.crc) {
            throw TransferError("zip entry failed integrity check: " + entry_.name);
        }
    }

    std::uint64_t written() const noexcept { return written_; }

private:
    std::filesystem::path path_;
    const CentralEntry& entry_;
    std::ofstream stream_;
    std::uint64_t written_{0};
    uLong crc_{crc32(0L, Z_NULL, 0)};
};

void copy_stored(const SpoolTarget& archive, std::uint64_t offset, const CentralEntry& entry, EntryWriter& writer) {
    if (entry.compressed_size != entry.uncompressed_size) {
        throw TransferError("corrupt zip entry: " + entry.name);
    }
    std::vector<std::uint8_t> chunk(kChunkSize);
    std::uint64_t remaining = entry.compressed_size;
    while (remaining > 0) {
        const auto length = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, chunk.size()));
        archive.read_at(offset, chunk.data(), length);
        writer.write(chunk.data(), length);
        offset += length;
        remaining -= length;
    }
}

struct InflateStream {
    z_stream stream{};

    InflateStream() {
        if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
            throw TransferError("unable to initialise zlib inflater");
        }
    }

    ~InflateStream() { inflateEnd(&stream); }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;
};

void inflate_entry(const SpoolTarget& archive, std::uint64_t offset, const CentralEntry& entry, EntryWriter& writer) {
    InflateStream inflater;
    auto& stream = inflater.stream;

    std::vector<std::uint8_t> input(kChunkSize);
    std::vector<std::uint8_t> output(kChunkSize);
    std::uint64_t remaining = entry.compressed_size;
    bool finished = false;

    while (!finished) {
        if (stream.avail_in == 0) {
            if (remaining == 0) {
                throw TransferError("truncated zip entry: " + entry.name);
            }
            const auto length = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, input.size()));
            archive.read_at(offset, input.data(), length);
            offset += length;
            remaining -= length;
            stream.next_in = input.data();
            stream.avail_in = static_cast<uInt>(length);
        }

        stream.next_out = output.data();
        stream.avail_out = static_cast<uInt>(output.size());
        const int rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
            throw TransferError("corrupt deflate data in zip entry: " + entry.name);
        }
        writer.write(output.data(), output.size() - stream.avail_out);
        finished = rc == Z_STREAM_END;
    }
}

ExtractionSummary extract_into(const SpoolTarget& archive, const std::filesystem::path& root) {
    const auto end = read_end_record(archive);
    const auto entries = read_central_directory(archive, end);

    ExtractionSummary summary{};
    for (const auto& entry : entries) {
        const auto relative = ZipExtractor::sanitize_entry_name(entry.name);
        if (relative.empty()) {
            diagnostics::log_warning("receive.zip_entry_skipped", {{"entry", entry.name}});
            continue;
        }
        const auto target = root / relative;

        const bool is_directory = !entry.name.empty() && (entry.name.back() == '/' || entry.name.back() == '\\');
        if (is_directory) {
            std::filesystem::create_directories(target);
            ++summary.directories;
            continue;
        }

        if ((entry.flags & kFlagEncrypted) != 0) {
            throw TransferError("encrypted zip entries are not supported: " + entry.name);
        }
        if (entry.method != kMethodStored && entry.method != kMethodDeflated) {
            throw TransferError("unsupported zip compression method " + std::to_string(entry.method) +
                                " for entry: " + entry.name);
        }

        std::filesystem::create_directories(target.parent_path());
        const auto offset = data_offset(archive, entry);
        EntryWriter writer(target, entry);
        if (entry.method == kMethodStored) {
            copy_stored(archive, offset, entry, writer);
        } else {
            inflate_entry(archive, offset, entry, writer);
        }
        writer.finish();
        ++summary.files;
        summary.bytes += writer.written();
    }
    return summary;
}

}  // namespace

StagingDirectory::StagingDirectory(std::filesystem::path destination)
    : destination_(std::move(destination)) {
    staging_path_ = claim_sibling(destination_, [](const std::filesystem::path& candidate) {
        std::error_code ec;
        if (std::filesystem::create_directory(candidate, ec)) {
            return true;
        }
        if (!ec || ec == std::errc::file_exists) {
            return false;
        }
        throw std::filesystem::filesystem_error("unable to create staging directory", candidate, ec);
    });
}

StagingDirectory::~StagingDirectory() {
    if (committed_) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(staging_path_, ec);
    if (ec) {
        diagnostics::log_warning("receive.staging_cleanup_failed", {{"path", staging_path_.string()},
                                                                    {"error", ec.message()}});
    }
}

void StagingDirectory::commit() {
    if (committed_) {
        return;
    }
    ensure_vacant(destination_);
    std::filesystem::rename(staging_path_, destination_);
    committed_ = true;
}

std::filesystem::path ZipExtractor::sanitize_entry_name(std::string_view name) {
    std::filesystem::path result;
    std::size_t start = 0;
    bool first = true;
    while (start <= name.size()) {
        const auto separator = name.find_first_of("/\\", start);
        const auto stop = separator == std::string_view::npos ? name.size() : separator;
        const auto component = name.substr(start, stop - start);
        const bool drive = first && !component.empty() && component.back() == ':';
        first = false;
        if (!component.empty() && component != "." && component != ".." && !drive) {
            result /= std::filesystem::path(std::string(component));
        }
        if (separator == std::string_view::npos) {
            break;
        }
        start = separator + 1;
    }
    return result;
}

ExtractionSummary ZipExtractor::extract(const SpoolTarget& archive, StagingDirectory& staging) {
    const auto summary = extract_into(archive, staging.staging_path());
    staging.commit();

    diagnostics::log_info("receive.unpacked", {{"destination", staging.destination().string()},
                                               {"files", std::to_string(summary.files)},
                                               {"bytes", std::to_string(summary.bytes)}});
    return summary;
}

ExtractionSummary ZipExtractor::extract(const SpoolTarget& archive, const std::filesystem::path& destination) {
    StagingDirectory staging(destination);
    return extract(archive, staging);
}

}  // namespace wormhole::receive
