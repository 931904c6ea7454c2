#pragma once

#include "wormhole/receive/TransferTargets.hpp"

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace wormhole::receive {

struct ExtractionSummary {
    std::uint64_t files{0};
    std::uint64_t directories{0};
    std::uint64_t bytes{0};
};

// A directory claimed next to `destination` before any data arrives. It is
// renamed onto `destination` by commit() and removed, with whatever was
// extracted into it, if it is destroyed uncommitted.
class StagingDirectory {
public:
    explicit StagingDirectory(std::filesystem::path destination);
    ~StagingDirectory();

    StagingDirectory(const StagingDirectory&) = delete;
    StagingDirectory& operator=(const StagingDirectory&) = delete;

    // Throws TransferError when `destination` appeared since it was resolved.
    void commit();

    const std::filesystem::path& destination() const noexcept { return destination_; }
    const std::filesystem::path& staging_path() const noexcept { return staging_path_; }

private:
    std::filesystem::path destination_;
    std::filesystem::path staging_path_;
    bool committed_{false};
};

// Unpacks a spooled "zipfile/deflated" archive. Entries are extracted into a
// staging directory next to `destination` which is renamed into place once
// every entry has been verified; on failure the staging directory is removed.
// Absolute paths, drive letters and ".." components never leave the
// destination. Stored and deflated entries are supported; encrypted and
// Zip64 archives are rejected with TransferError.
class ZipExtractor {
public:
    static ExtractionSummary extract(const SpoolTarget& archive, StagingDirectory& staging);
    static ExtractionSummary extract(const SpoolTarget& archive, const std::filesystem::path& destination);

    // Returns an empty path when no safe component remains.
    static std::filesystem::path sanitize_entry_name(std::string_view name);
};

}  // namespace wormhole::receive
