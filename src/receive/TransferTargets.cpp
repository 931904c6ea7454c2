#include "wormhole/receive/TransferTargets.hpp"

#include "wormhole/Errors.hpp"
#include "wormhole/diagnostics/StructuredLogger.hpp"
#include "wormhole/receive/PathClaim.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#ifndef _WIN32
#include <sys/types.h>
#endif

namespace wormhole::receive {

namespace {

std::filesystem::filesystem_error io_failure(const std::string& what, const std::filesystem::path& path) {
    return std::filesystem::filesystem_error(what, path, std::make_error_code(std::errc::io_error));
}

}  // namespace

FileTarget::FileTarget(std::filesystem::path destination)
    : destination_(std::move(destination)) {
    temp_path_ = claim_sibling(destination_, [this](const std::filesystem::path& candidate) {
        // "x" fails with EEXIST instead of truncating a file that raced us to the name.
        std::FILE* file = std::fopen(candidate.string().c_str(), "wbx");
        if (file == nullptr) {
            if (errno == EEXIST) {
                return false;
            }
            throw std::filesystem::filesystem_error("failed to open temporary file", candidate,
                                                    std::error_code(errno, std::generic_category()));
        }
        file_.reset(file);
        return true;
    });
}

FileTarget::~FileTarget() {
    if (committed_) {
        return;
    }
    file_.reset();
    std::error_code ec;
    std::filesystem::remove(temp_path_, ec);
    if (ec) {
        diagnostics::log_warning("receive.temp_cleanup_failed", {{"path", temp_path_.string()},
                                                                 {"error", ec.message()}});
    }
}

void FileTarget::write(ByteView data) {
    if (committed_ || !file_) {
        throw std::logic_error("write after commit");
    }
    if (data.empty()) {
        return;
    }
    if (std::fwrite(data.data(), 1, data.size(), file_.get()) != data.size()) {
        throw io_failure("failed to write received data", temp_path_);
    }
    bytes_written_ += data.size();
}

void FileTarget::commit() {
    if (committed_) {
        return;
    }
    if (file_) {
        if (std::fflush(file_.get()) != 0) {
            throw io_failure("failed to flush received data", temp_path_);
        }
        if (std::fclose(file_.release()) != 0) {
            throw io_failure("failed to close received data", temp_path_);
        }
    }
    ensure_vacant(destination_);
    std::filesystem::rename(temp_path_, destination_);
    committed_ = true;
}

SpoolTarget::SpoolTarget(std::size_t memory_limit)
    : memory_limit_(memory_limit) {}

void SpoolTarget::write(ByteView data) {
    if (data.empty()) {
        return;
    }
    if (!file_ && memory_.size() + data.size() > memory_limit_) {
        spill();
    }
    if (file_) {
        seek(size_);
        if (std::fwrite(data.data(), 1, data.size(), file_.get()) != data.size()) {
            throw TransferError("failed to write spooled archive data");
        }
    } else {
        memory_.insert(memory_.end(), data.begin(), data.end());
    }
    size_ += data.size();
}

void SpoolTarget::read_at(std::uint64_t offset, std::uint8_t* out, std::size_t length) const {
    if (offset > size_ || length > size_ - offset) {
        throw TransferError("read beyond end of spooled archive");
    }
    if (length == 0) {
        return;
    }
    if (!file_) {
        std::copy_n(memory_.begin() + static_cast<std::ptrdiff_t>(offset), length, out);
        return;
    }
    seek(offset);
    if (std::fread(out, 1, length, file_.get()) != length) {
        throw TransferError("failed to read spooled archive data");
    }
}

void SpoolTarget::spill() {
    std::FILE* file = std::tmpfile();
    if (file == nullptr) {
        throw std::system_error(errno, std::generic_category(), "unable to create spool file");
    }
    file_.reset(file);
    if (!memory_.empty() && std::fwrite(memory_.data(), 1, memory_.size(), file_.get()) != memory_.size()) {
        throw TransferError("failed to write spooled archive data");
    }
    diagnostics::log_info("receive.spool_spilled", {{"bytes", std::to_string(memory_.size())}});
    Bytes().swap(memory_);
}

void SpoolTarget::seek(std::uint64_t offset) const {
#ifdef _WIN32
    const int rc = _fseeki64(file_.get(), static_cast<__int64>(offset), SEEK_SET);
#else
    const int rc = fseeko(file_.get(), static_cast<off_t>(offset), SEEK_SET);
#endif
    if (rc != 0) {
        throw TransferError("failed to seek spooled archive data");
    }
}

}  // namespace wormhole::receive
