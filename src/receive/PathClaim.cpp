#include "wormhole/receive/PathClaim.hpp"

#include "wormhole/Errors.hpp"
#include "wormhole/diagnostics/StructuredLogger.hpp"

#include <random>
#include <string>
#include <string_view>
#include <system_error>

namespace wormhole::receive {

namespace {

constexpr int kClaimAttempts = 16;
constexpr std::string_view kSiblingSuffix = ".tmp";

}  // namespace

bool path_occupied(const std::filesystem::path& path) {
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw std::filesystem::filesystem_error("unable to inspect destination", path, ec);
    }
    return std::filesystem::exists(status);
}

std::filesystem::path claim_sibling(const std::filesystem::path& destination,
                                    const std::function<bool(const std::filesystem::path&)>& try_create) {
    std::random_device rd;
    for (int attempt = 0; attempt < kClaimAttempts; ++attempt) {
        auto candidate = destination;
        candidate += std::string(kSiblingSuffix);
        if (attempt > 0) {
            candidate += "-" + std::to_string(rd() % 1000000);
        }
        if (path_occupied(candidate)) {
            diagnostics::log_info("receive.sibling_taken", {{"path", candidate.string()}});
            continue;
        }
        if (try_create(candidate)) {
            return candidate;
        }
    }
    throw std::filesystem::filesystem_error("unable to claim a working path", destination,
                                            std::make_error_code(std::errc::file_exists));
}

void ensure_vacant(const std::filesystem::path& destination) {
    if (path_occupied(destination)) {
        diagnostics::log_warning("receive.destination_appeared", {{"path", destination.string()}});
        throw TransferError("destination appeared during transfer: " + destination.filename().string());
    }
}

}  // namespace wormhole::receive
