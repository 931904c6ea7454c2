#include "wormhole/receive/DestinationResolver.hpp"

#include "wormhole/Errors.hpp"
#include "wormhole/receive/PathClaim.hpp"

#include <ostream>
#include <utility>

namespace wormhole::receive {

std::string_view to_string(DestinationKind kind) {
    switch (kind) {
        case DestinationKind::File:
            return "file";
        case DestinationKind::Directory:
            return "directory";
    }
    return "file";
}

DestinationResolver::DestinationResolver(std::filesystem::path cwd,
                                         std::optional<std::string> override_name,
                                         std::ostream& out)
    : cwd_(std::move(cwd)), override_name_(std::move(override_name)), out_(out) {
    if (cwd_.empty()) {
        cwd_ = std::filesystem::current_path();
    }
    cwd_ = std::filesystem::absolute(cwd_);
}

std::string DestinationResolver::basename(std::string_view name) {
    const auto separator = name.find_last_of("/\\");
    if (separator == std::string_view::npos) {
        return std::string(name);
    }
    return std::string(name.substr(separator + 1));
}

std::filesystem::path DestinationResolver::resolve(DestinationKind kind, const std::string& proposed) const {
    const std::string kind_name(to_string(kind));

    std::string name = basename(proposed);
    if (override_name_ && !override_name_->empty()) {
        name = *override_name_;
    }
    if (name.empty() || name == "." || name == "..") {
        throw ResponderError("invalid " + kind_name + " name");
    }

    const auto destination = cwd_ / std::filesystem::path(name);
    if (path_occupied(destination)) {
        out_ << "Error: refusing to overwrite existing " << kind_name << ' ' << name << std::endl;
        throw ResponderError(kind_name + " already exists");
    }
    return destination;
}

}  // namespace wormhole::receive
