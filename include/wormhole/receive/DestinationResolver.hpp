#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace wormhole::receive {

enum class DestinationKind {
    File,
    Directory
};

std::string_view to_string(DestinationKind kind);

// Decides where an offered file or directory lands. Only the final path
// component of a peer-supplied name is ever used, so "~/.ssh/authorized_keys"
// resolves to "authorized_keys" inside the working directory.
class DestinationResolver {
public:
    DestinationResolver(std::filesystem::path cwd,
                        std::optional<std::string> override_name,
                        std::ostream& out);

    // Throws ResponderError("<kind> already exists") when the destination is
    // present and ResponderError("invalid <kind> name") when nothing usable
    // remains of the proposed name.
    std::filesystem::path resolve(DestinationKind kind, const std::string& proposed) const;

    static std::string basename(std::string_view name);

private:
    std::filesystem::path cwd_;
    std::optional<std::string> override_name_;
    std::ostream& out_;
};

}  // namespace wormhole::receive
