#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace wormhole {

using Bytes = std::vector<std::uint8_t>;
using ByteView = std::span<const std::uint8_t>;

// Identifies this application in every key derivation purpose string.
inline constexpr std::string_view kAppId = "lothar.com/wormhole/text-or-file-xfer";

std::string to_hex(ByteView bytes);
std::optional<Bytes> from_hex(std::string_view text);

Bytes to_bytes(std::string_view text);
std::string to_string(ByteView bytes);

}  // namespace wormhole
