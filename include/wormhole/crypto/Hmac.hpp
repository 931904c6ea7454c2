#pragma once

#include "wormhole/Types.hpp"
#include "wormhole/crypto/Sha256.hpp"

#include <cstddef>
#include <span>
#include <string_view>

namespace wormhole::crypto {

class HmacSha256 {
public:
    static constexpr std::size_t kDigestSize = Sha256::kDigestSize;

    static Digest compute(std::span<const std::uint8_t> key,
                          std::span<const std::uint8_t> data);

    // Constant-time comparison against the expected tag.
    static bool verify(std::span<const std::uint8_t> key,
                       std::span<const std::uint8_t> data,
                       std::span<const std::uint8_t> mac);
};

// HKDF-SHA256 (RFC 5869). An empty salt behaves as HashLen zero bytes.
class Hkdf {
public:
    static Digest extract(std::span<const std::uint8_t> salt,
                          std::span<const std::uint8_t> input_key_material);

    static Bytes expand(std::span<const std::uint8_t> pseudo_random_key,
                        std::span<const std::uint8_t> info,
                        std::size_t length);

    static Bytes derive(std::span<const std::uint8_t> input_key_material,
                        std::string_view info,
                        std::size_t length,
                        std::span<const std::uint8_t> salt = {});
};

}  // namespace wormhole::crypto
