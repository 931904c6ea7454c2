#include "wormhole/crypto/Hmac.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace wormhole::crypto {

Digest HmacSha256::compute(std::span<const std::uint8_t> key,
                           std::span<const std::uint8_t> data) {
    std::array<std::uint8_t, Sha256::kBlockSize> key_block{};
    if (key.size() > key_block.size()) {
        const auto hashed = Sha256::digest(key);
        std::copy(hashed.begin(), hashed.end(), key_block.begin());
    } else {
        std::copy(key.begin(), key.end(), key_block.begin());
    }

    std::array<std::uint8_t, Sha256::kBlockSize> pad{};
    for (std::size_t i = 0; i < pad.size(); ++i) {
        pad[i] = static_cast<std::uint8_t>(key_block[i] ^ 0x36u);
    }
    Sha256 inner;
    inner.update(pad);
    inner.update(data);
    const auto inner_hash = inner.finalize();

    for (std::size_t i = 0; i < pad.size(); ++i) {
        pad[i] = static_cast<std::uint8_t>(key_block[i] ^ 0x5cu);
    }
    Sha256 outer;
    outer.update(pad);
    outer.update(inner_hash);
    return outer.finalize();
}

bool HmacSha256::verify(std::span<const std::uint8_t> key,
                        std::span<const std::uint8_t> data,
                        std::span<const std::uint8_t> mac) {
    if (mac.size() != kDigestSize) {
        return false;
    }

    const auto expected = compute(key, data);
    std::uint8_t diff = 0;
    for (std::size_t i = 0; i < expected.size(); ++i) {
        diff |= static_cast<std::uint8_t>(expected[i] ^ mac[i]);
    }
    return diff == 0;
}

Digest Hkdf::extract(std::span<const std::uint8_t> salt,
                     std::span<const std::uint8_t> input_key_material) {
    return HmacSha256::compute(salt, input_key_material);
}

Bytes Hkdf::expand(std::span<const std::uint8_t> pseudo_random_key,
                   std::span<const std::uint8_t> info,
                   std::size_t length) {
    if (length > 255 * HmacSha256::kDigestSize) {
        throw std::invalid_argument("HKDF output length too large");
    }

    Bytes output;
    output.reserve(length);
    Bytes block;
    std::uint8_t counter = 1;
    while (output.size() < length) {
        Bytes message(block);
        message.insert(message.end(), info.begin(), info.end());
        message.push_back(counter++);
        const auto t = HmacSha256::compute(pseudo_random_key, message);
        block.assign(t.begin(), t.end());
        const auto take = std::min(block.size(), length - output.size());
        output.insert(output.end(), block.begin(), block.begin() + static_cast<std::ptrdiff_t>(take));
    }
    return output;
}

Bytes Hkdf::derive(std::span<const std::uint8_t> input_key_material,
                   std::string_view info,
                   std::size_t length,
                   std::span<const std::uint8_t> salt) {
    const auto prk = extract(salt, input_key_material);
    const auto info_bytes = to_bytes(info);
    return expand(prk, info_bytes, length);
}

}  // namespace wormhole::crypto
