#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace wormhole::crypto {

struct Key {
    std::array<std::uint8_t, 32> bytes{};
};

struct Nonce {
    std::array<std::uint8_t, 12> bytes{};
};

class ChaCha20 {
public:
    static constexpr std::size_t kBlockSize = 64;

    // XORs the keystream starting at block `counter` over input.
    static void apply(const Key& key,
                      const Nonce& nonce,
                      std::span<const std::uint8_t> input,
                      std::vector<std::uint8_t>& output,
                      std::uint32_t counter = 0);

    static std::array<std::uint8_t, kBlockSize> block(const Key& key,
                                                      const Nonce& nonce,
                                                      std::uint32_t counter) noexcept;
};

}  // namespace wormhole::crypto
