#pragma once

#include "wormhole/Types.hpp"
#include "wormhole/crypto/ChaCha20.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace wormhole::transit {

enum class Role {
    Sender,
    Receiver
};

// Seals and opens transit records:
//   nonce(12) || ChaCha20 ciphertext || HMAC-SHA256(nonce || ciphertext)
// Each direction has its own keys and a nonce counter starting at zero; a
// record whose nonce is not the next expected value is rejected.
class RecordCodec {
public:
    static constexpr std::size_t kNonceSize = 12;
    static constexpr std::size_t kTagSize = 32;
    static constexpr std::size_t kOverhead = kNonceSize + kTagSize;

    RecordCodec(ByteView transit_key, Role local_role);

    Bytes seal(ByteView plaintext);

    // Throws TransferError on a bad tag or an out-of-sequence nonce.
    Bytes open(ByteView record);

    // Prepends the u32 big-endian length of the sealed record.
    Bytes frame(ByteView plaintext);

private:
    struct DirectionKeys {
        crypto::Key cipher{};
        Bytes mac;
    };

    static DirectionKeys derive_keys(ByteView transit_key, Role role);
    static crypto::Nonce make_nonce(std::uint64_t counter);

    DirectionKeys outbound_;
    DirectionKeys inbound_;
    std::uint64_t next_outbound_{0};
    std::uint64_t next_inbound_{0};
};

std::string build_sender_handshake(ByteView transit_key);
std::string build_receiver_handshake(ByteView transit_key);
std::string build_relay_handshake(ByteView transit_key, const std::string& side);

}  // namespace wormhole::transit
