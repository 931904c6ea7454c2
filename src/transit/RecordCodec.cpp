#include "wormhole/transit/RecordCodec.hpp"

#include "wormhole/Errors.hpp"
#include "wormhole/crypto/Hmac.hpp"

#include <algorithm>

namespace wormhole::transit {

namespace {

constexpr std::size_t kKeySize = 32;

void write_u32(Bytes& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

}  // namespace

RecordCodec::RecordCodec(ByteView transit_key, Role local_role)
    : outbound_(derive_keys(transit_key, local_role)),
      inbound_(derive_keys(transit_key, local_role == Role::Sender ? Role::Receiver : Role::Sender)) {}

RecordCodec::DirectionKeys RecordCodec::derive_keys(ByteView transit_key, Role role) {
    const std::string prefix = role == Role::Sender ? "transit_record_sender_" : "transit_record_receiver_";
    DirectionKeys keys{};
    const auto cipher = crypto::Hkdf::derive(transit_key, prefix + "key", kKeySize);
    std::copy(cipher.begin(), cipher.end(), keys.cipher.bytes.begin());
    keys.mac = crypto::Hkdf::derive(transit_key, prefix + "mac", kKeySize);
    return keys;
}

crypto::Nonce RecordCodec::make_nonce(std::uint64_t counter) {
    crypto::Nonce nonce{};
    for (std::size_t i = 0; i < 8; ++i) {
        nonce.bytes[nonce.bytes.size() - 1 - i] = static_cast<std::uint8_t>((counter >> (8 * i)) & 0xFFu);
    }
    return nonce;
}

Bytes RecordCodec::seal(ByteView plaintext) {
    const auto nonce = make_nonce(next_outbound_++);

    Bytes ciphertext;
    crypto::ChaCha20::apply(outbound_.cipher, nonce, plaintext, ciphertext, 1u);

    Bytes record;
    record.reserve(kOverhead + ciphertext.size());
    record.insert(record.end(), nonce.bytes.begin(), nonce.bytes.end());
    record.insert(record.end(), ciphertext.begin(), ciphertext.end());
    const auto tag = crypto::HmacSha256::compute(outbound_.mac, record);
    record.insert(record.end(), tag.begin(), tag.end());
    return record;
}

Bytes RecordCodec::open(ByteView record) {
    if (record.size() < kOverhead) {
        throw TransferError("transit record too short");
    }

    const auto authenticated = record.first(record.size() - kTagSize);
    const auto tag = record.last(kTagSize);
    if (!crypto::HmacSha256::verify(inbound_.mac, authenticated, tag)) {
        throw TransferError("transit record failed authentication");
    }

    crypto::Nonce nonce{};
    std::copy(record.begin(), record.begin() + kNonceSize, nonce.bytes.begin());
    const auto expected = make_nonce(next_inbound_);
    if (nonce.bytes != expected.bytes) {
        throw TransferError("transit record out of sequence");
    }
    ++next_inbound_;

    Bytes plaintext;
    crypto::ChaCha20::apply(inbound_.cipher, nonce, authenticated.subspan(kNonceSize), plaintext, 1u);
    return plaintext;
}

Bytes RecordCodec::frame(ByteView plaintext) {
    const auto sealed = seal(plaintext);
    Bytes framed;
    framed.reserve(4 + sealed.size());
    write_u32(framed, static_cast<std::uint32_t>(sealed.size()));
    framed.insert(framed.end(), sealed.begin(), sealed.end());
    return framed;
}

std::string build_sender_handshake(ByteView transit_key) {
    const auto id = crypto::Hkdf::derive(transit_key, "transit_sender", kKeySize);
    return "transit sender " + to_hex(id) + " ready\n\n";
}

std::string build_receiver_handshake(ByteView transit_key) {
    const auto id = crypto::Hkdf::derive(transit_key, "transit_receiver", kKeySize);
    return "transit receiver " + to_hex(id) + " ready\n\n";
}

std::string build_relay_handshake(ByteView transit_key, const std::string& side) {
    const auto token = crypto::Hkdf::derive(transit_key, "transit_relay_token", kKeySize);
    return "please relay " + to_hex(token) + " for side " + side + "\n";
}

}  // namespace wormhole::transit
