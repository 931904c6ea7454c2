#pragma once

#include "wormhole/Types.hpp"
#include "wormhole/protocol/Json.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wormhole::protocol {

inline constexpr std::string_view kDirectTcpHint = "direct-tcp-v1";
inline constexpr std::string_view kRelayHint = "relay-v1";

// The only directory-transfer mode this receiver understands.
inline constexpr std::string_view kDirectoryMode = "zipfile/deflated";

struct EndpointDescriptor {
    std::string type{kDirectTcpHint};
    std::string hostname;
    std::uint16_t port{0};
    double priority{0.0};
};

struct TransitHintSet {
    std::vector<EndpointDescriptor> direct_hints;
    std::vector<EndpointDescriptor> relay_hints;
};

struct TextOffer {
    std::string body;
};

struct FileOffer {
    std::string filename;
    std::uint64_t size{0};
};

struct DirectoryOffer {
    std::string dirname;
    std::uint64_t archive_size{0};
    std::uint64_t file_count{0};
    std::uint64_t total_bytes{0};
    std::string mode;
};

struct UnknownOffer {
    json::Value raw;
};

using TransferOffer = std::variant<TextOffer, FileOffer, DirectoryOffer, UnknownOffer>;

enum class MessageKind {
    Error,
    Transit,
    Offer,
    Unknown
};

struct NegotiationMessage {
    MessageKind kind{MessageKind::Unknown};
    std::string error;
    TransitHintSet transit;
    json::Value offer;
    json::Value raw;
};

// Throws TransferError for anything that is not a JSON object.
NegotiationMessage decode_message(ByteView bytes);

// Throws ResponderError("malformed offer") when a known offer shape is
// missing fields or carries the wrong types.
TransferOffer decode_offer(const json::Value& offer);

std::optional<EndpointDescriptor> parse_endpoint(const json::Value& hint);
std::vector<EndpointDescriptor> parse_hint_list(const json::Value& hints);
json::Value endpoint_to_json(const EndpointDescriptor& endpoint);
std::string describe(const EndpointDescriptor& endpoint);

Bytes encode(const json::Value& message);
Bytes encode_transit(const TransitHintSet& hints);
Bytes encode_message_ack();
Bytes encode_file_ack();
Bytes encode_error(std::string_view reason);

}  // namespace wormhole::protocol
