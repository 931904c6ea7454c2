#include "wormhole/protocol/Negotiation.hpp"

#include "wormhole/Errors.hpp"

#include <charconv>
#include <limits>

namespace wormhole::protocol {

namespace {

std::optional<std::uint16_t> to_port(std::int64_t value) {
    if (value <= 0 || value > std::numeric_limits<std::uint16_t>::max()) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}

// Legacy hints are plain strings: "tcp:HOST:PORT".
std::optional<EndpointDescriptor> parse_legacy_hint(std::string_view text) {
    constexpr std::string_view kPrefix = "tcp:";
    if (text.substr(0, kPrefix.size()) != kPrefix) {
        return std::nullopt;
    }
    const auto rest = text.substr(kPrefix.size());
    const auto colon = rest.rfind(':');
    if (colon == std::string_view::npos || colon == 0) {
        return std::nullopt;
    }
    std::int64_t port_value = 0;
    const auto port_text = rest.substr(colon + 1);
    const auto result = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port_value);
    if (result.ec != std::errc{} || result.ptr != port_text.data() + port_text.size()) {
        return std::nullopt;
    }
    const auto port = to_port(port_value);
    if (!port) {
        return std::nullopt;
    }

    EndpointDescriptor endpoint{};
    endpoint.hostname = std::string(rest.substr(0, colon));
    endpoint.port = *port;
    return endpoint;
}

std::uint64_t require_size(const json::Value& object, std::string_view key) {
    const auto* node = object.find(key);
    if (node == nullptr || !node->is_integer() || node->integer_value < 0) {
        throw ResponderError("malformed offer");
    }
    return static_cast<std::uint64_t>(node->integer_value);
}

std::string require_string(const json::Value& object, std::string_view key) {
    const auto* node = object.find(key);
    if (node == nullptr || !node->is_string()) {
        throw ResponderError("malformed offer");
    }
    return node->string_value;
}

}  // namespace

NegotiationMessage decode_message(ByteView bytes) {
    NegotiationMessage message{};
    try {
        message.raw = json::parse(to_string(bytes));
    } catch (const json::JsonError&) {
        throw TransferError("malformed negotiation message");
    }
    if (!message.raw.is_object()) {
        throw TransferError("malformed negotiation message");
    }

    if (const auto* error = message.raw.find("error")) {
        message.kind = MessageKind::Error;
        message.error = error->is_string() ? error->string_value : json::serialize(*error);
        return message;
    }

    if (const auto* transit = message.raw.find("transit")) {
        if (!transit->is_object()) {
            throw TransferError("malformed negotiation message");
        }
        message.kind = MessageKind::Transit;
        if (const auto* direct = transit->find("direct_connection_hints")) {
            message.transit.direct_hints = parse_hint_list(*direct);
        }
        if (const auto* relay = transit->find("relay_connection_hints")) {
            message.transit.relay_hints = parse_hint_list(*relay);
        }
        return message;
    }

    if (const auto* offer = message.raw.find("offer")) {
        message.kind = MessageKind::Offer;
        message.offer = *offer;
        return message;
    }

    message.kind = MessageKind::Unknown;
    return message;
}

TransferOffer decode_offer(const json::Value& offer) {
    if (const auto* text = offer.find("message")) {
        if (!text->is_string()) {
            throw ResponderError("malformed offer");
        }
        return TextOffer{text->string_value};
    }

    if (const auto* file = offer.find("file")) {
        FileOffer result{};
        result.filename = require_string(*file, "filename");
        result.size = require_size(*file, "filesize");
        return result;
    }

    if (const auto* directory = offer.find("directory")) {
        DirectoryOffer result{};
        // The mode is checked by the receiver before anything else, so it is
        // tolerated here even when the remaining fields are absent.
        result.mode = require_string(*directory, "mode");
        if (result.mode != kDirectoryMode) {
            return result;
        }
        result.dirname = require_string(*directory, "dirname");
        result.archive_size = require_size(*directory, "zipsize");
        result.file_count = require_size(*directory, "numfiles");
        result.total_bytes = require_size(*directory, "numbytes");
        return result;
    }

    return UnknownOffer{offer};
}

std::optional<EndpointDescriptor> parse_endpoint(const json::Value& hint) {
    if (hint.is_string()) {
        return parse_legacy_hint(hint.string_value);
    }
    if (!hint.is_object()) {
        return std::nullopt;
    }

    const auto* type = hint.find("type");
    const auto* hostname = hint.find("hostname");
    const auto* port = hint.find("port");
    if (type == nullptr || !type->is_string() || type->string_value != kDirectTcpHint) {
        return std::nullopt;
    }
    if (hostname == nullptr || !hostname->is_string() || hostname->string_value.empty()) {
        return std::nullopt;
    }
    if (port == nullptr || !port->is_integer()) {
        return std::nullopt;
    }
    const auto port_value = to_port(port->integer_value);
    if (!port_value) {
        return std::nullopt;
    }

    EndpointDescriptor endpoint{};
    endpoint.type = type->string_value;
    endpoint.hostname = hostname->string_value;
    endpoint.port = *port_value;
    if (const auto* priority = hint.find("priority")) {
        if (priority->is_double()) {
            endpoint.priority = priority->double_value;
        } else if (priority->is_integer()) {
            endpoint.priority = static_cast<double>(priority->integer_value);
        }
    }
    return endpoint;
}

std::vector<EndpointDescriptor> parse_hint_list(const json::Value& hints) {
    std::vector<EndpointDescriptor> endpoints;
    for (const auto& hint : hints.as_array()) {
        // relay-v1 hints wrap a list of direct-tcp-v1 endpoints.
        if (const auto* type = hint.find("type"); type != nullptr && type->is_string() &&
                                                  type->string_value == kRelayHint) {
            if (const auto* nested = hint.find("hints")) {
                for (const auto& inner : nested->as_array()) {
                    if (auto endpoint = parse_endpoint(inner)) {
                        endpoints.push_back(std::move(*endpoint));
                    }
                }
            }
            continue;
        }
        if (auto endpoint = parse_endpoint(hint)) {
            endpoints.push_back(std::move(*endpoint));
        }
    }
    return endpoints;
}

json::Value endpoint_to_json(const EndpointDescriptor& endpoint) {
    json::Value value = json::Value::make_object();
    value.set("type", json::Value(endpoint.type));
    value.set("hostname", json::Value(endpoint.hostname));
    value.set("port", json::Value(static_cast<std::int64_t>(endpoint.port)));
    value.set("priority", json::Value(endpoint.priority));
    return value;
}

std::string describe(const EndpointDescriptor& endpoint) {
    return "tcp:" + endpoint.hostname + ":" + std::to_string(endpoint.port);
}

Bytes encode(const json::Value& message) {
    return to_bytes(json::serialize(message));
}

Bytes encode_transit(const TransitHintSet& hints) {
    json::Value direct = json::Value::make_array();
    for (const auto& endpoint : hints.direct_hints) {
        direct.push(endpoint_to_json(endpoint));
    }

    json::Value relay = json::Value::make_array();
    if (!hints.relay_hints.empty()) {
        json::Value nested = json::Value::make_array();
        for (const auto& endpoint : hints.relay_hints) {
            nested.push(endpoint_to_json(endpoint));
        }
        json::Value relay_hint = json::Value::make_object();
        relay_hint.set("type", json::Value(std::string(kRelayHint)));
        relay_hint.set("hints", std::move(nested));
        relay.push(std::move(relay_hint));
    }

    json::Value body = json::Value::make_object();
    body.set("direct_connection_hints", std::move(direct));
    body.set("relay_connection_hints", std::move(relay));

    json::Value message = json::Value::make_object();
    message.set("transit", std::move(body));
    return encode(message);
}

Bytes encode_message_ack() {
    json::Value ack = json::Value::make_object();
    ack.set("message_ack", json::Value("ok"));
    json::Value message = json::Value::make_object();
    message.set("answer", std::move(ack));
    return encode(message);
}

Bytes encode_file_ack() {
    json::Value ack = json::Value::make_object();
    ack.set("file_ack", json::Value("ok"));
    json::Value message = json::Value::make_object();
    message.set("answer", std::move(ack));
    return encode(message);
}

Bytes encode_error(std::string_view reason) {
    json::Value message = json::Value::make_object();
    message.set("error", json::Value(std::string(reason)));
    return encode(message);
}

}  // namespace wormhole::protocol
