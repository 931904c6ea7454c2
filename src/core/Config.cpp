#include "wormhole/Config.hpp"

#include "wormhole/Errors.hpp"
#include "wormhole/protocol/Json.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <set>
#include <vector>

namespace wormhole {

namespace {

using protocol::json::Value;

Value merge_objects(const Value& base, const Value& overlay) {
    Value merged = base.is_object() ? base : Value::make_object();
    for (const auto& [key, value] : overlay.as_object()) {
        const auto* existing = merged.find(key);
        if (existing != nullptr && existing->is_object() && value.is_object()) {
            merged.set(key, merge_objects(*existing, value));
        } else {
            merged.set(key, value);
        }
    }
    return merged;
}

Value resolve_profile(const Value& profiles, const std::string& profile_name, std::set<std::string>& visiting) {
    if (!profiles.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "'profiles' section must be a mapping");
    }
    const auto* profile = profiles.find(profile_name);
    if (profile == nullptr) {
        std::string available;
        for (const auto& [name, _] : profiles.as_object()) {
            if (!available.empty()) {
                available += ", ";
            }
            available += name;
        }
        throw ConfigError("E_CONFIG_PROFILE", "Profile not found: " + profile_name,
                          available.empty() ? std::string{} : "Available profiles: " + available);
    }
    if (!profile->is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Profile must be a mapping: " + profile_name);
    }
    if (visiting.contains(profile_name)) {
        throw ConfigError("E_CONFIG_PROFILE", "Profile inheritance cycle detected at " + profile_name);
    }
    visiting.insert(profile_name);

    Value result = Value::make_object();
    if (const auto* extends = profile->find("extends")) {
        if (!extends->is_string()) {
            throw ConfigError("E_CONFIG_PROFILE", "'extends' must be a string in profile " + profile_name);
        }
        result = resolve_profile(profiles, extends->string_value, visiting);
    }

    Value filtered = Value::make_object();
    for (const auto& [key, value] : profile->as_object()) {
        if (key != "extends") {
            filtered.set(key, value);
        }
    }
    result = merge_objects(result, filtered);
    visiting.erase(profile_name);
    return result;
}

std::optional<std::string> get_string(const Value& root, const std::string& key) {
    const auto* node = root.find(key);
    if (node == nullptr) {
        return std::nullopt;
    }
    if (node->is_string()) {
        return node->string_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected string at config key " + key);
}

std::optional<bool> get_bool(const Value& root, const std::string& key) {
    const auto* node = root.find(key);
    if (node == nullptr) {
        return std::nullopt;
    }
    if (node->is_boolean()) {
        return node->boolean_value;
    }
    if (node->is_string()) {
        std::string lowered = node->string_value;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        if (lowered == "true" || lowered == "yes" || lowered == "on") {
            return true;
        }
        if (lowered == "false" || lowered == "no" || lowered == "off") {
            return false;
        }
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected boolean at config key " + key);
}

std::optional<std::int64_t> get_int64(const Value& root, const std::string& key) {
    const auto* node = root.find(key);
    if (node == nullptr) {
        return std::nullopt;
    }
    if (node->is_integer()) {
        return node->integer_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected integer at config key " + key);
}

}  // namespace

void validate(const ReceiveConfig& config) {
    if (config.zero_mode && config.code.has_value() && !config.code->empty()) {
        throw ConfigError("E_CONFIG_CONFLICT",
                          "A wormhole code cannot be combined with zero mode",
                          "Drop the code or disable zero mode");
    }
    if (config.code_length < 1) {
        throw ConfigError("E_CONFIG_VALUE", "code_length must be at least 1");
    }
    if (config.transit_connect_timeout.count() <= 0 || config.transit_accept_timeout.count() < 0) {
        throw ConfigError("E_CONFIG_VALUE", "Transit timeouts must be positive");
    }
}

ReceiveConfig load_receive_config(std::string_view json_text,
                                  const std::string& profile_name,
                                  ReceiveConfig base) {
    Value document;
    try {
        document = protocol::json::parse(json_text);
    } catch (const protocol::json::JsonError& ex) {
        throw ConfigError("E_CONFIG_PARSE", ex.what());
    }
    if (!document.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Configuration root must be a mapping");
    }

    Value effective = Value::make_object();
    if (const auto* defaults = document.find("defaults")) {
        if (!defaults->is_object()) {
            throw ConfigError("E_CONFIG_STRUCTURE", "'defaults' section must be a mapping");
        }
        effective = *defaults;
    }
    if (!profile_name.empty()) {
        const auto* profiles = document.find("profiles");
        if (profiles == nullptr) {
            throw ConfigError("E_CONFIG_PROFILE", "Profile not found: " + profile_name,
                              "The configuration has no 'profiles' section");
        }
        std::set<std::string> visiting;
        effective = merge_objects(effective, resolve_profile(*profiles, profile_name, visiting));
    }

    auto config = std::move(base);
    if (const auto length = get_int64(effective, "code_length")) {
        config.code_length = static_cast<int>(*length);
    }
    if (const auto verify = get_bool(effective, "verify")) {
        config.verify = *verify;
    }
    if (const auto accept = get_bool(effective, "accept_file")) {
        config.accept_file = *accept;
    }
    if (const auto helper = get_string(effective, "transit_helper")) {
        config.transit_helper = *helper;
    }
    if (const auto no_listen = get_bool(effective, "no_listen")) {
        config.no_listen = *no_listen;
    }
    if (const auto output_dir = get_string(effective, "output_dir")) {
        config.cwd = std::filesystem::path(*output_dir);
    }
    if (const auto connect_ms = get_int64(effective, "connect_timeout_ms")) {
        config.transit_connect_timeout = std::chrono::milliseconds(*connect_ms);
    }
    if (const auto accept_ms = get_int64(effective, "accept_timeout_ms")) {
        config.transit_accept_timeout = std::chrono::milliseconds(*accept_ms);
    }

    validate(config);
    return config;
}

}  // namespace wormhole
