#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace wormhole {

struct ReceiveConfig {
    std::optional<std::string> code{};
    bool zero_mode{false};
    int code_length{2};
    bool verify{false};
    bool accept_file{false};
    std::optional<std::string> output_file{};
    std::filesystem::path cwd{};
    std::string transit_helper{};
    bool no_listen{false};
    std::chrono::milliseconds transit_connect_timeout{std::chrono::seconds(10)};
    std::chrono::milliseconds transit_accept_timeout{std::chrono::seconds(30)};
};

// Throws ConfigError when options conflict.
void validate(const ReceiveConfig& config);

// Applies the named profile (or "defaults" when empty) from a JSON profile
// document on top of `base`.
ReceiveConfig load_receive_config(std::string_view json_text,
                                  const std::string& profile_name = {},
                                  ReceiveConfig base = {});

}  // namespace wormhole
