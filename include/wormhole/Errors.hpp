#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace wormhole {

// The two sides did not use matching codes, or the verifier exchange failed.
class AuthenticationError : public std::runtime_error {
public:
    explicit AuthenticationError(const std::string& message)
        : std::runtime_error(message) {}
};

// A negotiation or transfer failure that ends the session.
class TransferError : public std::runtime_error {
public:
    explicit TransferError(const std::string& reason)
        : std::runtime_error(reason) {}
};

// The peer closed the wormhole channel while we were waiting for a message.
class ChannelClosedError : public std::runtime_error {
public:
    ChannelClosedError()
        : std::runtime_error("wormhole channel closed") {}
};

// A local rejection the peer must hear about before the session fails.
// Thrown by the receive helpers and converted by ReceiveSession; it never
// escapes ReceiveSession::go().
class ResponderError : public std::runtime_error {
public:
    explicit ResponderError(const std::string& response)
        : std::runtime_error(response), response_(response) {}

    const std::string& response() const noexcept { return response_; }

private:
    std::string response_;
};

class ConfigError : public std::exception {
public:
    ConfigError(std::string code, std::string message, std::string hint = {})
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
        if (!code_.empty()) {
            formatted_ = "[" + code_ + "] " + message_;
        } else {
            formatted_ = message_;
        }
    }

    const char* what() const noexcept override { return formatted_.c_str(); }

    const std::string& code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& hint() const noexcept { return hint_; }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

}  // namespace wormhole
