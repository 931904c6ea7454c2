#pragma once

#include "wormhole/Types.hpp"

#include <cstddef>
#include <string>

namespace wormhole::channel {

// Authenticated, encrypted message exchange bootstrapped from a short code.
// Every call may block until the underlying I/O completes.
class WormholeChannel {
public:
    virtual ~WormholeChannel() = default;

    virtual void set_code(const std::string& code) = 0;
    virtual void input_code(const std::string& prompt, int code_length) = 0;

    // Throws AuthenticationError when the two sides used different codes.
    virtual Bytes verify() = 0;

    virtual Bytes derive_key(const std::string& purpose, std::size_t length) = 0;

    virtual void send(ByteView message) = 0;

    // Blocks until the next decrypted message. Throws ChannelClosedError
    // once the peer has closed the channel and AuthenticationError if the
    // message fails to decrypt.
    virtual Bytes get() = 0;

    virtual void close() = 0;
};

}  // namespace wormhole::channel
