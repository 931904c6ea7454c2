#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace wormhole::transit::net {

using SocketHandle = std::intptr_t;
inline constexpr SocketHandle kInvalidSocket = static_cast<SocketHandle>(-1);

// Returns kInvalidSocket when the host does not resolve or the connection
// is refused or times out.
SocketHandle connect_tcp(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout);

// Throws std::runtime_error when the listener cannot be created.
SocketHandle listen_tcp(std::uint16_t port, std::uint16_t& bound_port);

// Returns kInvalidSocket when nothing connected within the timeout.
SocketHandle accept_with_timeout(SocketHandle listener, std::chrono::milliseconds timeout);

bool send_all(SocketHandle socket, const std::uint8_t* data, std::size_t length);

// False on error or when the peer closed before `length` bytes arrived;
// `received` reports how many bytes were read.
bool recv_all(SocketHandle socket, std::uint8_t* buffer, std::size_t length, std::size_t& received);

bool set_recv_timeout(SocketHandle socket, std::chrono::milliseconds timeout);

void close_socket(SocketHandle socket);

std::string endpoint_string(SocketHandle socket);

std::vector<std::string> local_ipv4_addresses();

}  // namespace wormhole::transit::net
