#include "wormhole/transit/Socket.hpp"

#include <cerrno>
#include <memory>
#include <stdexcept>
#include <string>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <fcntl.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace wormhole::transit::net {

namespace {

#ifdef _WIN32
using NativeSocket = SOCKET;
using IoLength = int;
constexpr NativeSocket kNoSocket = INVALID_SOCKET;

void ensure_network_runtime() {
    struct Runtime {
        Runtime() {
            WSADATA data{};
            if (WSAStartup(MAKEWORD(2, 2), &data) != 0) {
                throw std::runtime_error("WSAStartup failed");
            }
        }
        ~Runtime() { WSACleanup(); }
    };
    static Runtime runtime;
}

int network_error() {
    return WSAGetLastError();
}

bool interrupted(int) {
    return false;
}

bool connect_pending(int error) {
    return error == WSAEWOULDBLOCK;
}

constexpr int kSendFlags = 0;
#else
using NativeSocket = int;
using IoLength = std::size_t;
constexpr NativeSocket kNoSocket = -1;

void ensure_network_runtime() {}

int network_error() {
    return errno;
}

bool interrupted(int error) {
    return error == EINTR;
}

bool connect_pending(int error) {
    return error == EINPROGRESS;
}

#ifdef MSG_NOSIGNAL
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif
#endif

NativeSocket native(SocketHandle handle) {
    return static_cast<NativeSocket>(handle);
}

SocketHandle handle_of(NativeSocket socket) {
    return static_cast<SocketHandle>(socket);
}

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const noexcept { ::freeaddrinfo(info); }
};
using AddrInfoList = std::unique_ptr<addrinfo, AddrInfoDeleter>;

bool set_blocking(NativeSocket socket, bool blocking) {
#ifdef _WIN32
    u_long mode = blocking ? 0 : 1;
    return ioctlsocket(socket, FIONBIO, &mode) == 0;
#else
    const int flags = fcntl(socket, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    const int updated = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return fcntl(socket, F_SETFL, updated) == 0;
#endif
}

timeval as_timeval(std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<decltype(tv.tv_sec)>(timeout.count() / 1000);
    tv.tv_usec = static_cast<decltype(tv.tv_usec)>((timeout.count() % 1000) * 1000);
    return tv;
}

// Waits for `socket` to become readable (or writable) within `timeout`.
bool wait_ready(NativeSocket socket, bool for_write, std::chrono::milliseconds timeout) {
    fd_set set;
    FD_ZERO(&set);
    FD_SET(socket, &set);
    auto tv = as_timeval(timeout);
    const int ready = ::select(static_cast<int>(socket + 1),
                               for_write ? nullptr : &set,
                               for_write ? &set : nullptr,
                               nullptr,
                               &tv);
    return ready > 0;
}

bool connect_with_timeout(NativeSocket socket, const sockaddr* address, socklen_t length,
                          std::chrono::milliseconds timeout) {
    if (!set_blocking(socket, false)) {
        return false;
    }
    if (::connect(socket, address, length) != 0) {
        if (!connect_pending(network_error()) || !wait_ready(socket, true, timeout)) {
            return false;
        }
        int error = 0;
        socklen_t error_length = sizeof(error);
        if (::getsockopt(socket, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&error), &error_length) != 0 ||
            error != 0) {
            return false;
        }
    }
    return set_blocking(socket, true);
}

std::string format_ipv4(const in_addr& address) {
    char buffer[INET_ADDRSTRLEN]{};
    if (::inet_ntop(AF_INET, &address, buffer, sizeof(buffer)) == nullptr) {
        return {};
    }
    return buffer;
}

[[noreturn]] void fail_listener(NativeSocket socket, const std::string& step) {
    const auto error = network_error();
    close_socket(handle_of(socket));
    throw std::runtime_error("Failed to " + step + " transit listener: error " + std::to_string(error));
}

}  // namespace

SocketHandle connect_tcp(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout) {
    ensure_network_runtime();

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    const auto service = std::to_string(port);
    addrinfo* raw = nullptr;
    if (::getaddrinfo(host.c_str(), service.c_str(), &hints, &raw) != 0) {
        return kInvalidSocket;
    }
    const AddrInfoList results(raw);

    // A hostname may resolve to several addresses; the first one that answers wins.
    for (auto* candidate = results.get(); candidate != nullptr; candidate = candidate->ai_next) {
        const NativeSocket socket = ::socket(candidate->ai_family, candidate->ai_socktype, candidate->ai_protocol);
        if (socket == kNoSocket) {
            continue;
        }
        if (connect_with_timeout(socket, candidate->ai_addr, static_cast<socklen_t>(candidate->ai_addrlen), timeout)) {
            return handle_of(socket);
        }
        close_socket(handle_of(socket));
    }
    return kInvalidSocket;
}

SocketHandle listen_tcp(std::uint16_t port, std::uint16_t& bound_port) {
    ensure_network_runtime();

    const NativeSocket socket = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket == kNoSocket) {
        throw std::runtime_error("Failed to create transit listener: error " + std::to_string(network_error()));
    }

    const int reuse = 1;
    if (::setsockopt(socket, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&reuse), sizeof(reuse)) != 0) {
        fail_listener(socket, "configure");
    }

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = htonl(INADDR_ANY);
    address.sin_port = htons(port);
    if (::bind(socket, reinterpret_cast<const sockaddr*>(&address), sizeof(address)) != 0) {
        fail_listener(socket, "bind");
    }
    if (::listen(socket, SOMAXCONN) != 0) {
        fail_listener(socket, "start");
    }

    sockaddr_in bound{};
    socklen_t length = sizeof(bound);
    if (::getsockname(socket, reinterpret_cast<sockaddr*>(&bound), &length) != 0) {
        fail_listener(socket, "inspect");
    }
    bound_port = ntohs(bound.sin_port);
    return handle_of(socket);
}

SocketHandle accept_with_timeout(SocketHandle listener, std::chrono::milliseconds timeout) {
    if (listener == kInvalidSocket || !wait_ready(native(listener), false, timeout)) {
        return kInvalidSocket;
    }
    const NativeSocket accepted = ::accept(native(listener), nullptr, nullptr);
    return accepted == kNoSocket ? kInvalidSocket : handle_of(accepted);
}

bool send_all(SocketHandle handle, const std::uint8_t* data, std::size_t length) {
    std::size_t offset = 0;
    while (offset < length) {
        const auto sent = ::send(native(handle), reinterpret_cast<const char*>(data + offset),
                                 static_cast<IoLength>(length - offset), kSendFlags);
        if (sent < 0 && interrupted(network_error())) {
            continue;
        }
        if (sent <= 0) {
            return false;
        }
        offset += static_cast<std::size_t>(sent);
    }
    return true;
}

bool recv_all(SocketHandle handle, std::uint8_t* buffer, std::size_t length, std::size_t& received) {
    received = 0;
    while (received < length) {
        const auto count = ::recv(native(handle), reinterpret_cast<char*>(buffer + received),
                                  static_cast<IoLength>(length - received), 0);
        if (count < 0 && interrupted(network_error())) {
            continue;
        }
        if (count <= 0) {
            return false;
        }
        received += static_cast<std::size_t>(count);
    }
    return true;
}

bool set_recv_timeout(SocketHandle handle, std::chrono::milliseconds timeout) {
#ifdef _WIN32
    const DWORD value = static_cast<DWORD>(timeout.count());
#else
    const timeval value = as_timeval(timeout);
#endif
    return ::setsockopt(native(handle), SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&value),
                        sizeof(value)) == 0;
}

void close_socket(SocketHandle handle) {
    if (handle == kInvalidSocket) {
        return;
    }
#ifdef _WIN32
    ::shutdown(native(handle), SD_BOTH);
    ::closesocket(native(handle));
#else
    ::shutdown(native(handle), SHUT_RDWR);
    ::close(native(handle));
#endif
}

std::string endpoint_string(SocketHandle handle) {
    sockaddr_in peer{};
    socklen_t length = sizeof(peer);
    if (::getpeername(native(handle), reinterpret_cast<sockaddr*>(&peer), &length) != 0) {
        return "unknown";
    }
    const auto host = format_ipv4(peer.sin_addr);
    if (host.empty()) {
        return "unknown";
    }
    return host + ":" + std::to_string(ntohs(peer.sin_port));
}

std::vector<std::string> local_ipv4_addresses() {
    std::vector<std::string> addresses;
    std::vector<std::string> loopback;
#ifndef _WIN32
    ifaddrs* raw = nullptr;
    if (::getifaddrs(&raw) == 0) {
        const std::unique_ptr<ifaddrs, void (*)(ifaddrs*)> interfaces(raw, ::freeifaddrs);
        for (auto* entry = interfaces.get(); entry != nullptr; entry = entry->ifa_next) {
            if (entry->ifa_addr == nullptr || entry->ifa_addr->sa_family != AF_INET ||
                (entry->ifa_flags & IFF_UP) == 0) {
                continue;
            }
            const auto text = format_ipv4(reinterpret_cast<const sockaddr_in*>(entry->ifa_addr)->sin_addr);
            if (text.empty()) {
                continue;
            }
            ((entry->ifa_flags & IFF_LOOPBACK) != 0 ? loopback : addresses).push_back(text);
        }
    }
#endif
    // Loopback goes last so that peers on other machines try routable addresses first.
    if (loopback.empty()) {
        loopback.emplace_back("127.0.0.1");
    }
    addresses.insert(addresses.end(), loopback.begin(), loopback.end());
    return addresses;
}

}  // namespace wormhole::transit::net
