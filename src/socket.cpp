/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sotto/socket.hpp"
#include "sotto/errors.hpp"
#include "sotto/logger.hpp"
#include "sotto/protocol.hpp"
#include <cerrno>
#include <cstring>
#include <memory>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace sotto {

namespace {

std::string systemError(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

sockaddr_un localAddress(const std::filesystem::path& path) {
    const std::string text = path.string();
    sockaddr_un address{};
    if (text.empty() || text.size() >= sizeof(address.sun_path)) {
        throw TransportError("Invalid socket path (empty or too long): " + text);
    }
    address.sun_family = AF_UNIX;
    std::memcpy(address.sun_path, text.c_str(), text.size() + 1);
    return address;
}

// Only a leftover socket is removed; anything else at the path is an error.
void removeStaleSocket(const std::filesystem::path& path) {
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0) {
        return;
    }
    if (!S_ISSOCK(st.st_mode)) {
        throw TransportError("Refusing to replace non-socket file: " + path.string());
    }
    if (::unlink(path.c_str()) != 0) {
        throw TransportError(systemError("Failed to remove stale socket " + path.string()));
    }
    LOG_DEBUG("Removed stale socket: " + path.string());
}

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const noexcept { ::freeaddrinfo(info); }
};
using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

AddrInfoPtr resolveTcp(const Endpoint& endpoint, bool passive) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    if (passive) {
        hints.ai_flags = AI_PASSIVE;
    }
    addrinfo* result = nullptr;
    const std::string port = std::to_string(endpoint.port);
    int rc = ::getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0) {
        throw TransportError("Cannot resolve " + endpoint.describe() + ": " + ::gai_strerror(rc));
    }
    return AddrInfoPtr(result);
}

Socket listenLocal(const Endpoint& endpoint, int backlog) {
    auto address = localAddress(endpoint.path);
    removeStaleSocket(endpoint.path);

    Socket socket(::socket(AF_UNIX, SOCK_STREAM, 0));
    if (!socket) {
        throw TransportError(systemError("Failed to create local socket"));
    }
    if (::bind(socket.fd(), reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0) {
        throw TransportError(systemError("Failed to bind " + endpoint.path.string()));
    }
    if (::chmod(endpoint.path.c_str(), 0600) != 0) {
        LOG_WARN(systemError("Failed to restrict permissions on " + endpoint.path.string()));
    }
    if (::listen(socket.fd(), backlog) != 0) {
        throw TransportError(systemError("Failed to listen on " + endpoint.path.string()));
    }
    return socket;
}

Socket listenTcp(const Endpoint& endpoint, int backlog) {
    auto addresses = resolveTcp(endpoint, true);
    std::string lastError = "no usable address";

    for (addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
        Socket socket(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!socket) {
            lastError = std::strerror(errno);
            continue;
        }
        int yes = 1;
        ::setsockopt(socket.fd(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
        if (::bind(socket.fd(), ai->ai_addr, ai->ai_addrlen) != 0 ||
            ::listen(socket.fd(), backlog) != 0) {
            lastError = std::strerror(errno);
            continue;
        }
        return socket;
    }
    throw TransportError("Failed to listen on " + endpoint.describe() + ": " + lastError);
}

}

Socket::~Socket() {
    reset();
}

Socket::Socket(Socket&& other) noexcept : fd_(other.release()) {}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        reset(other.release());
    }
    return *this;
}

int Socket::release() noexcept {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

void Socket::reset(int fd) noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

void Socket::shutdown() noexcept {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

Socket listenOn(const Endpoint& endpoint, int backlog) {
    return endpoint.isLocal() ? listenLocal(endpoint, backlog) : listenTcp(endpoint, backlog);
}

Socket connectTo(const Endpoint& endpoint) {
    if (endpoint.isLocal()) {
        auto address = localAddress(endpoint.path);
        Socket socket(::socket(AF_UNIX, SOCK_STREAM, 0));
        if (!socket) {
            throw TransportError(systemError("Failed to create local socket"));
        }
        if (::connect(socket.fd(), reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0) {
            throw TransportError(systemError("Cannot connect to " + endpoint.path.string()));
        }
        return socket;
    }

    auto addresses = resolveTcp(endpoint, false);
    std::string lastError = "no usable address";
    for (addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
        Socket socket(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!socket) {
            lastError = std::strerror(errno);
            continue;
        }
        if (::connect(socket.fd(), ai->ai_addr, ai->ai_addrlen) != 0) {
            lastError = std::strerror(errno);
            continue;
        }
        int yes = 1;
        ::setsockopt(socket.fd(), IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
        return socket;
    }
    throw TransportError("Cannot connect to " + endpoint.describe() + ": " + lastError);
}

uint16_t boundPort(const Socket& socket) noexcept {
    sockaddr_storage address{};
    socklen_t length = sizeof(address);
    if (::getsockname(socket.fd(), reinterpret_cast<sockaddr*>(&address), &length) != 0) {
        return 0;
    }
    if (address.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<sockaddr_in*>(&address)->sin_port);
    }
    if (address.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&address)->sin6_port);
    }
    return 0;
}

void setIoTimeout(const Socket& socket, int timeoutMs) noexcept {
    timeval tv{};
    if (timeoutMs > 0) {
        tv.tv_sec = timeoutMs / 1000;
        tv.tv_usec = (timeoutMs % 1000) * 1000;
    }
    if (::setsockopt(socket.fd(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
        ::setsockopt(socket.fd(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        LOG_WARN(systemError("Failed to set socket timeout"));
    }
}

void writeAll(const Socket& socket, const std::string& data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        ssize_t written = ::send(socket.fd(), data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (written > 0) {
            sent += static_cast<std::size_t>(written);
            continue;
        }
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            throw TransportError("Write timed out");
        }
        throw TransportError(systemError("Write failed"));
    }
}

std::optional<std::string> readFrame(const Socket& socket, LineFramer& framer) {
    char chunk[4096];
    while (true) {
        if (auto frame = framer.next()) {
            return frame;
        }
        if (framer.overflowed()) {
            throw ProtocolError("Request too large");
        }

        ssize_t received = ::recv(socket.fd(), chunk, sizeof(chunk), 0);
        if (received > 0) {
            framer.append(chunk, static_cast<std::size_t>(received));
            continue;
        }
        if (received == 0) {
            auto rest = framer.flush();
            if (framer.overflowed()) {
                throw ProtocolError("Request too large");
            }
            return rest;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            throw TransportError("Read timed out");
        }
        throw TransportError(systemError("Read failed"));
    }
}

}
