/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "sotto/config.hpp"

namespace sotto {

class LineFramer;

// Owning file descriptor for a stream socket.
class Socket {
public:
    Socket() noexcept = default;
    explicit Socket(int fd) noexcept : fd_(fd) {}
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    [[nodiscard]] int fd() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    int release() noexcept;
    void reset(int fd = -1) noexcept;

    // Unblock any thread sitting in read/accept on this socket.
    void shutdown() noexcept;

private:
    int fd_ = -1;
};

// Removes a stale socket file first for local endpoints. Throws TransportError.
[[nodiscard]] Socket listenOn(const Endpoint& endpoint, int backlog = 16);

// Throws TransportError.
[[nodiscard]] Socket connectTo(const Endpoint& endpoint);

// Port actually bound (useful with port 0). 0 for local sockets.
[[nodiscard]] uint16_t boundPort(const Socket& socket) noexcept;

// 0 disables the timeout.
void setIoTimeout(const Socket& socket, int timeoutMs) noexcept;

// Throws TransportError on failure. Never raises SIGPIPE.
void writeAll(const Socket& socket, const std::string& data);

// Blocks until one complete frame is available. Empty on clean EOF with
// nothing buffered. Throws TransportError on read errors and timeouts,
// ProtocolError if the frame exceeds the framer's limit.
[[nodiscard]] std::optional<std::string> readFrame(const Socket& socket, LineFramer& framer);

}
