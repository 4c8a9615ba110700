/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace sotto {

// Where the daemon listens. The transport is fixed when the daemon starts.
struct Endpoint {
    enum class Kind : uint8_t { Local, Tcp };

    Kind kind = Kind::Local;
    std::filesystem::path path;
    std::string host = "127.0.0.1";
    uint16_t port = 0;

    [[nodiscard]] static Endpoint local(const std::filesystem::path& socketPath);
    [[nodiscard]] static Endpoint tcp(const std::string& host, uint16_t port);

    [[nodiscard]] bool isLocal() const noexcept { return kind == Kind::Local; }
    [[nodiscard]] std::string describe() const;
};

// "tcp://host:port" or "host:port" select TCP, "unix://path" or anything else
// is a socket path. Throws std::invalid_argument on a malformed port.
[[nodiscard]] Endpoint parseEndpoint(const std::string& text);

// <tmp>/sotto_<YYYYmmdd-HHMMSS>.sock
[[nodiscard]] std::filesystem::path defaultSocketPath();

// Newest <tmp>/sotto_*.sock, if any.
[[nodiscard]] std::optional<std::filesystem::path> findLatestSocket();

[[nodiscard]] std::filesystem::path defaultTokenPath(const Endpoint& endpoint);

// Device and precision requested at startup. Resolved once, at first load.
struct ComputeProfile {
    std::string device = "auto";
    std::string computeType = "float16";
    int cpuThreads = 0;  // 0 = engine default
};

struct ServiceConfig {
    ComputeProfile compute;
    std::filesystem::path modelsDir;
    std::filesystem::path vadModel;
};

struct ServerConfig {
    Endpoint endpoint;
    int workers = 2;
    std::size_t maxQueuedJobs = 256;
    int maxConnections = 64;
    int readTimeoutMs = 30000;
    std::size_t maxRequestBytes = 1024 * 1024;
    std::string token;  // empty = shutdown command disabled

    // Apply SOTTO_* environment overrides on top of the current values.
    void applyEnv();
};

int envInt(const char* name, int defv) noexcept;
std::size_t envSize(const char* name, std::size_t defv) noexcept;
std::string envString(const char* name, const std::string& defv = "");

// SOTTO_MODELS_DIR, then models/ next to the executable or its parent,
// then ./models.
[[nodiscard]] std::filesystem::path resolveModelsDir(const char* argv0);

}
