/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sotto/config.hpp"
#include "sotto/logger.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <stdexcept>
#include <system_error>

namespace sotto {

namespace {

constexpr const char* kSocketPrefix = "sotto_";
constexpr const char* kSocketSuffix = ".sock";

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

uint16_t parsePort(const std::string& text) {
    std::size_t used = 0;
    unsigned long port = 0;
    try {
        port = std::stoul(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid port: " + text);
    }
    if (used != text.size() || port > 65535) {
        throw std::invalid_argument("Invalid port: " + text);
    }
    return static_cast<uint16_t>(port);
}

// "host:port" with the port being all digits.
bool looksLikeHostPort(const std::string& text) {
    auto colon = text.rfind(':');
    if (colon == std::string::npos || colon + 1 >= text.size()) {
        return false;
    }
    if (text.find('/') != std::string::npos) {
        return false;
    }
    for (std::size_t i = colon + 1; i < text.size(); ++i) {
        if (text[i] < '0' || text[i] > '9') return false;
    }
    return true;
}

std::filesystem::path tempDir() {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    return ec ? std::filesystem::path("/tmp") : dir;
}

}

Endpoint Endpoint::local(const std::filesystem::path& socketPath) {
    Endpoint endpoint;
    endpoint.kind = Kind::Local;
    endpoint.path = socketPath;
    return endpoint;
}

Endpoint Endpoint::tcp(const std::string& host, uint16_t port) {
    Endpoint endpoint;
    endpoint.kind = Kind::Tcp;
    endpoint.host = host;
    endpoint.port = port;
    return endpoint;
}

std::string Endpoint::describe() const {
    if (isLocal()) {
        return "unix://" + path.string();
    }
    return "tcp://" + host + ":" + std::to_string(port);
}

Endpoint parseEndpoint(const std::string& text) {
    if (startsWith(text, "unix://")) {
        return Endpoint::local(text.substr(7));
    }

    std::string rest = text;
    bool explicitTcp = false;
    if (startsWith(rest, "tcp://")) {
        rest = rest.substr(6);
        explicitTcp = true;
    }

    if (explicitTcp || looksLikeHostPort(rest)) {
        auto colon = rest.rfind(':');
        if (colon == std::string::npos) {
            throw std::invalid_argument("TCP endpoint needs host:port: " + text);
        }
        std::string host = rest.substr(0, colon);
        if (host.empty() || host == "localhost") {
            host = "127.0.0.1";
        }
        return Endpoint::tcp(host, parsePort(rest.substr(colon + 1)));
    }

    return Endpoint::local(text);
}

std::filesystem::path defaultSocketPath() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &local);
    return tempDir() / (std::string(kSocketPrefix) + stamp + kSocketSuffix);
}

std::optional<std::filesystem::path> findLatestSocket() {
    std::optional<std::filesystem::path> latest;
    std::optional<std::filesystem::file_time_type> latestTime;

    std::error_code ec;
    std::filesystem::directory_iterator it(tempDir(), ec);
    if (ec) {
        LOG_DEBUG("Cannot scan for sockets: " + ec.message());
        return std::nullopt;
    }

    for (const auto& entry : it) {
        auto name = entry.path().filename().string();
        if (!startsWith(name, kSocketPrefix) || !endsWith(name, kSocketSuffix)) {
            continue;
        }
        std::error_code statEc;
        if (!entry.is_socket(statEc) || statEc) {
            continue;
        }
        auto ts = entry.last_write_time(statEc);
        if (statEc) {
            continue;
        }
        if (!latestTime || ts > *latestTime) {
            latestTime = ts;
            latest = entry.path();
        }
    }
    return latest;
}

std::filesystem::path defaultTokenPath(const Endpoint& endpoint) {
    if (endpoint.isLocal()) {
        auto token = endpoint.path;
        token += ".token";
        return token;
    }
    return tempDir() / (std::string(kSocketPrefix) + std::to_string(endpoint.port) + ".token");
}

void ServerConfig::applyEnv() {
    workers = envInt("SOTTO_WORKERS", workers);
    maxConnections = envInt("SOTTO_MAX_CONNECTIONS", maxConnections);
    readTimeoutMs = envInt("SOTTO_READ_TIMEOUT_MS", readTimeoutMs);
    maxRequestBytes = envSize("SOTTO_MAX_REQUEST_BYTES", maxRequestBytes);
    maxQueuedJobs = envSize("SOTTO_MAX_QUEUED_JOBS", maxQueuedJobs);
}

int envInt(const char* name, int defv) noexcept {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

std::size_t envSize(const char* name, std::size_t defv) noexcept {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t parsed = static_cast<std::size_t>(std::stoull(val));
        return parsed == 0 ? defv : parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

std::string envString(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : defv;
}

std::filesystem::path resolveModelsDir(const char* argv0) {
    if (const char* env = std::getenv("SOTTO_MODELS_DIR")) {
        return std::filesystem::path(env);
    }

    std::filesystem::path exePath(argv0 ? argv0 : "");
    if (!exePath.empty()) {
        std::error_code ec;
        exePath = std::filesystem::absolute(exePath, ec);
        if (!ec && std::filesystem::exists(exePath, ec)) {
            auto base = exePath.parent_path();
            if (std::filesystem::exists(base / "models", ec)) {
                return base / "models";
            }
            if (std::filesystem::exists(base.parent_path() / "models", ec)) {
                return base.parent_path() / "models";
            }
        }
    }

    return std::filesystem::current_path() / "models";
}

}
