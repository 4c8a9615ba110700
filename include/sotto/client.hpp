/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "sotto/config.hpp"

namespace sotto {

// One connection per call: connect, send one request, read one response.
// Every failure, local or remote, comes back as {"error": message}.
class Client {
public:
    explicit Client(Endpoint endpoint,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    [[nodiscard]] nlohmann::json status() const;
    [[nodiscard]] nlohmann::json loadModel(const std::string& modelId) const;
    [[nodiscard]] nlohmann::json transcribe(const std::string& audioPath,
                                            const nlohmann::json& options = nlohmann::json::object()) const;
    [[nodiscard]] nlohmann::json jobStatus(const std::string& jobId) const;
    [[nodiscard]] nlohmann::json cleanupJob(const std::string& jobId) const;
    [[nodiscard]] nlohmann::json shutdown(const std::string& token) const;

    // Polls job_status until completed/failed, an error, or the deadline
    // (zero = wait forever). Returns the last response seen.
    using ProgressCallback = std::function<void(const nlohmann::json&)>;
    [[nodiscard]] nlohmann::json waitForJob(const std::string& jobId,
                                            std::chrono::milliseconds pollInterval = std::chrono::milliseconds(500),
                                            const ProgressCallback& onUpdate = nullptr,
                                            std::chrono::milliseconds deadline = std::chrono::milliseconds(0)) const;

    // waitForJob, then cleanup_job once the job is completed or failed, so
    // the daemon drops the result. Returns the terminal response.
    [[nodiscard]] nlohmann::json collectJob(const std::string& jobId,
                                            std::chrono::milliseconds pollInterval = std::chrono::milliseconds(500),
                                            const ProgressCallback& onUpdate = nullptr,
                                            std::chrono::milliseconds deadline = std::chrono::milliseconds(0)) const;

    [[nodiscard]] nlohmann::json request(const nlohmann::json& message) const;
    [[nodiscard]] const Endpoint& endpoint() const noexcept { return endpoint_; }

private:
    Endpoint endpoint_;
    std::chrono::milliseconds timeout_;
};

}
