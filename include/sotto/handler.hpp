/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "sotto/protocol.hpp"

namespace sotto {

class JobRegistry;
class ModelService;
class Work;

// Maps decoded requests onto the model service and the job registry.
class Handler final {
public:
    using ShutdownCallback = std::function<void()>;

    Handler(ModelService& service, JobRegistry& registry, Work& work,
            std::string shutdownToken = "", ShutdownCallback onShutdown = nullptr);

    Handler(const Handler&) = delete;
    Handler& operator=(const Handler&) = delete;

    // Decode, dispatch and encode. Every failure becomes {"error": ...}.
    [[nodiscard]] nlohmann::json handle(const std::string& frame) noexcept;

    // Throws ProtocolError, NotFoundError, ModelLoadError.
    [[nodiscard]] nlohmann::json dispatch(const Request& request);

private:
    nlohmann::json handleStatus();
    nlohmann::json handleLoadModel(const nlohmann::json& body);
    nlohmann::json handleTranscribe(const nlohmann::json& body);
    nlohmann::json handleJobStatus(const nlohmann::json& body);
    nlohmann::json handleCleanupJob(const nlohmann::json& body);
    nlohmann::json handleShutdown(const nlohmann::json& body);

    ModelService& service_;
    JobRegistry& registry_;
    Work& work_;
    std::string shutdownToken_;
    ShutdownCallback onShutdown_;
};

}
