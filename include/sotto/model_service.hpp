/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "sotto/config.hpp"
#include "sotto/engine.hpp"

namespace sotto {

struct LoadOutcome {
    std::string modelId;
    bool alreadyLoaded = false;
    double seconds = 0.0;
};

// Owns the resident model. At most one model is loaded at a time, and the
// engine is held by one load or one inference at a time.
class ModelService final {
public:
    ModelService(ServiceConfig config, std::unique_ptr<Backend> backend);
    ~ModelService();

    ModelService(const ModelService&) = delete;
    ModelService& operator=(const ModelService&) = delete;
    ModelService(ModelService&&) = delete;
    ModelService& operator=(ModelService&&) = delete;

    // No-op if modelId is already resident. Throws ModelLoadError; on failure
    // no model is left loaded.
    LoadOutcome load(const std::string& modelId);

    // If options.modelId is set, that model is made resident under the same
    // engine hold as the inference. Throws ModelLoadError, NoModelLoaded or
    // TranscriptionError.
    Transcript transcribe(const std::filesystem::path& audio,
                          const TranscribeOptions& options,
                          const InferenceHooks& hooks = {});

    // Snapshot of platform, configuration and resident model. Never waits
    // for an in-flight load or inference.
    [[nodiscard]] nlohmann::json info() const;

    [[nodiscard]] std::optional<std::string> loadedModel() const;
    [[nodiscard]] bool isBusy() const noexcept { return busy_.load(); }

    // Model id -> file, using the compute type to pick the quantization.
    // Throws ModelLoadError if the compute type is unknown.
    [[nodiscard]] std::filesystem::path resolveModelPath(const std::string& modelId) const;

    // Resolve "auto" and validate device/precision against the backend.
    // Throws ModelLoadError.
    [[nodiscard]] LoadProfile resolveProfile() const;

private:
    LoadOutcome loadLocked(const std::string& modelId);
    void releaseEngine() noexcept;
    void recordFailure(const std::string& error);

    ServiceConfig config_;
    std::unique_ptr<Backend> backend_;
    Capabilities caps_;

    // Held for the duration of a load or an inference call.
    std::mutex engineMutex_;
    std::unique_ptr<Engine> engine_;

    // Guards the fields below; never held across engine calls.
    mutable std::mutex stateMutex_;
    std::optional<LoadProfile> profile_;
    std::optional<std::string> modelId_;
    std::filesystem::path modelPath_;
    std::optional<double> loadSeconds_;
    std::optional<std::string> loadError_;
    bool loading_ = false;

    std::atomic<bool> busy_{false};
};

}
