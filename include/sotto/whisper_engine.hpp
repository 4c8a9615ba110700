/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <memory>
#include <string>

#include "sotto/engine.hpp"

struct whisper_context;

namespace sotto {

class WhisperEngine final : public Engine {
public:
    // Throws ModelLoadError.
    WhisperEngine(const std::filesystem::path& modelFile, const LoadProfile& profile,
                  std::filesystem::path vadModel = {});
    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;
    WhisperEngine(WhisperEngine&&) = delete;
    WhisperEngine& operator=(WhisperEngine&&) = delete;

    Transcript transcribe(const std::filesystem::path& audio,
                          const TranscribeOptions& options,
                          const InferenceHooks& hooks) override;

private:
    whisper_context* context_ = nullptr;
    int threads_ = 4;
    std::string vadModel_;
};

class WhisperBackend final : public Backend {
public:
    explicit WhisperBackend(std::filesystem::path vadModel = {});

    [[nodiscard]] std::string name() const override { return "whisper.cpp"; }
    [[nodiscard]] Capabilities capabilities() const override;
    std::unique_ptr<Engine> load(const std::filesystem::path& modelFile,
                                 const LoadProfile& profile) override;

private:
    std::filesystem::path vadModel_;
};

}
