/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "sotto/transcript.hpp"

namespace sotto {

enum class Device : uint8_t { Cpu, Gpu };

struct DeviceInfo {
    std::string name;
    std::string description;
    bool gpu = false;
};

struct Capabilities {
    std::vector<DeviceInfo> devices;
    std::string systemInfo;
};

// Device and precision after "auto" resolution.
struct LoadProfile {
    Device device = Device::Cpu;
    std::string deviceName;
    std::string computeType;
    int threads = 0;
};

struct InferenceHooks {
    std::function<void(int percent)> onProgress;
    std::shared_ptr<const std::atomic<bool>> cancelled;
};

// A loaded model. Not reentrant; callers serialize access.
class Engine {
public:
    virtual ~Engine() = default;

    virtual Transcript transcribe(const std::filesystem::path& audio,
                                  const TranscribeOptions& options,
                                  const InferenceHooks& hooks) = 0;
};

// Loads model files into engines and reports what hardware is available.
class Backend {
public:
    virtual ~Backend() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual Capabilities capabilities() const = 0;

    // Blocking and expensive. Throws ModelLoadError.
    virtual std::unique_ptr<Engine> load(const std::filesystem::path& modelFile,
                                         const LoadProfile& profile) = 0;
};

}
