/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sotto/model_service.hpp"
#include "sotto/errors.hpp"
#include "sotto/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <new>
#include <thread>
#include <sys/utsname.h>
#include <unistd.h>

namespace sotto {

namespace {

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Suffix of the ggml model file for a requested precision.
std::string quantSuffix(const std::string& computeType) {
    if (computeType == "float16" || computeType == "float32") return "";
    if (computeType == "int8" || computeType == "int8_float16") return "-q8_0";
    if (computeType == "q8_0" || computeType == "q5_0" ||
        computeType == "q5_1" || computeType == "q4_0") {
        return "-" + computeType;
    }
    throw ModelLoadError("Unsupported compute type: " + computeType +
                         " (expected float32, float16, int8, int8_float16, q8_0, q5_0, q5_1, q4_0)");
}

std::filesystem::path modelFileFor(const std::filesystem::path& modelsDir,
                                   const std::string& modelId,
                                   const std::string& computeType) {
    std::filesystem::path direct(modelId);
    std::error_code ec;
    if (std::filesystem::is_regular_file(direct, ec)) {
        return direct;
    }
    return modelsDir / ("ggml-" + modelId + quantSuffix(computeType) + ".bin");
}

bool isMetal(const std::string& label) {
    auto name = toLowerCopy(label);
    return name.find("metal") != std::string::npos || name.find("mtl") != std::string::npos;
}

const DeviceInfo* findGpu(const Capabilities& caps, const std::string& kind) {
    for (const auto& dev : caps.devices) {
        if (!dev.gpu) continue;
        if (kind.empty()) return &dev;
        auto label = dev.name + " " + dev.description;
        if (kind == "cuda" && toLowerCopy(label).find("cuda") != std::string::npos) return &dev;
        if (kind == "metal" && isMetal(label)) return &dev;
    }
    return nullptr;
}

std::string platformString() {
    struct utsname uts{};
    if (::uname(&uts) != 0) {
        return "unknown";
    }
    return std::string(uts.sysname) + "-" + uts.release + "-" + uts.machine;
}

nlohmann::json memoryInfo() {
    long pageSize = ::sysconf(_SC_PAGESIZE);
    long total = ::sysconf(_SC_PHYS_PAGES);
    nlohmann::json info;
    info["memory_total"] = (pageSize > 0 && total > 0)
        ? nlohmann::json(static_cast<uint64_t>(total) * static_cast<uint64_t>(pageSize))
        : nlohmann::json(nullptr);
#ifdef _SC_AVPHYS_PAGES
    long avail = ::sysconf(_SC_AVPHYS_PAGES);
    info["memory_available"] = (pageSize > 0 && avail > 0)
        ? nlohmann::json(static_cast<uint64_t>(avail) * static_cast<uint64_t>(pageSize))
        : nlohmann::json(nullptr);
#else
    info["memory_available"] = nullptr;
#endif
    return info;
}

template <typename T>
nlohmann::json orNull(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

class BusyGuard {
public:
    explicit BusyGuard(std::atomic<bool>& flag) noexcept : flag_(flag) { flag_.store(true); }
    ~BusyGuard() { flag_.store(false); }
    BusyGuard(const BusyGuard&) = delete;
    BusyGuard& operator=(const BusyGuard&) = delete;
private:
    std::atomic<bool>& flag_;
};

}

ModelService::ModelService(ServiceConfig config, std::unique_ptr<Backend> backend)
    : config_(std::move(config)), backend_(std::move(backend)) {
    if (!backend_) {
        throw std::invalid_argument("ModelService requires a backend");
    }
    caps_ = backend_->capabilities();
    LOG_DEBUG("ModelService created - backend: " + backend_->name() +
              ", device: " + config_.compute.device +
              ", compute type: " + config_.compute.computeType +
              ", models: " + config_.modelsDir.string());
}

ModelService::~ModelService() {
    std::lock_guard<std::mutex> lock(engineMutex_);
    releaseEngine();
}

LoadProfile ModelService::resolveProfile() const {
    LoadProfile profile;
    profile.computeType = toLowerCopy(config_.compute.computeType);
    (void)quantSuffix(profile.computeType);

    std::string device = toLowerCopy(config_.compute.device);
    if (device == "mps") {
        device = "metal";
    }

    if (device == "auto") {
        if (const auto* gpu = findGpu(caps_, "")) {
            profile.device = Device::Gpu;
            profile.deviceName = gpu->name;
        } else {
            profile.device = Device::Cpu;
            profile.deviceName = "CPU";
        }
    } else if (device == "cpu") {
        profile.device = Device::Cpu;
        profile.deviceName = "CPU";
    } else if (device == "gpu" || device == "cuda" || device == "metal") {
        const auto* gpu = findGpu(caps_, device == "gpu" ? "" : device);
        if (!gpu) {
            std::string label = device == "cuda" ? "CUDA" : device == "metal" ? "Metal" : "GPU";
            throw ModelLoadError(label + " requested but not available. Try using 'cpu' or 'auto' for device.");
        }
        profile.device = Device::Gpu;
        profile.deviceName = gpu->name;
    } else {
        throw ModelLoadError("Unsupported device: " + config_.compute.device +
                             " (expected auto, cpu, gpu, cuda, metal)");
    }

    if (profile.device == Device::Gpu && isMetal(profile.deviceName) && profile.computeType == "int8") {
        LOG_WARN("int8 is not supported on Metal, using float16 instead");
        profile.computeType = "float16";
    }

    if (config_.compute.cpuThreads > 0) {
        profile.threads = config_.compute.cpuThreads;
    } else {
        profile.threads = static_cast<int>(std::min(4u, std::max(1u, std::thread::hardware_concurrency())));
    }
    return profile;
}

std::filesystem::path ModelService::resolveModelPath(const std::string& modelId) const {
    std::string computeType;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        computeType = profile_ ? profile_->computeType : toLowerCopy(config_.compute.computeType);
    }
    return modelFileFor(config_.modelsDir, modelId, computeType);
}

LoadOutcome ModelService::load(const std::string& modelId) {
    if (modelId.empty()) {
        throw ModelLoadError("Missing model_id");
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (modelId_ && *modelId_ == modelId) {
            return {modelId, true, 0.0};
        }
    }

    std::lock_guard<std::mutex> engineLock(engineMutex_);
    return loadLocked(modelId);
}

// Caller holds engineMutex_.
LoadOutcome ModelService::loadLocked(const std::string& modelId) {
    if (modelId.empty()) {
        throw ModelLoadError("Missing model_id");
    }

    LoadProfile profile;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        // Another caller may have loaded it while we waited
        if (modelId_ && *modelId_ == modelId) {
            return {modelId, true, 0.0};
        }
        loading_ = true;
        loadError_.reset();
    }

    try {
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (profile_) {
                profile = *profile_;
            }
        }
        if (profile.computeType.empty()) {
            profile = resolveProfile();
            std::lock_guard<std::mutex> lock(stateMutex_);
            profile_ = profile;
            LOG_INFO("Resolved device " + profile.deviceName + " (" +
                     (profile.device == Device::Gpu ? "gpu" : "cpu") + "), compute type " +
                     profile.computeType + ", threads " + std::to_string(profile.threads));
        }

        auto path = modelFileFor(config_.modelsDir, modelId, profile.computeType);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            throw ModelLoadError("Model file not found: " + path.string() +
                                 " (only local model files are used)");
        }

        // Full unload before load; never two models resident
        releaseEngine();

        LOG_INFO("Loading model " + modelId + " from " + path.string());
        auto started = std::chrono::steady_clock::now();
        auto engine = backend_->load(path, profile);
        if (!engine) {
            throw ModelLoadError("Backend returned no engine for " + path.string());
        }
        double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

        engine_ = std::move(engine);
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            modelId_ = modelId;
            modelPath_ = path;
            loadSeconds_ = seconds;
            loading_ = false;
        }
        LOG_INFO("Model " + modelId + " loaded in " + std::to_string(seconds) + "s");
        return {modelId, false, seconds};

    } catch (const ModelLoadError& e) {
        releaseEngine();
        recordFailure(e.what());
        throw;
    } catch (const std::bad_alloc&) {
        releaseEngine();
        std::string msg = "Out of memory loading " + modelId + ". Try a smaller model or a different compute_type.";
        recordFailure(msg);
        throw ModelLoadError(msg);
    } catch (const std::exception& e) {
        releaseEngine();
        recordFailure(e.what());
        throw ModelLoadError(e.what());
    }
}

Transcript ModelService::transcribe(const std::filesystem::path& audio,
                                    const TranscribeOptions& options,
                                    const InferenceHooks& hooks) {
    std::lock_guard<std::mutex> engineLock(engineMutex_);
    // Another job may have switched models since this one asked for its own
    if (options.modelId) {
        if (!loadLocked(*options.modelId).alreadyLoaded) {
            LOG_INFO("Reloaded model " + *options.modelId + " for transcription of " + audio.string());
        }
    }
    if (!engine_) {
        throw NoModelLoaded();
    }

    BusyGuard busy(busy_);
    try {
        return engine_->transcribe(audio, options, hooks);
    } catch (const Error&) {
        throw;
    } catch (const std::bad_alloc&) {
        throw TranscriptionError("Out of memory during transcription");
    } catch (const std::exception& e) {
        throw TranscriptionError(e.what());
    }
}

nlohmann::json ModelService::info() const {
    nlohmann::json devices = nlohmann::json::array();
    for (const auto& dev : caps_.devices) {
        devices.push_back({{"name", dev.name}, {"description", dev.description}, {"gpu", dev.gpu}});
    }

    nlohmann::json system = {
        {"platform", platformString()},
        {"cpu_count", std::thread::hardware_concurrency()},
        {"backend", backend_->name()},
        {"devices", devices},
        {"gpu_available", findGpu(caps_, "") != nullptr},
        {"system_info", caps_.systemInfo}
    };
    system.update(memoryInfo());

    std::lock_guard<std::mutex> lock(stateMutex_);

    nlohmann::json service = {
        {"device", config_.compute.device},
        {"resolved_device", profile_ ? nlohmann::json(profile_->deviceName) : nlohmann::json(nullptr)},
        {"compute_type", profile_ ? profile_->computeType : config_.compute.computeType},
        {"cpu_threads", config_.compute.cpuThreads > 0 ? nlohmann::json(config_.compute.cpuThreads)
                                                        : nlohmann::json(nullptr)},
        {"models_dir", config_.modelsDir.string()}
    };

    nlohmann::json model = {
        {"loaded", modelId_.has_value()},
        {"id", orNull(modelId_)},
        {"path", modelId_ ? nlohmann::json(modelPath_.string()) : nlohmann::json(nullptr)},
        {"loading", loading_},
        {"busy", busy_.load()},
        {"load_time", orNull(loadSeconds_)},
        {"load_error", orNull(loadError_)}
    };

    return {{"system", system}, {"service", service}, {"model", model}};
}

std::optional<std::string> ModelService::loadedModel() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return modelId_;
}

// Caller holds engineMutex_.
void ModelService::releaseEngine() noexcept {
    if (engine_) {
        LOG_DEBUG("Releasing resident model");
        engine_.reset();
    }
    std::lock_guard<std::mutex> lock(stateMutex_);
    modelId_.reset();
    modelPath_.clear();
    loadSeconds_.reset();
}

void ModelService::recordFailure(const std::string& error) {
    LOG_ERROR("Error loading model: " + error);
    std::lock_guard<std::mutex> lock(stateMutex_);
    loading_ = false;
    loadError_ = error;
}

}
