/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "sotto/engine.hpp"
#include "sotto/errors.hpp"

namespace sotto::testing {

// Shared counters so tests can observe what the engine was asked to do.
struct FakeStats {
    std::atomic<int> loads{0};
    std::atomic<int> inferences{0};
    std::atomic<int> active{0};
    std::atomic<int> maxActive{0};

    std::mutex mutex;
    std::vector<std::filesystem::path> loadedFiles;
    std::vector<LoadProfile> profiles;
    // (model file, audio file) for each inference, in order
    std::vector<std::pair<std::filesystem::path, std::filesystem::path>> inferenceLog;
};

// Sleeps for `delay` in small steps, reporting progress and honouring the
// cancellation flag. Audio named "*corrupt*" makes it throw a plain
// std::runtime_error. The text depends only on the file name.
class FakeEngine final : public Engine {
public:
    FakeEngine(std::shared_ptr<FakeStats> stats, std::filesystem::path modelFile,
               std::chrono::milliseconds delay)
        : stats_(std::move(stats)), modelFile_(std::move(modelFile)), delay_(delay) {}

    Transcript transcribe(const std::filesystem::path& audio,
                          const TranscribeOptions& options,
                          const InferenceHooks& hooks) override {
        int now = ++stats_->active;
        int seen = stats_->maxActive.load();
        while (now > seen && !stats_->maxActive.compare_exchange_weak(seen, now)) {}
        ++stats_->inferences;
        {
            std::lock_guard<std::mutex> lock(stats_->mutex);
            stats_->inferenceLog.emplace_back(modelFile_, audio);
        }

        struct ActiveGuard {
            std::atomic<int>& counter;
            ~ActiveGuard() { --counter; }
        } guard{stats_->active};

        if (audio.filename().string().find("corrupt") != std::string::npos) {
            throw std::runtime_error("decoder exploded");
        }

        const int steps = 10;
        for (int i = 0; i <= steps; ++i) {
            if (hooks.cancelled && hooks.cancelled->load()) {
                throw TranscriptionError("Transcription cancelled");
            }
            if (hooks.onProgress) {
                hooks.onProgress(i * 100 / steps);
            }
            if (i < steps) {
                std::this_thread::sleep_for(delay_ / steps);
            }
        }

        Transcript transcript;
        transcript.text = "transcript of " + audio.stem().string();
        Segment segment;
        segment.id = 0;
        segment.start = 0.0;
        segment.end = 1.5;
        segment.text = " " + transcript.text;
        if (options.wordTimestamps) {
            segment.words.push_back(Word{0.0, 0.5, " transcript", 0.9f});
        }
        transcript.segments.push_back(segment);
        if (options.language) {
            transcript.language = std::nullopt;
        } else {
            transcript.language = "en";
            transcript.languageProbability = 0.98f;
        }
        return transcript;
    }

private:
    std::shared_ptr<FakeStats> stats_;
    std::filesystem::path modelFile_;
    std::chrono::milliseconds delay_;
};

class FakeBackend final : public Backend {
public:
    explicit FakeBackend(std::shared_ptr<FakeStats> stats,
                         std::vector<DeviceInfo> devices = {{"CPU", "fake cpu", false}},
                         std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : stats_(std::move(stats)), devices_(std::move(devices)), delay_(delay) {}

    std::string name() const override { return "fake"; }

    Capabilities capabilities() const override {
        return Capabilities{devices_, "FAKE = 1"};
    }

    std::unique_ptr<Engine> load(const std::filesystem::path& modelFile,
                                 const LoadProfile& profile) override {
        ++stats_->loads;
        {
            std::lock_guard<std::mutex> lock(stats_->mutex);
            stats_->loadedFiles.push_back(modelFile);
            stats_->profiles.push_back(profile);
        }
        if (modelFile.filename().string().find("broken") != std::string::npos) {
            throw ModelLoadError("Failed to load model " + modelFile.string());
        }
        return std::make_unique<FakeEngine>(stats_, modelFile, delay_);
    }

private:
    std::shared_ptr<FakeStats> stats_;
    std::vector<DeviceInfo> devices_;
    std::chrono::milliseconds delay_;
};

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "sotto-test-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (!::mkdtemp(buffer.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = buffer.data();
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

    std::filesystem::path touch(const std::string& name, const std::string& content = "x") const {
        auto file = path_ / name;
        std::ofstream(file) << content;
        return file;
    }

private:
    std::filesystem::path path_;
};

template <typename Predicate>
bool waitUntil(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

}
