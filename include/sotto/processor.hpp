/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>

#include "sotto/types.hpp"

namespace sotto {

class JobRegistry;
class ModelService;

enum class ProcessResult : uint8_t {
    Success,
    Failed,
    NotFound,
    Discarded
};

// Progress milestones reported while a job runs.
namespace progress {
constexpr int kStarted = 0;
constexpr int kModelLoad = 5;
constexpr int kInference = 10;
constexpr int kDone = 100;
}

// Runs one job on a worker thread: claim, load, transcribe, record outcome.
class Processor {
public:
    Processor(JobRegistry& registry, ModelService& service) noexcept;

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    [[nodiscard]] ProcessResult process(const JobId& jobId, int workerId) noexcept;

private:
    JobRegistry& registry_;
    ModelService& service_;
};

}
