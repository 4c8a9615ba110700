/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sotto/processor.hpp"
#include "sotto/logger.hpp"
#include "sotto/model_service.hpp"
#include "sotto/registry.hpp"
#include <chrono>
#include <cstdio>

namespace sotto {

namespace {

std::string elapsedSince(std::chrono::steady_clock::time_point start) {
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1fs", elapsed);
    return buf;
}

}

Processor::Processor(JobRegistry& registry, ModelService& service) noexcept
    : registry_(registry), service_(service) {}

ProcessResult Processor::process(const JobId& jobId, int workerId) noexcept {
    try {
        // pending -> running; skipped if cleaned up while queued
        auto started = registry_.start(jobId);
        if (!started) {
            LOG_DEBUG("Job gone or cancelled before start: " + jobId);
            return ProcessResult::NotFound;
        }
        LOG_INFO("Worker-" + std::to_string(workerId) + " running job " + jobId + ": " +
                 started->input.audioPath.string());
        auto startTime = std::chrono::steady_clock::now();
        const auto cancelled = started->cancelled;
        const auto& options = started->input.options;

        try {
            if (options.modelId) {
                registry_.updateProgress(jobId, progress::kModelLoad);
                (void)service_.load(*options.modelId);
            }

            registry_.updateProgress(jobId, progress::kInference);

            InferenceHooks hooks;
            hooks.cancelled = cancelled;
            hooks.onProgress = [this, &jobId](int percent) {
                int scaled = progress::kInference +
                             percent * (progress::kDone - 1 - progress::kInference) / 100;
                registry_.updateProgress(jobId, scaled);
            };

            Transcript result = service_.transcribe(started->input.audioPath, options, hooks);

            if (!registry_.complete(jobId, std::move(result))) {
                LOG_DEBUG("Job removed while running, result discarded: " + jobId);
                return ProcessResult::Discarded;
            }
            LOG_INFO("Job completed: " + jobId + " in " + elapsedSince(startTime));
            return ProcessResult::Success;

        } catch (const std::exception& e) {
            if (!registry_.fail(jobId, e.what())) {
                LOG_DEBUG("Job removed while running, error discarded: " + jobId + " - " + e.what());
                return ProcessResult::Discarded;
            }
            LOG_WARN("Job failed: " + jobId + " after " + elapsedSince(startTime) + " - " + e.what());
            return ProcessResult::Failed;
        }

    } catch (const std::exception& e) {
        LOG_ERROR("Exception processing job " + jobId + ": " + std::string(e.what()));
        return ProcessResult::Failed;
    }
}

}
