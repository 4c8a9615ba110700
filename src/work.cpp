/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sotto/work.hpp"
#include "sotto/logger.hpp"
#include "sotto/pool.hpp"
#include <filesystem>

namespace sotto {

Work::Work(JobRegistry& registry, Pool& pool) noexcept
    : registry_(registry), pool_(pool) {}

SubmitResult Work::submit(JobInput input) {
    std::string error;
    if (!validateAudioPath(input.audioPath, error)) {
        LOG_DEBUG(error);
        return {false, "", SubmissionError::InvalidContent, error};
    }

    JobId jobId = registry_.create(std::move(input));

    if (!pool_.submit(jobId)) {
        (void)registry_.remove(jobId);
        LOG_WARN("Rejected job, queue full: " + jobId);
        return {false, "", SubmissionError::QueueFull, "Server busy: job queue is full"};
    }

    LOG_INFO("Job submitted: " + jobId);
    return {true, jobId, SubmissionError::None, ""};
}

bool Work::validateAudioPath(const std::filesystem::path& path, std::string& error) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        error = "Audio file not found: " + path.string();
        return false;
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        error = "Audio path is not a file: " + path.string();
        return false;
    }
    return true;
}

}
