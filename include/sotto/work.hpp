/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

#include "sotto/registry.hpp"
#include "sotto/types.hpp"

namespace sotto {

class Pool;

enum class SubmissionError : uint8_t {
    None = 0,
    InvalidContent,
    QueueFull
};

struct SubmitResult {
    bool ok = false;
    JobId id;
    SubmissionError error = SubmissionError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Validates a transcription request and hands it to the worker pool.
// Never blocks on transcription.
class Work final {
public:
    Work(JobRegistry& registry, Pool& pool) noexcept;

    Work(const Work&) = delete;
    Work& operator=(const Work&) = delete;
    Work(Work&&) = delete;
    Work& operator=(Work&&) = delete;

    [[nodiscard]] SubmitResult submit(JobInput input);

private:
    JobRegistry& registry_;
    Pool& pool_;

    [[nodiscard]] static bool validateAudioPath(const std::filesystem::path& path, std::string& error);
};

}
