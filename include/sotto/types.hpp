/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace sotto {

// Job lifecycle states. Order matters: a job only ever moves forward.
enum class JobStatus : std::uint8_t { Pending, Running, Completed, Failed };

// Opaque job identifier.
using JobId = std::string;

[[nodiscard]] const char* toString(JobStatus status) noexcept;
[[nodiscard]] std::optional<JobStatus> parseJobStatus(const std::string& value) noexcept;

[[nodiscard]] inline bool isTerminal(JobStatus status) noexcept {
    return status == JobStatus::Completed || status == JobStatus::Failed;
}

} // namespace sotto
