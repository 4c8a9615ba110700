/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sotto/types.hpp"

namespace sotto {

const char* toString(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Pending: return "pending";
        case JobStatus::Running: return "running";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
        default: return "unknown";
    }
}

std::optional<JobStatus> parseJobStatus(const std::string& value) noexcept {
    if (value == "pending") return JobStatus::Pending;
    if (value == "running") return JobStatus::Running;
    if (value == "completed") return JobStatus::Completed;
    if (value == "failed") return JobStatus::Failed;
    return std::nullopt;
}

}
