/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "sotto/transcript.hpp"
#include "sotto/types.hpp"

namespace sotto {

struct JobInput {
    std::filesystem::path audioPath;
    TranscribeOptions options;
};

struct Job {
    JobId id;
    JobStatus status = JobStatus::Pending;
    JobInput input;
    int progress = 0;
    std::optional<Transcript> result;
    std::optional<std::string> error;
    std::chrono::system_clock::time_point createdAt;
};

// What a worker gets when it claims a pending job.
struct StartedJob {
    JobInput input;
    std::shared_ptr<std::atomic<bool>> cancelled;
};

enum class CleanupResult : uint8_t {
    NotFound,
    Removed,    // job was already terminal
    Cancelled   // job was pending or running and has been told to stop
};

struct JobCounts {
    std::size_t pending = 0;
    std::size_t running = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
};

// Id -> Job map shared by connection handlers and workers. Every access
// holds the registry lock. Transitions only move forward:
// pending -> running -> completed | failed.
class JobRegistry {
public:
    JobRegistry() = default;

    JobRegistry(const JobRegistry&) = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;
    JobRegistry(JobRegistry&&) = delete;
    JobRegistry& operator=(JobRegistry&&) = delete;

    [[nodiscard]] JobId create(JobInput input);

    // pending -> running. Empty if the job is gone or was not pending.
    [[nodiscard]] std::optional<StartedJob> start(const JobId& id);

    // Progress never decreases and only moves while running.
    bool updateProgress(const JobId& id, int progress);

    // running -> completed / failed. False if the job was removed meanwhile.
    bool complete(const JobId& id, Transcript result);
    bool fail(const JobId& id, const std::string& error);

    [[nodiscard]] std::optional<Job> find(const JobId& id) const;

    // Removes the job whatever its state; non-terminal jobs are cancelled.
    CleanupResult remove(const JobId& id);

    // Flags every pending or running job as cancelled (daemon shutdown).
    std::size_t cancelAll();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] JobCounts counts() const;

    [[nodiscard]] static JobId generateId();

private:
    struct Entry {
        Job job;
        std::shared_ptr<std::atomic<bool>> cancelled;
    };

    mutable std::mutex mutex_;
    std::unordered_map<JobId, Entry> jobs_;
};

}
