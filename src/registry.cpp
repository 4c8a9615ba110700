/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sotto/registry.hpp"
#include "sotto/logger.hpp"
#include <algorithm>
#include <sstream>
#include <unistd.h>

namespace sotto {

JobId JobRegistry::create(JobInput input) {
    Entry entry;
    entry.job.id = generateId();
    entry.job.status = JobStatus::Pending;
    entry.job.input = std::move(input);
    entry.job.createdAt = std::chrono::system_clock::now();
    entry.cancelled = std::make_shared<std::atomic<bool>>(false);

    JobId id = entry.job.id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.emplace(id, std::move(entry));
    }
    LOG_DEBUG("Job created: " + id);
    return id;
}

std::optional<StartedJob> JobRegistry::start(const JobId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    auto& entry = it->second;
    if (entry.job.status != JobStatus::Pending || entry.cancelled->load()) {
        return std::nullopt;
    }
    entry.job.status = JobStatus::Running;
    entry.job.progress = 0;
    return StartedJob{entry.job.input, entry.cancelled};
}

bool JobRegistry::updateProgress(const JobId& id, int progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() || it->second.job.status != JobStatus::Running) {
        return false;
    }
    auto& job = it->second.job;
    job.progress = std::max(job.progress, std::min(std::max(progress, 0), 100));
    return true;
}

bool JobRegistry::complete(const JobId& id, Transcript result) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() || it->second.job.status != JobStatus::Running) {
        return false;
    }
    auto& job = it->second.job;
    job.status = JobStatus::Completed;
    job.progress = 100;
    job.result = std::move(result);
    return true;
}

bool JobRegistry::fail(const JobId& id, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() || it->second.job.status != JobStatus::Running) {
        return false;
    }
    auto& job = it->second.job;
    job.status = JobStatus::Failed;
    job.error = error;
    return true;
}

std::optional<Job> JobRegistry::find(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second.job;
}

CleanupResult JobRegistry::remove(const JobId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return CleanupResult::NotFound;
    }
    bool active = !isTerminal(it->second.job.status);
    if (active) {
        it->second.cancelled->store(true);
    }
    jobs_.erase(it);
    LOG_DEBUG("Job removed: " + id + (active ? " (cancelled)" : ""));
    return active ? CleanupResult::Cancelled : CleanupResult::Removed;
}

std::size_t JobRegistry::cancelAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t cancelled = 0;
    for (auto& kv : jobs_) {
        if (!isTerminal(kv.second.job.status)) {
            kv.second.cancelled->store(true);
            ++cancelled;
        }
    }
    return cancelled;
}

std::size_t JobRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

JobCounts JobRegistry::counts() const {
    JobCounts counts;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : jobs_) {
        switch (kv.second.job.status) {
            case JobStatus::Pending: ++counts.pending; break;
            case JobStatus::Running: ++counts.running; break;
            case JobStatus::Completed: ++counts.completed; break;
            case JobStatus::Failed: ++counts.failed; break;
        }
    }
    return counts;
}

JobId JobRegistry::generateId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << now << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

}
