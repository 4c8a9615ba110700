/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sotto/pool.hpp"
#include "sotto/logger.hpp"

namespace sotto {

Pool::Pool(int workers, std::size_t maxQueued) noexcept
    : workers_(workers > 0 ? workers : 1), maxQueued_(maxQueued > 0 ? maxQueued : 1) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers, queue limit " +
              std::to_string(maxQueued_));
}

Pool::~Pool() {
    stop();
}

bool Pool::start(JobProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid job processor provided");
        return false;
    }

    processor_ = std::move(processor);
    shutdown_.store(false);
    running_.store(true);

    try {
        workerThreads_.reserve(static_cast<std::size_t>(workers_));
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
        LOG_INFO("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_DEBUG("Stopping pool...");
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
    }
    jobAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        dropped = jobQueue_.size();
        std::queue<JobId>().swap(jobQueue_);
    }
    if (dropped > 0) {
        LOG_WARN("Pool stopped with " + std::to_string(dropped) + " queued jobs not started");
    } else {
        LOG_INFO("Pool stopped");
    }
}

bool Pool::submit(const JobId& jobId) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_DEBUG("Cannot submit job to stopped pool: " + jobId);
        return false;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (jobQueue_.size() >= maxQueued_) {
                LOG_WARN("Job queue full (" + std::to_string(maxQueued_) + "), rejecting: " + jobId);
                return false;
            }
            jobQueue_.push(jobId);
        }
        jobAvailable_.notify_one();
        LOG_DEBUG("Job queued: " + jobId);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue job " + jobId + ": " + e.what());
        return false;
    }
}

std::size_t Pool::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return jobQueue_.size();
}

void Pool::workerLoop(int workerId) {
    setThreadName(workerThreadName(workerId));
    LOG_DEBUG("Worker-" + std::to_string(workerId) + " thread started");

    while (true) {
        JobId jobId;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            jobAvailable_.wait(lock, [this] {
                return !jobQueue_.empty() || shutdown_.load();
            });
            if (shutdown_.load()) {
                break;
            }
            jobId = std::move(jobQueue_.front());
            jobQueue_.pop();
        }

        LOG_DEBUG("Worker-" + std::to_string(workerId) + " claimed job: " + jobId);
        try {
            processor_(jobId, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR("Worker " + std::to_string(workerId) + " job processing error: " +
                      std::string(e.what()) + " (job: " + jobId + ")");
        }
    }

    LOG_DEBUG("Worker " + std::to_string(workerId) + " stopped");
}

}
