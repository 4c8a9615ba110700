/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#include "sotto/registry.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <thread>
#include <vector>

using namespace sotto;

static JobInput input(const std::string& path) {
    JobInput in;
    in.audioPath = path;
    return in;
}

static void testLifecycle() {
    JobRegistry registry;
    auto id = registry.create(input("/tmp/a.wav"));

    auto job = registry.find(id);
    assert(job && job->status == JobStatus::Pending);
    assert(job->progress == 0);
    assert(!job->result && !job->error);

    // Progress only moves while running
    assert(!registry.updateProgress(id, 50));
    assert(!registry.complete(id, Transcript{}));

    auto started = registry.start(id);
    assert(started && started->input.audioPath == "/tmp/a.wav");
    assert(!registry.start(id));
    assert(registry.find(id)->status == JobStatus::Running);

    assert(registry.updateProgress(id, 40));
    registry.updateProgress(id, 20);
    assert(registry.find(id)->progress == 40);
    registry.updateProgress(id, 250);
    assert(registry.find(id)->progress == 100);

    Transcript transcript;
    transcript.text = "done";
    assert(registry.complete(id, transcript));
    job = registry.find(id);
    assert(job->status == JobStatus::Completed);
    assert(job->result && job->result->text == "done");

    // Terminal states are final
    assert(!registry.fail(id, "late"));
    assert(registry.find(id)->status == JobStatus::Completed);
    assert(!registry.find(id)->error);
}

static void testFailure() {
    JobRegistry registry;
    auto id = registry.create(input("/tmp/b.wav"));
    assert(!registry.fail(id, "not started"));
    (void)registry.start(id);
    assert(registry.fail(id, "decoder exploded"));
    auto job = registry.find(id);
    assert(job->status == JobStatus::Failed);
    assert(job->error && *job->error == "decoder exploded");
    assert(!job->result);
}

static void testRemoveAndCancel() {
    JobRegistry registry;
    auto pending = registry.create(input("/tmp/p.wav"));
    auto running = registry.create(input("/tmp/r.wav"));
    auto finished = registry.create(input("/tmp/f.wav"));

    auto started = registry.start(running);
    assert(started && !started->cancelled->load());
    (void)registry.start(finished);
    registry.complete(finished, Transcript{});

    assert(registry.remove(finished) == CleanupResult::Removed);
    assert(registry.remove(running) == CleanupResult::Cancelled);
    assert(started->cancelled->load());
    assert(registry.remove(pending) == CleanupResult::Cancelled);
    assert(registry.remove(pending) == CleanupResult::NotFound);
    assert(registry.size() == 0);

    // The worker finishing a removed job is discarded
    assert(!registry.complete(running, Transcript{}));
    assert(!registry.find(running));
}

static void testCancelAllAndCounts() {
    JobRegistry registry;
    auto a = registry.create(input("/tmp/1.wav"));
    auto b = registry.create(input("/tmp/2.wav"));
    auto c = registry.create(input("/tmp/3.wav"));
    auto runningB = registry.start(b);
    (void)registry.start(c);
    registry.fail(c, "bad");

    auto counts = registry.counts();
    assert(counts.pending == 1 && counts.running == 1);
    assert(counts.completed == 0 && counts.failed == 1);

    assert(registry.cancelAll() == 2);
    assert(runningB->cancelled->load());
    // A cancelled pending job is never started
    assert(!registry.start(a));
}

static void testUniqueIdsUnderContention() {
    JobRegistry registry;
    std::vector<std::thread> threads;
    std::vector<std::vector<JobId>> ids(4);
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 250; ++i) {
                ids[t].push_back(registry.create(input("/tmp/x.wav")));
            }
        });
    }
    for (auto& thread : threads) thread.join();

    std::set<JobId> unique;
    for (const auto& list : ids) unique.insert(list.begin(), list.end());
    assert(unique.size() == 1000);
    assert(registry.size() == 1000);
    assert(JobRegistry::generateId() != JobRegistry::generateId());
}

int main() {
    testLifecycle();
    testFailure();
    testRemoveAndCancel();
    testCancelAllAndCounts();
    testUniqueIdsUnderContention();
    std::cout << "registry_test: all tests passed\n";
    return 0;
}
