/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sotto/handler.hpp"
#include "sotto/errors.hpp"
#include "sotto/logger.hpp"
#include "sotto/model_service.hpp"
#include "sotto/registry.hpp"
#include "sotto/work.hpp"

namespace sotto {

namespace {

// Comparison time does not depend on where the first mismatch is.
bool tokensEqual(const std::string& a, const std::string& b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    unsigned char diff = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}

}

Handler::Handler(ModelService& service, JobRegistry& registry, Work& work,
                 std::string shutdownToken, ShutdownCallback onShutdown)
    : service_(service), registry_(registry), work_(work),
      shutdownToken_(std::move(shutdownToken)), onShutdown_(std::move(onShutdown)) {}

nlohmann::json Handler::handle(const std::string& frame) noexcept {
    try {
        Request request = parseRequest(frame);
        LOG_DEBUG(std::string("Request: ") + toString(request.command));
        return dispatch(request);
    } catch (const Error& e) {
        LOG_DEBUG(std::string("Request failed: ") + e.what());
        return errorResponse(e.what());
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Unexpected error handling request: ") + e.what());
        return errorResponse(std::string("Internal error: ") + e.what());
    }
}

nlohmann::json Handler::dispatch(const Request& request) {
    switch (request.command) {
        case Command::Status:     return handleStatus();
        case Command::LoadModel:  return handleLoadModel(request.body);
        case Command::Transcribe: return handleTranscribe(request.body);
        case Command::JobStatus:  return handleJobStatus(request.body);
        case Command::CleanupJob: return handleCleanupJob(request.body);
        case Command::Shutdown:   return handleShutdown(request.body);
    }
    throw ProtocolError(std::string("Unknown command: ") + toString(request.command));
}

nlohmann::json Handler::handleStatus() {
    auto counts = registry_.counts();
    return {
        {"status", "running"},
        {"info", service_.info()},
        {"jobs", {
            {"pending", counts.pending},
            {"running", counts.running},
            {"completed", counts.completed},
            {"failed", counts.failed}
        }}
    };
}

nlohmann::json Handler::handleLoadModel(const nlohmann::json& body) {
    auto modelId = requireString(body, "model_id");
    auto outcome = service_.load(modelId);
    return {
        {"status", "ok"},
        {"model_id", outcome.modelId},
        {"already_loaded", outcome.alreadyLoaded},
        {"load_time", outcome.seconds}
    };
}

nlohmann::json Handler::handleTranscribe(const nlohmann::json& body) {
    JobInput input;
    input.audioPath = requireString(body, "audio_path");
    auto options = body.find("options");
    input.options = parseOptions(options == body.end() ? nlohmann::json() : *options);

    auto submitted = work_.submit(std::move(input));
    if (!submitted) {
        return errorResponse(submitted.message);
    }
    return {{"status", "ok"}, {"job_id", submitted.id}};
}

nlohmann::json Handler::handleJobStatus(const nlohmann::json& body) {
    auto jobId = requireString(body, "job_id");
    auto job = registry_.find(jobId);
    if (!job) {
        throw NotFoundError("Job not found: " + jobId);
    }
    return {
        {"status", toString(job->status)},
        {"progress", job->progress},
        {"result", job->result ? nlohmann::json(*job->result) : nlohmann::json(nullptr)},
        {"error", job->error ? nlohmann::json(*job->error) : nlohmann::json(nullptr)}
    };
}

nlohmann::json Handler::handleCleanupJob(const nlohmann::json& body) {
    auto jobId = requireString(body, "job_id");
    auto outcome = registry_.remove(jobId);
    if (outcome == CleanupResult::Cancelled) {
        LOG_INFO("Job cancelled by cleanup: " + jobId);
    }
    return {
        {"status", "ok"},
        {"removed", outcome != CleanupResult::NotFound},
        {"cancelled", outcome == CleanupResult::Cancelled}
    };
}

nlohmann::json Handler::handleShutdown(const nlohmann::json& body) {
    auto it = body.find("token");
    std::string token = (it != body.end() && it->is_string()) ? it->get<std::string>() : "";
    if (shutdownToken_.empty() || !tokensEqual(token, shutdownToken_)) {
        LOG_WARN("Rejected shutdown request with invalid token");
        throw ProtocolError("Unauthorized");
    }
    LOG_INFO("Shutdown requested by client");
    if (onShutdown_) {
        onShutdown_();
    }
    return {{"status", "ok"}, {"stopping", true}};
}

}
