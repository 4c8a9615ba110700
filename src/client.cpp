/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sotto/client.hpp"
#include "sotto/logger.hpp"
#include "sotto/protocol.hpp"
#include "sotto/socket.hpp"
#include "sotto/types.hpp"
#include <thread>

namespace sotto {

namespace {
// Results with word timestamps for long audio can be large.
constexpr std::size_t kMaxResponseBytes = 256ULL * 1024 * 1024;
}

Client::Client(Endpoint endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), timeout_(timeout) {}

nlohmann::json Client::request(const nlohmann::json& message) const {
    try {
        Socket socket = connectTo(endpoint_);
        if (timeout_.count() > 0) {
            setIoTimeout(socket, static_cast<int>(timeout_.count()));
        }
        writeAll(socket, encodeFrame(message));

        LineFramer framer(kMaxResponseBytes);
        auto frame = readFrame(socket, framer);
        if (!frame) {
            return errorResponse("Connection closed without a response");
        }
        auto response = nlohmann::json::parse(*frame, nullptr, false);
        if (response.is_discarded() || !response.is_object()) {
            return errorResponse("Invalid response from daemon");
        }
        return response;
    } catch (const std::exception& e) {
        LOG_DEBUG(std::string("Request failed: ") + e.what());
        return errorResponse(e.what());
    }
}

nlohmann::json Client::status() const {
    return request(makeRequest(Command::Status));
}

nlohmann::json Client::loadModel(const std::string& modelId) const {
    auto message = makeRequest(Command::LoadModel);
    message["model_id"] = modelId;
    return request(message);
}

nlohmann::json Client::transcribe(const std::string& audioPath, const nlohmann::json& options) const {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(audioPath, ec);
    auto message = makeRequest(Command::Transcribe);
    message["audio_path"] = ec ? audioPath : absolute.lexically_normal().string();
    message["options"] = options.is_object() ? options : nlohmann::json::object();
    return request(message);
}

nlohmann::json Client::jobStatus(const std::string& jobId) const {
    auto message = makeRequest(Command::JobStatus);
    message["job_id"] = jobId;
    return request(message);
}

nlohmann::json Client::cleanupJob(const std::string& jobId) const {
    auto message = makeRequest(Command::CleanupJob);
    message["job_id"] = jobId;
    return request(message);
}

nlohmann::json Client::shutdown(const std::string& token) const {
    auto message = makeRequest(Command::Shutdown);
    message["token"] = token;
    return request(message);
}

nlohmann::json Client::waitForJob(const std::string& jobId,
                                  std::chrono::milliseconds pollInterval,
                                  const ProgressCallback& onUpdate,
                                  std::chrono::milliseconds deadline) const {
    const auto started = std::chrono::steady_clock::now();
    while (true) {
        auto response = jobStatus(jobId);
        if (onUpdate) {
            onUpdate(response);
        }
        if (isError(response)) {
            return response;
        }
        auto status = parseJobStatus(response.value("status", ""));
        if (status && isTerminal(*status)) {
            return response;
        }
        if (deadline.count() > 0 && std::chrono::steady_clock::now() - started >= deadline) {
            return response;
        }
        std::this_thread::sleep_for(pollInterval);
    }
}

nlohmann::json Client::collectJob(const std::string& jobId,
                                  std::chrono::milliseconds pollInterval,
                                  const ProgressCallback& onUpdate,
                                  std::chrono::milliseconds deadline) const {
    auto response = waitForJob(jobId, pollInterval, onUpdate, deadline);
    if (isError(response)) {
        return response;
    }
    auto status = parseJobStatus(response.value("status", ""));
    if (status && isTerminal(*status)) {
        auto cleaned = cleanupJob(jobId);
        if (isError(cleaned)) {
            LOG_WARN("Cleanup of job " + jobId + " failed: " + cleaned.value("error", ""));
        }
    }
    return response;
}

}
