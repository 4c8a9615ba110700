/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sotto/protocol.hpp"
#include "sotto/errors.hpp"

namespace sotto {

namespace {

struct CommandName {
    Command command;
    const char* name;
};

constexpr CommandName kCommands[] = {
    {Command::Status, "status"},
    {Command::LoadModel, "load_model"},
    {Command::Transcribe, "transcribe"},
    {Command::JobStatus, "job_status"},
    {Command::CleanupJob, "cleanup_job"},
    {Command::Shutdown, "shutdown"},
};

void stripCarriageReturn(std::string& frame) {
    if (!frame.empty() && frame.back() == '\r') {
        frame.pop_back();
    }
}

bool isBlank(const std::string& frame) {
    return frame.find_first_not_of(" \t\r\n") == std::string::npos;
}

}

const char* toString(Command command) noexcept {
    for (const auto& entry : kCommands) {
        if (entry.command == command) return entry.name;
    }
    return "unknown";
}

std::optional<Command> parseCommand(const std::string& name) noexcept {
    for (const auto& entry : kCommands) {
        if (name == entry.name) return entry.command;
    }
    return std::nullopt;
}

Request parseRequest(const std::string& frame) {
    nlohmann::json body = nlohmann::json::parse(frame, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw ProtocolError("Invalid JSON");
    }

    auto it = body.find("command");
    if (it == body.end() || it->is_null()) {
        throw ProtocolError("Missing command");
    }
    std::string name = it->is_string() ? it->get<std::string>() : it->dump();
    auto command = parseCommand(name);
    if (!command) {
        throw ProtocolError("Unknown command: " + name);
    }
    return Request{*command, std::move(body)};
}

std::string requireString(const nlohmann::json& body, const char* field) {
    auto it = body.find(field);
    if (it == body.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        throw ProtocolError(std::string("Missing ") + field);
    }
    return it->get<std::string>();
}

nlohmann::json makeRequest(Command command) {
    return {{"command", toString(command)}};
}

nlohmann::json errorResponse(const std::string& message) {
    return {{"error", message}};
}

nlohmann::json okResponse() {
    return {{"status", "ok"}};
}

bool isError(const nlohmann::json& response) noexcept {
    if (!response.is_object()) {
        return true;
    }
    auto it = response.find("error");
    return it != response.end() && !it->is_null();
}

std::string encodeFrame(const nlohmann::json& message) {
    std::string out = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    out.push_back('\n');
    return out;
}

LineFramer::LineFramer(std::size_t maxFrameBytes) noexcept
    : maxFrameBytes_(maxFrameBytes) {}

void LineFramer::append(const char* data, std::size_t size) {
    // Drop consumed bytes before growing
    if (scanFrom_ > 0 && scanFrom_ >= buffer_.size() / 2) {
        buffer_.erase(0, scanFrom_);
        scanFrom_ = 0;
    }
    buffer_.append(data, size);
}

std::optional<std::string> LineFramer::next() {
    while (!overflowed_) {
        auto pos = buffer_.find('\n', scanFrom_);
        if (pos == std::string::npos) {
            if (buffered() > maxFrameBytes_) {
                overflowed_ = true;
            }
            return std::nullopt;
        }

        std::string frame = buffer_.substr(scanFrom_, pos - scanFrom_);
        scanFrom_ = pos + 1;
        if (frame.size() > maxFrameBytes_) {
            overflowed_ = true;
            return std::nullopt;
        }
        stripCarriageReturn(frame);
        if (!isBlank(frame)) {
            return frame;
        }
    }
    return std::nullopt;
}

std::optional<std::string> LineFramer::flush() {
    if (overflowed_ || buffered() == 0) {
        return std::nullopt;
    }
    std::string frame = buffer_.substr(scanFrom_);
    buffer_.clear();
    scanFrom_ = 0;
    if (frame.size() > maxFrameBytes_) {
        overflowed_ = true;
        return std::nullopt;
    }
    stripCarriageReturn(frame);
    if (isBlank(frame)) {
        return std::nullopt;
    }
    return frame;
}

}
