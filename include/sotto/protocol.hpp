/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace sotto {

// Wire protocol: one newline-terminated JSON object per message.
enum class Command : uint8_t {
    Status,
    LoadModel,
    Transcribe,
    JobStatus,
    CleanupJob,
    Shutdown
};

[[nodiscard]] const char* toString(Command command) noexcept;
[[nodiscard]] std::optional<Command> parseCommand(const std::string& name) noexcept;

struct Request {
    Command command = Command::Status;
    nlohmann::json body;
};

// Throws ProtocolError ("Invalid JSON", "Unknown command: x", ...).
[[nodiscard]] Request parseRequest(const std::string& frame);

// Throws ProtocolError("Missing <field>") if absent, empty or not a string.
[[nodiscard]] std::string requireString(const nlohmann::json& body, const char* field);

[[nodiscard]] nlohmann::json makeRequest(Command command);
[[nodiscard]] nlohmann::json errorResponse(const std::string& message);
[[nodiscard]] nlohmann::json okResponse();
[[nodiscard]] bool isError(const nlohmann::json& response) noexcept;

// Serialized message including the trailing '\n'. Invalid UTF-8 coming out
// of the engine is replaced rather than thrown on.
[[nodiscard]] std::string encodeFrame(const nlohmann::json& message);

// Accumulates bytes from a stream and yields complete frames. The whole
// buffer is searched on every call, so frames split across reads or several
// frames in one read are both handled.
class LineFramer {
public:
    explicit LineFramer(std::size_t maxFrameBytes = 1024 * 1024) noexcept;

    void append(const char* data, std::size_t size);
    [[nodiscard]] std::optional<std::string> next();

    // Remaining bytes as a final unterminated frame (used on EOF).
    [[nodiscard]] std::optional<std::string> flush();

    // Set once the buffered frame grew past the limit without a delimiter.
    [[nodiscard]] bool overflowed() const noexcept { return overflowed_; }
    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size() - scanFrom_; }

private:
    std::size_t maxFrameBytes_;
    std::string buffer_;
    std::size_t scanFrom_ = 0;
    bool overflowed_ = false;
};

}
