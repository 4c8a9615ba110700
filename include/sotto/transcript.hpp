/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sotto {

struct Word {
    double start = 0.0;
    double end = 0.0;
    std::string word;
    float probability = 0.0f;
};

struct Segment {
    int id = 0;
    double start = 0.0;  // seconds
    double end = 0.0;
    std::string text;
    std::vector<Word> words;
};

struct Transcript {
    std::string text;
    std::vector<Segment> segments;
    std::optional<std::string> language;
    std::optional<float> languageProbability;
};

enum class Task : uint8_t { Transcribe, Translate };

// Per-request decoding options. Engine-specific; an engine may ignore some.
struct TranscribeOptions {
    std::optional<std::string> modelId;
    std::optional<std::string> language;  // unset = auto-detect
    Task task = Task::Transcribe;
    int beamSize = 5;
    float temperature = 0.0f;
    bool vadFilter = true;
    bool wordTimestamps = false;
    std::optional<std::string> prompt;
};

// Null values keep the default, unknown keys are ignored.
// Throws ProtocolError on a value of the wrong type or range.
[[nodiscard]] TranscribeOptions parseOptions(const nlohmann::json& options);

void to_json(nlohmann::json& j, const Word& word);
void to_json(nlohmann::json& j, const Segment& segment);
void to_json(nlohmann::json& j, const Transcript& transcript);
void to_json(nlohmann::json& j, const TranscribeOptions& options);

} // namespace sotto
