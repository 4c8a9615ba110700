/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sotto/transcript.hpp"
#include "sotto/errors.hpp"
#include <cstdint>

namespace sotto {

namespace {

const nlohmann::json* field(const nlohmann::json& options, const char* name) {
    auto it = options.find(name);
    if (it == options.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

std::string optionError(const char* name, const char* expected) {
    return std::string("Invalid option '") + name + "': expected " + expected;
}

std::optional<std::string> optionalString(const nlohmann::json& options, const char* name) {
    const auto* value = field(options, name);
    if (!value) {
        return std::nullopt;
    }
    if (!value->is_string()) {
        throw ProtocolError(optionError(name, "string"));
    }
    auto text = value->get<std::string>();
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

}

TranscribeOptions parseOptions(const nlohmann::json& options) {
    TranscribeOptions parsed;
    if (options.is_null()) {
        return parsed;
    }
    if (!options.is_object()) {
        throw ProtocolError("Invalid options: expected object");
    }

    parsed.modelId = optionalString(options, "model_id");
    parsed.prompt = optionalString(options, "prompt");

    if (auto language = optionalString(options, "language")) {
        if (*language != "auto") {
            parsed.language = *language;
        }
    }

    if (auto task = optionalString(options, "task")) {
        if (*task == "transcribe") {
            parsed.task = Task::Transcribe;
        } else if (*task == "translate") {
            parsed.task = Task::Translate;
        } else {
            throw ProtocolError("Invalid option 'task': expected \"transcribe\" or \"translate\"");
        }
    }

    if (const auto* beam = field(options, "beam_size")) {
        if (!beam->is_number_integer()) {
            throw ProtocolError(optionError("beam_size", "integer"));
        }
        // Range-check before narrowing to int
        auto value = beam->get<int64_t>();
        if (value < 1 || value > 16) {
            throw ProtocolError("Invalid option 'beam_size': must be between 1 and 16");
        }
        parsed.beamSize = static_cast<int>(value);
    }

    if (const auto* temperature = field(options, "temperature")) {
        if (!temperature->is_number()) {
            throw ProtocolError(optionError("temperature", "number"));
        }
        float value = temperature->get<float>();
        if (value < 0.0f || value > 1.0f) {
            throw ProtocolError("Invalid option 'temperature': must be between 0 and 1");
        }
        parsed.temperature = value;
    }

    if (const auto* vad = field(options, "vad_filter")) {
        if (!vad->is_boolean()) {
            throw ProtocolError(optionError("vad_filter", "boolean"));
        }
        parsed.vadFilter = vad->get<bool>();
    }

    if (const auto* words = field(options, "word_timestamps")) {
        if (!words->is_boolean()) {
            throw ProtocolError(optionError("word_timestamps", "boolean"));
        }
        parsed.wordTimestamps = words->get<bool>();
    }

    return parsed;
}

void to_json(nlohmann::json& j, const Word& word) {
    j = nlohmann::json{
        {"start", word.start},
        {"end", word.end},
        {"word", word.word},
        {"probability", word.probability}
    };
}

void to_json(nlohmann::json& j, const Segment& segment) {
    j = nlohmann::json{
        {"id", segment.id},
        {"start", segment.start},
        {"end", segment.end},
        {"text", segment.text}
    };
    if (!segment.words.empty()) {
        j["words"] = segment.words;
    }
}

void to_json(nlohmann::json& j, const Transcript& transcript) {
    j = nlohmann::json{
        {"text", transcript.text},
        {"segments", transcript.segments}
    };
    j["language"] = transcript.language ? nlohmann::json(*transcript.language) : nlohmann::json(nullptr);
    j["language_probability"] = transcript.languageProbability
        ? nlohmann::json(*transcript.languageProbability) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const TranscribeOptions& options) {
    j = nlohmann::json::object();
    if (options.modelId) j["model_id"] = *options.modelId;
    if (options.language) j["language"] = *options.language;
    j["task"] = options.task == Task::Translate ? "translate" : "transcribe";
    j["beam_size"] = options.beamSize;
    j["temperature"] = options.temperature;
    j["vad_filter"] = options.vadFilter;
    j["word_timestamps"] = options.wordTimestamps;
    if (options.prompt) j["prompt"] = *options.prompt;
}

}
