/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#include "sotto/errors.hpp"
#include "sotto/protocol.hpp"
#include "sotto/transcript.hpp"
#include "sotto/types.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace sotto;
using nlohmann::json;

template <typename Fn>
static std::string protocolErrorOf(Fn fn) {
    try {
        fn();
    } catch (const ProtocolError& e) {
        return e.what();
    }
    return "";
}

static void testParseRequest() {
    auto request = parseRequest(R"({"command":"load_model","model_id":"base.en"})");
    assert(request.command == Command::LoadModel);
    assert(requireString(request.body, "model_id") == "base.en");

    for (const char* name : {"status", "load_model", "transcribe", "job_status", "cleanup_job", "shutdown"}) {
        auto parsed = parseCommand(name);
        assert(parsed);
        assert(std::string(toString(*parsed)) == name);
    }
}

static void testRequestErrors() {
    assert(protocolErrorOf([] { (void)parseRequest("{not json"); }) == "Invalid JSON");
    assert(protocolErrorOf([] { (void)parseRequest("[1,2,3]"); }) == "Invalid JSON");
    assert(protocolErrorOf([] { (void)parseRequest("{}"); }) == "Missing command");
    assert(protocolErrorOf([] { (void)parseRequest(R"({"command":"reboot"})"); }) == "Unknown command: reboot");

    json body = {{"job_id", ""}, {"audio_path", 42}};
    assert(protocolErrorOf([&] { (void)requireString(body, "job_id"); }) == "Missing job_id");
    assert(protocolErrorOf([&] { (void)requireString(body, "audio_path"); }) == "Missing audio_path");
    assert(protocolErrorOf([&] { (void)requireString(body, "model_id"); }) == "Missing model_id");
}

static void testResponses() {
    assert(isError(errorResponse("boom")));
    assert(!isError(okResponse()));
    assert(!isError(json{{"status", "ok"}, {"error", nullptr}}));
    assert(isError(json::array()));

    auto frame = encodeFrame(makeRequest(Command::Status));
    assert(frame == "{\"command\":\"status\"}\n");

    // Invalid UTF-8 from the engine is replaced, not thrown on
    auto bad = encodeFrame(json{{"text", std::string("caf\xC3", 4)}});
    assert(bad.back() == '\n');
    assert(bad.find('\n') == bad.size() - 1);
}

static void testOptionDefaults() {
    auto defaults = parseOptions(json());
    assert(!defaults.modelId);
    assert(!defaults.language);
    assert(defaults.task == Task::Transcribe);
    assert(defaults.beamSize == 5);
    assert(defaults.temperature == 0.0f);
    assert(defaults.vadFilter);
    assert(!defaults.wordTimestamps);

    auto nulls = parseOptions(json{{"language", nullptr}, {"beam_size", nullptr}, {"unknown", 1}});
    assert(!nulls.language);
    assert(nulls.beamSize == 5);

    auto autoLang = parseOptions(json{{"language", "auto"}});
    assert(!autoLang.language);
}

static void testOptionValues() {
    auto parsed = parseOptions(json{
        {"model_id", "small"},
        {"language", "de"},
        {"task", "translate"},
        {"beam_size", 1},
        {"temperature", 0.4},
        {"vad_filter", false},
        {"word_timestamps", true},
        {"prompt", "Glossary: sotto"}
    });
    assert(parsed.modelId && *parsed.modelId == "small");
    assert(parsed.language && *parsed.language == "de");
    assert(parsed.task == Task::Translate);
    assert(parsed.beamSize == 1);
    assert(parsed.temperature > 0.39f && parsed.temperature < 0.41f);
    assert(!parsed.vadFilter);
    assert(parsed.wordTimestamps);
    assert(parsed.prompt && *parsed.prompt == "Glossary: sotto");

    json echoed = parsed;
    assert(echoed["task"] == "translate");
    assert(echoed["model_id"] == "small");
}

static void testOptionErrors() {
    assert(!protocolErrorOf([] { (void)parseOptions(json{{"beam_size", "5"}}); }).empty());
    assert(!protocolErrorOf([] { (void)parseOptions(json{{"beam_size", 0}}); }).empty());
    // Out-of-range integers that would wrap into 1..16 as int
    assert(protocolErrorOf([] { (void)parseOptions(json::parse(R"({"beam_size":4294967297})")); }) ==
           "Invalid option 'beam_size': must be between 1 and 16");
    assert(!protocolErrorOf([] { (void)parseOptions(json::parse(R"({"beam_size":18446744073709551615})")); }).empty());
    assert(!protocolErrorOf([] { (void)parseOptions(json{{"beam_size", -4294967295LL}}); }).empty());
    assert(!protocolErrorOf([] { (void)parseOptions(json{{"temperature", 2.5}}); }).empty());
    assert(!protocolErrorOf([] { (void)parseOptions(json{{"task", "summarize"}}); }).empty());
    assert(!protocolErrorOf([] { (void)parseOptions(json{{"vad_filter", "yes"}}); }).empty());
    assert(protocolErrorOf([] { (void)parseOptions(json::array()); }) == "Invalid options: expected object");
}

static void testTranscriptJson() {
    Transcript transcript;
    transcript.text = "hello world";
    Segment segment;
    segment.id = 0;
    segment.start = 0.0;
    segment.end = 1.2;
    segment.text = " hello world";
    transcript.segments.push_back(segment);

    json j = transcript;
    assert(j["text"] == "hello world");
    assert(j["segments"].size() == 1);
    assert(!j["segments"][0].contains("words"));
    assert(j["language"].is_null());
    assert(j["language_probability"].is_null());

    transcript.language = "en";
    transcript.segments[0].words.push_back(Word{0.0, 0.4, " hello", 0.8f});
    j = transcript;
    assert(j["language"] == "en");
    assert(j["segments"][0]["words"][0]["word"] == " hello");
}

static void testJobStatusNames() {
    assert(std::string(toString(JobStatus::Completed)) == "completed");
    assert(parseJobStatus("failed") == JobStatus::Failed);
    assert(!parseJobStatus("done"));
    assert(isTerminal(JobStatus::Failed));
    assert(!isTerminal(JobStatus::Running));
}

int main() {
    testParseRequest();
    testRequestErrors();
    testResponses();
    testOptionDefaults();
    testOptionValues();
    testOptionErrors();
    testTranscriptJson();
    testJobStatusNames();
    std::cout << "protocol_test: all tests passed\n";
    return 0;
}
