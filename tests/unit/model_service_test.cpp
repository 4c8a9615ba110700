/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#include "sotto/errors.hpp"
#include "sotto/model_service.hpp"
#include "../support/fake_backend.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace sotto;
using namespace sotto::testing;

static ServiceConfig configFor(const TempDir& dir, const std::string& device = "auto",
                               const std::string& computeType = "float16") {
    ServiceConfig config;
    config.modelsDir = dir.path();
    config.compute.device = device;
    config.compute.computeType = computeType;
    return config;
}

template <typename Fn>
static std::string loadErrorOf(Fn fn) {
    try {
        fn();
    } catch (const ModelLoadError& e) {
        return e.what();
    }
    return "";
}

static void testInitialInfo() {
    TempDir dir;
    auto stats = std::make_shared<FakeStats>();
    ModelService service(configFor(dir), std::make_unique<FakeBackend>(stats));

    auto info = service.info();
    assert(info["model"]["loaded"] == false);
    assert(info["model"]["id"].is_null());
    assert(info["model"]["busy"] == false);
    assert(info["system"]["backend"] == "fake");
    assert(info["system"]["gpu_available"] == false);
    assert(info["service"]["device"] == "auto");
    assert(!service.loadedModel());
}

static void testLoadAndReuse() {
    TempDir dir;
    dir.touch("ggml-base.en.bin");
    auto stats = std::make_shared<FakeStats>();
    ModelService service(configFor(dir), std::make_unique<FakeBackend>(stats));

    auto first = service.load("base.en");
    assert(first.modelId == "base.en");
    assert(!first.alreadyLoaded);
    assert(stats->loads == 1);
    assert(stats->loadedFiles.back() == dir.path() / "ggml-base.en.bin");

    auto second = service.load("base.en");
    assert(second.alreadyLoaded);
    assert(stats->loads == 1);

    auto info = service.info();
    assert(info["model"]["loaded"] == true);
    assert(info["model"]["id"] == "base.en");
    assert(info["service"]["resolved_device"] == "CPU");
}

static void testSwitchAndFailedLoad() {
    TempDir dir;
    dir.touch("ggml-tiny.bin");
    dir.touch("ggml-broken.bin");
    auto stats = std::make_shared<FakeStats>();
    ModelService service(configFor(dir), std::make_unique<FakeBackend>(stats));

    service.load("tiny");
    auto error = loadErrorOf([&] { service.load("broken"); });
    assert(!error.empty());
    // A failed switch leaves nothing loaded
    assert(!service.loadedModel());
    auto info = service.info();
    assert(info["model"]["loaded"] == false);
    assert(info["model"]["load_error"].is_string());

    bool noModel = false;
    try {
        service.transcribe(dir.touch("a.wav"), TranscribeOptions{});
    } catch (const NoModelLoaded& e) {
        noModel = std::string(e.what()) == "No model loaded. Load a model first.";
    }
    assert(noModel);
}

static void testMissingModelFile() {
    TempDir dir;
    auto stats = std::make_shared<FakeStats>();
    ModelService service(configFor(dir), std::make_unique<FakeBackend>(stats));

    auto error = loadErrorOf([&] { service.load("large-v3"); });
    assert(error.find("Model file not found") == 0);
    assert(stats->loads == 0);
    assert(loadErrorOf([&] { service.load(""); }) == "Missing model_id");
}

static void testDirectPathAndQuantization() {
    TempDir dir;
    auto direct = dir.touch("custom-model.bin");
    auto stats = std::make_shared<FakeStats>();
    ModelService service(configFor(dir, "cpu", "int8"), std::make_unique<FakeBackend>(stats));

    assert(service.resolveModelPath("small") == dir.path() / "ggml-small-q8_0.bin");
    assert(service.resolveModelPath(direct.string()) == direct);

    service.load(direct.string());
    assert(stats->loadedFiles.back() == direct);
    assert(stats->profiles.back().device == Device::Cpu);
    assert(stats->profiles.back().threads > 0);

    ModelService bad(configFor(dir, "cpu", "int3"), std::make_unique<FakeBackend>(stats));
    assert(loadErrorOf([&] { (void)bad.resolveModelPath("small"); }).find("Unsupported compute type") == 0);
}

static void testDeviceResolution() {
    TempDir dir;
    auto stats = std::make_shared<FakeStats>();
    std::vector<DeviceInfo> gpus = {{"CPU", "cpu", false}, {"CUDA0", "NVIDIA RTX", true}};
    std::vector<DeviceInfo> metal = {{"CPU", "cpu", false}, {"MTL0", "Apple M2", true}};

    ModelService autoGpu(configFor(dir), std::make_unique<FakeBackend>(stats, gpus));
    auto profile = autoGpu.resolveProfile();
    assert(profile.device == Device::Gpu);
    assert(profile.deviceName == "CUDA0");

    ModelService cuda(configFor(dir, "cuda"), std::make_unique<FakeBackend>(stats, gpus));
    assert(cuda.resolveProfile().device == Device::Gpu);

    ModelService noCuda(configFor(dir, "cuda"), std::make_unique<FakeBackend>(stats));
    assert(loadErrorOf([&] { (void)noCuda.resolveProfile(); }) ==
           "CUDA requested but not available. Try using 'cpu' or 'auto' for device.");

    ModelService mps(configFor(dir, "mps", "int8"), std::make_unique<FakeBackend>(stats, metal));
    auto metalProfile = mps.resolveProfile();
    assert(metalProfile.device == Device::Gpu);
    assert(metalProfile.computeType == "float16");

    ModelService unknown(configFor(dir, "tpu"), std::make_unique<FakeBackend>(stats));
    assert(loadErrorOf([&] { (void)unknown.resolveProfile(); }).find("Unsupported device: tpu") == 0);
}

static void testInferenceIsSerialized() {
    TempDir dir;
    dir.touch("ggml-base.bin");
    auto stats = std::make_shared<FakeStats>();
    ModelService service(configFor(dir),
                         std::make_unique<FakeBackend>(stats, std::vector<DeviceInfo>{{"CPU", "cpu", false}},
                                                       std::chrono::milliseconds(50)));
    service.load("base");
    auto audio = dir.touch("meeting.wav");

    std::vector<std::thread> threads;
    std::vector<std::string> texts(4);
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&, i] {
            texts[i] = service.transcribe(audio, TranscribeOptions{}).text;
        });
    }
    // info() never waits for a running inference
    assert(service.info()["model"]["id"] == "base");
    for (auto& thread : threads) thread.join();

    assert(stats->inferences == 4);
    assert(stats->maxActive == 1);
    for (const auto& text : texts) assert(text == "transcript of meeting");
    assert(!service.isBusy());
}

static void testEngineFailureIsWrapped() {
    TempDir dir;
    dir.touch("ggml-base.bin");
    auto stats = std::make_shared<FakeStats>();
    ModelService service(configFor(dir), std::make_unique<FakeBackend>(stats));
    service.load("base");

    bool wrapped = false;
    try {
        service.transcribe(dir.touch("corrupt.wav"), TranscribeOptions{});
    } catch (const TranscriptionError&) {
        wrapped = true;
    }
    assert(wrapped);
    // The model stays resident after a failed inference
    assert(service.loadedModel() && *service.loadedModel() == "base");
}

int main() {
    testInitialInfo();
    testLoadAndReuse();
    testSwitchAndFailedLoad();
    testMissingModelFile();
    testDirectPathAndQuantization();
    testDeviceResolution();
    testInferenceIsSerialized();
    testEngineFailureIsWrapped();
    std::cout << "model_service_test: all tests passed\n";
    return 0;
}
