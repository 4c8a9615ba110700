/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sotto/whisper_engine.hpp"
#include "sotto/config.hpp"
#include "sotto/errors.hpp"
#include "sotto/logger.hpp"
#include "sotto/wav.hpp"
#include "ggml-backend.h"
#include "whisper.h"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <vector>

namespace sotto {

namespace {

// Configurable whisper.cpp log filtering - keep daemon output clean
void filteredWhisperLog(enum ggml_log_level level, const char* text, void* /*user_data*/) {
    // Skip progress dots and other noise
    if (!text || text[0] == '.' || text[0] == '\n' || text[0] == '\0') {
        return;
    }

    static const int filterLevel = [] {
        const char* env = std::getenv("WHISPER_LOG_LEVEL");
        if (!env) return static_cast<int>(GGML_LOG_LEVEL_ERROR);
        std::string value(env);
        return static_cast<int>(value == "info"  ? GGML_LOG_LEVEL_INFO :
                                value == "warn"  ? GGML_LOG_LEVEL_WARN :
                                value == "debug" ? GGML_LOG_LEVEL_DEBUG :
                                                   GGML_LOG_LEVEL_ERROR);
    }();

    if (static_cast<int>(level) >= filterLevel) {
        std::fputs(text, stderr);
    }
}

void initWhisperRuntime() {
    static std::once_flag once;
    std::call_once(once, [] {
        whisper_log_set(filteredWhisperLog, nullptr);
        ggml_backend_load_all();
    });
}

std::string trimCopy(const std::string& value) {
    auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

// whisper timestamps are in units of 10 ms
double toSeconds(int64_t t) {
    return static_cast<double>(t) * 0.01;
}

void reportProgress(whisper_context* /*ctx*/, whisper_state* /*state*/, int progress, void* userData) {
    const auto* hooks = static_cast<const InferenceHooks*>(userData);
    if (!hooks || !hooks->onProgress) {
        return;
    }
    try {
        hooks->onProgress(progress);
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Progress update failed: ") + e.what());
    }
}

bool shouldAbort(void* userData) {
    const auto* hooks = static_cast<const InferenceHooks*>(userData);
    return hooks && hooks->cancelled && hooks->cancelled->load();
}

std::vector<Word> collectWords(whisper_context* ctx, int segment) {
    std::vector<Word> words;
    std::vector<int> pieces;
    const whisper_token eot = whisper_token_eot(ctx);
    const int tokens = whisper_full_n_tokens(ctx, segment);

    for (int j = 0; j < tokens; ++j) {
        if (whisper_full_get_token_id(ctx, segment, j) >= eot) {
            continue;  // special and timestamp tokens
        }
        const whisper_token_data data = whisper_full_get_token_data(ctx, segment, j);
        const char* raw = whisper_full_get_token_text(ctx, segment, j);
        std::string text = raw ? raw : "";
        if (text.empty()) {
            continue;
        }

        // A leading space starts a new word; anything else continues the last one
        if (words.empty() || text[0] == ' ') {
            words.push_back(Word{toSeconds(data.t0), toSeconds(data.t1), text, data.p});
            pieces.push_back(1);
        } else {
            Word& last = words.back();
            last.word += text;
            last.end = toSeconds(data.t1);
            last.probability += data.p;
            ++pieces.back();
        }
    }

    for (std::size_t i = 0; i < words.size(); ++i) {
        words[i].probability /= static_cast<float>(pieces[i]);
    }
    return words;
}

}

WhisperEngine::WhisperEngine(const std::filesystem::path& modelFile, const LoadProfile& profile,
                             std::filesystem::path vadModel)
    : threads_(profile.threads > 0 ? profile.threads : 4), vadModel_(vadModel.string()) {
    initWhisperRuntime();

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = profile.device == Device::Gpu;
    cparams.gpu_device = envInt("SOTTO_GPU_DEVICE", 0);
    cparams.flash_attn = envInt("SOTTO_FLASH_ATTN", 0) != 0;

    LOG_DEBUG("whisper init: " + modelFile.string() + " (gpu: " + (cparams.use_gpu ? "yes" : "no") +
              ", threads: " + std::to_string(threads_) + ")");
    context_ = whisper_init_from_file_with_params(modelFile.c_str(), cparams);
    if (!context_) {
        throw ModelLoadError("Failed to load model " + modelFile.string() +
                             " (unsupported file, insufficient memory, or device error)");
    }
}

WhisperEngine::~WhisperEngine() {
    if (context_) {
        whisper_free(context_);
    }
}

Transcript WhisperEngine::transcribe(const std::filesystem::path& audio,
                                     const TranscribeOptions& options,
                                     const InferenceHooks& hooks) {
    std::vector<float> pcm = readWavMono16k(audio);
    if (pcm.empty()) {
        throw TranscriptionError("Audio file contains no samples: " + audio.string());
    }
    const int samples = static_cast<int>(pcm.size());

    whisper_full_params params = whisper_full_default_params(
        options.beamSize > 1 ? WHISPER_SAMPLING_BEAM_SEARCH : WHISPER_SAMPLING_GREEDY);
    params.n_threads        = threads_;
    params.print_realtime   = false;
    params.print_progress   = false;
    params.print_timestamps = false;
    params.print_special    = false;
    params.translate        = options.task == Task::Translate;
    params.temperature      = options.temperature;
    params.token_timestamps = options.wordTimestamps;
    params.beam_search.beam_size = options.beamSize;
    if (options.prompt) {
        params.initial_prompt = options.prompt->c_str();
    }

    if (options.vadFilter && !vadModel_.empty()) {
        params.vad = true;
        params.vad_model_path = vadModel_.c_str();
    }

    params.progress_callback = reportProgress;
    params.progress_callback_user_data = const_cast<InferenceHooks*>(&hooks);
    params.abort_callback = shouldAbort;
    params.abort_callback_user_data = const_cast<InferenceHooks*>(&hooks);

    Transcript transcript;
    std::string language;
    if (options.language) {
        language = *options.language;
        if (whisper_lang_id(language.c_str()) < 0) {
            throw TranscriptionError("Unsupported language: " + language);
        }
    } else {
        // Detect up front so the probability can be reported
        if (whisper_pcm_to_mel(context_, pcm.data(), samples, threads_) != 0) {
            throw TranscriptionError("Failed to compute spectrogram for " + audio.string());
        }
        std::vector<float> probs(static_cast<std::size_t>(whisper_lang_max_id() + 1), 0.0f);
        int detected = whisper_lang_auto_detect(context_, 0, threads_, probs.data());
        if (detected >= 0) {
            language = whisper_lang_str(detected);
            transcript.language = language;
            transcript.languageProbability = probs[static_cast<std::size_t>(detected)];
            LOG_DEBUG("Detected language " + language + " (p=" + std::to_string(probs[detected]) + ")");
        } else {
            language = "auto";
        }
    }
    params.language = language.c_str();
    params.detect_language = false;

    int rc = whisper_full(context_, params, pcm.data(), samples);
    if (rc != 0) {
        if (shouldAbort(const_cast<InferenceHooks*>(&hooks))) {
            throw TranscriptionError("Transcription cancelled");
        }
        throw TranscriptionError("Transcription failed (whisper_full returned " + std::to_string(rc) + ")");
    }

    if (!options.language && !transcript.language) {
        transcript.language = whisper_lang_str(whisper_full_lang_id(context_));
    }

    std::string text;
    const int segments = whisper_full_n_segments(context_);
    transcript.segments.reserve(static_cast<std::size_t>(segments));
    for (int i = 0; i < segments; ++i) {
        Segment segment;
        segment.id = i;
        segment.start = toSeconds(whisper_full_get_segment_t0(context_, i));
        segment.end = toSeconds(whisper_full_get_segment_t1(context_, i));
        const char* raw = whisper_full_get_segment_text(context_, i);
        segment.text = raw ? raw : "";
        if (options.wordTimestamps) {
            segment.words = collectWords(context_, i);
        }
        text += segment.text;
        transcript.segments.push_back(std::move(segment));
    }
    transcript.text = trimCopy(text);

    if (hooks.onProgress) {
        hooks.onProgress(100);
    }
    return transcript;
}

WhisperBackend::WhisperBackend(std::filesystem::path vadModel)
    : vadModel_(std::move(vadModel)) {
    initWhisperRuntime();
}

Capabilities WhisperBackend::capabilities() const {
    Capabilities caps;
    const size_t count = ggml_backend_dev_count();
    for (size_t i = 0; i < count; ++i) {
        ggml_backend_dev_t dev = ggml_backend_dev_get(i);
        DeviceInfo info;
        info.name = ggml_backend_dev_name(dev);
        info.description = ggml_backend_dev_description(dev);
        info.gpu = ggml_backend_dev_type(dev) == GGML_BACKEND_DEVICE_TYPE_GPU;
        caps.devices.push_back(std::move(info));
    }
    const char* system = whisper_print_system_info();
    caps.systemInfo = system ? trimCopy(system) : "";
    return caps;
}

std::unique_ptr<Engine> WhisperBackend::load(const std::filesystem::path& modelFile,
                                             const LoadProfile& profile) {
    return std::make_unique<WhisperEngine>(modelFile, profile, vadModel_);
}

}
