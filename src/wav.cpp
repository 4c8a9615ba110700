/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sotto/wav.hpp"
#include "sotto/errors.hpp"
#include "sotto/logger.hpp"
#include <algorithm>

#define DR_WAV_IMPLEMENTATION
#include <dr_wav.h>

namespace sotto {

namespace {

class WavReader {
public:
    explicit WavReader(const std::filesystem::path& path) {
        if (!drwav_init_file(&wav_, path.c_str(), nullptr)) {
            throw TranscriptionError("Cannot decode audio file (16 kHz WAV required, convert first): " +
                                     path.string());
        }
    }
    ~WavReader() { drwav_uninit(&wav_); }

    WavReader(const WavReader&) = delete;
    WavReader& operator=(const WavReader&) = delete;

    drwav& get() noexcept { return wav_; }

private:
    drwav wav_{};
};

}

std::vector<float> readWavMono16k(const std::filesystem::path& path) {
    WavReader reader(path);
    drwav& wav = reader.get();

    if (wav.sampleRate != static_cast<drwav_uint32>(kEngineSampleRate)) {
        throw TranscriptionError("Unsupported sample rate " + std::to_string(wav.sampleRate) +
                                 " Hz in " + path.string() + ": convert to 16 kHz WAV first");
    }
    if (wav.channels == 0) {
        throw TranscriptionError("WAV file has no channels: " + path.string());
    }

    const drwav_uint64 frames = wav.totalPCMFrameCount;
    const unsigned channels = wav.channels;
    std::vector<float> interleaved(static_cast<std::size_t>(frames) * channels);
    drwav_uint64 read = drwav_read_pcm_frames_f32(&wav, frames, interleaved.data());
    if (read < frames) {
        LOG_WARN("Short read from " + path.string() + ": " + std::to_string(read) + " of " +
                 std::to_string(frames) + " frames");
    }

    std::vector<float> mono(static_cast<std::size_t>(read));
    if (channels == 1) {
        std::copy(interleaved.begin(), interleaved.begin() + static_cast<std::ptrdiff_t>(read), mono.begin());
    } else {
        for (std::size_t i = 0; i < mono.size(); ++i) {
            float sum = 0.0f;
            for (unsigned c = 0; c < channels; ++c) {
                sum += interleaved[i * channels + c];
            }
            mono[i] = sum / static_cast<float>(channels);
        }
    }

    LOG_DEBUG("Decoded " + path.string() + ": " + std::to_string(mono.size()) + " samples, " +
              std::to_string(channels) + " channel(s)");
    return mono;
}

}
