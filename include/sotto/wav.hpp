/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <vector>

namespace sotto {

constexpr int kEngineSampleRate = 16000;

// Decode a 16 kHz WAV file to mono float PCM in [-1, 1]. Multi-channel input
// is down-mixed. Throws TranscriptionError for anything else; converting
// other formats is the client's job.
[[nodiscard]] std::vector<float> readWavMono16k(const std::filesystem::path& path);

}
