#pragma once

#include <expected>
#include <string>
#include <vector>

namespace audio {

constexpr int target_sample_rate = 16000;

// Reads an audio file as mono float PCM at 16 kHz, resampling if needed.
// Formats libsndfile cannot open are converted through ffmpeg first when
// ffmpeg_fallback is set.
std::expected<std::vector<float>, std::string>
    load_pcm_mono_16k(const std::string& path, bool ffmpeg_fallback);

// Reads with libsndfile only.
std::expected<std::vector<float>, std::string> read_with_sndfile(const std::string& path);

// Runs `ffmpeg -i in -ar 16000 -ac 1 -c:a pcm_s16le out`.
std::expected<void, std::string> convert_with_ffmpeg(const std::string& in, const std::string& out);

} // namespace audio
