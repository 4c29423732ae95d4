#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "whisper/engine.hpp"

#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Per-request options as sent by the client. Unset fields fall back to the
// configured defaults when the request is resolved.
struct TranscribeParams {
    std::optional<std::string> language;
    std::optional<float> temperature;   // [0, 1]
    std::optional<int> beam_size;       // [1, 10]
    std::optional<std::string> initial_prompt;
    bool include_segments = false;
};

struct EffectiveParams {
    std::string language;
    float temperature = 0.0f;
    int beam_size = 5;
    std::string initial_prompt;
    bool include_segments = false;
    bool vad_filter = true;
};

EffectiveParams resolve_params(const TranscribeParams& params, const Config::Transcription& defaults);

struct Segment {
    int id = 0;
    double start = 0.0;
    double end = 0.0;
    std::string text;
};

struct Transcript {
    std::string text;
    std::string language;
    std::optional<std::vector<Segment>> segments;
    double inference_s = 0.0;
};

class Transcriber {
public:
    // serialize: allow one engine call at a time across all requests.
    explicit Transcriber(bool serialize = true);

    std::expected<Transcript, TranscribeError>
        run(SpeechEngine& engine, const std::string& audio_path, const EffectiveParams& params);

private:
    bool serialize_;
    std::mutex engine_mutex_;
};
