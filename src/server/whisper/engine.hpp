#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string>

struct EngineSegment {
    int id = 0;
    double start = 0.0; // seconds
    double end = 0.0;
    std::string text;
};

// Forward-only, single-pass sequence of decoded segments.
class SegmentStream {
public:
    virtual ~SegmentStream() = default;
    virtual std::optional<EngineSegment> next() = 0;
};

struct DecodeOptions {
    std::string language;       // empty or "auto": detect
    float temperature = 0.0f;
    int beam_size = 5;
    std::string initial_prompt;
    bool vad_filter = true;
};

struct EngineOutput {
    std::string language;       // empty if the engine did not report one
    std::unique_ptr<SegmentStream> segments;
};

class SpeechEngine {
public:
    virtual ~SpeechEngine() = default;
    virtual std::expected<EngineOutput, std::string>
        transcribe(const std::string& audio_path, const DecodeOptions& options) = 0;
};
