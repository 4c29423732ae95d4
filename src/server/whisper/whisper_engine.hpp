#pragma once

#include "engine.hpp"

#include <expected>
#include <memory>
#include <string>

struct whisper_context;

// whisper.cpp behind the SpeechEngine interface. Each call decodes into its
// own whisper_state, so the shared context is only read.
class WhisperEngine : public SpeechEngine {
public:
    struct Options {
        std::string model_path;
        bool use_gpu = true;
        int threads = 4;
        std::string vad_model_path; // whisper.cpp VAD needs its own model
        bool ffmpeg_fallback = true;
    };

    static std::expected<std::unique_ptr<WhisperEngine>, std::string> load(const Options& options);

    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    std::expected<EngineOutput, std::string>
        transcribe(const std::string& audio_path, const DecodeOptions& options) override;

private:
    WhisperEngine(whisper_context* ctx, Options options);

    whisper_context* ctx_;
    Options options_;
};
