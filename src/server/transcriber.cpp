#include "transcriber.hpp"

#include "log.hpp"

#include <chrono>
#include <stdexcept>

namespace {

constexpr const char* whitespace = " \t\n\r\v\f";

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(whitespace);
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(whitespace);
    return s.substr(start, end - start + 1);
}

TranscribeError inference_error(const std::string& what) {
    return TranscribeError{
        .kind = ErrorKind::InferenceError,
        .detail = "Transcription failed: " + what,
    };
}

} // namespace

EffectiveParams resolve_params(const TranscribeParams& params, const Config::Transcription& defaults) {
    EffectiveParams eff;
    eff.language = params.language && !params.language->empty() ? *params.language
                                                                : defaults.default_language;
    eff.temperature = params.temperature.value_or(defaults.default_temperature);
    eff.beam_size = params.beam_size.value_or(defaults.default_beam_size);
    eff.initial_prompt = params.initial_prompt.value_or("");
    eff.include_segments = params.include_segments;
    eff.vad_filter = defaults.vad_filter;
    return eff;
}

Transcriber::Transcriber(bool serialize)
    : serialize_(serialize) {}

std::expected<Transcript, TranscribeError>
Transcriber::run(SpeechEngine& engine, const std::string& audio_path, const EffectiveParams& params) {
    std::unique_lock lock(engine_mutex_, std::defer_lock);
    if (serialize_) lock.lock();

    logging::debug("transcriber: {} (language={}, temperature={}, beam_size={})",
                   audio_path, params.language, params.temperature, params.beam_size);

    DecodeOptions options{
        .language = params.language,
        .temperature = params.temperature,
        .beam_size = params.beam_size,
        .initial_prompt = params.initial_prompt,
        .vad_filter = params.vad_filter,
    };

    auto start = std::chrono::steady_clock::now();
    Transcript transcript;

    try {
        auto output = engine.transcribe(audio_path, options);
        if (!output) return std::unexpected(inference_error(output.error()));

        std::string text;
        size_t count = 0;
        if (params.include_segments) transcript.segments.emplace();

        if (output->segments) {
            while (auto seg = output->segments->next()) {
                auto seg_text = trim(seg->text);
                if (count++ > 0) text += ' ';
                text += seg_text;

                if (params.include_segments) {
                    transcript.segments->push_back(Segment{
                        .id = seg->id,
                        .start = seg->start,
                        .end = seg->end,
                        .text = std::move(seg_text),
                    });
                }
            }
        }

        transcript.text = std::move(text);
        transcript.language = output->language.empty() ? params.language : output->language;
    } catch (const std::exception& e) {
        return std::unexpected(inference_error(e.what()));
    }

    transcript.inference_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return transcript;
}
