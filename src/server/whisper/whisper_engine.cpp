#include "whisper_engine.hpp"

#include "../log.hpp"
#include "audio_decoder.hpp"

#include <filesystem>
#include <string_view>
#include <whisper.h>

namespace {

void whisper_log_to_debug(enum ggml_log_level level, const char* text, void*) {
    if (!text) return;
    std::string_view msg(text);
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) msg.remove_suffix(1);
    if (msg.empty()) return;

    if (level == GGML_LOG_LEVEL_ERROR) {
        logging::error("whisper: {}", msg);
    } else {
        logging::debug("whisper: {}", msg);
    }
}

struct StateDeleter {
    void operator()(whisper_state* state) const { whisper_free_state(state); }
};

using StatePtr = std::unique_ptr<whisper_state, StateDeleter>;

// Walks the segments of one finished whisper_full run.
class WhisperSegmentStream : public SegmentStream {
public:
    explicit WhisperSegmentStream(StatePtr state)
        : state_(std::move(state)), count_(whisper_full_n_segments_from_state(state_.get())) {}

    std::optional<EngineSegment> next() override {
        if (index_ >= count_) return std::nullopt;

        int i = index_++;
        const char* text = whisper_full_get_segment_text_from_state(state_.get(), i);
        return EngineSegment{
            .id = i,
            // whisper timestamps are in units of 10 ms
            .start = whisper_full_get_segment_t0_from_state(state_.get(), i) * 0.01,
            .end = whisper_full_get_segment_t1_from_state(state_.get(), i) * 0.01,
            .text = text ? text : "",
        };
    }

private:
    StatePtr state_;
    int count_;
    int index_ = 0;
};

class EmptySegmentStream : public SegmentStream {
public:
    std::optional<EngineSegment> next() override { return std::nullopt; }
};

} // namespace

std::expected<std::unique_ptr<WhisperEngine>, std::string>
WhisperEngine::load(const Options& options) {
    whisper_log_set(whisper_log_to_debug, nullptr);

    std::error_code ec;
    if (!std::filesystem::exists(options.model_path, ec)) {
        return std::unexpected("model file not found: " + options.model_path);
    }

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = options.use_gpu;

    whisper_context* ctx = whisper_init_from_file_with_params_no_state(options.model_path.c_str(), cparams);
    if (!ctx) {
        return std::unexpected("whisper.cpp could not load " + options.model_path);
    }

    logging::info("whisper: loaded {} ({}, gpu {})", options.model_path,
                  whisper_is_multilingual(ctx) ? "multilingual" : "english-only",
                  options.use_gpu ? "on" : "off");

    return std::unique_ptr<WhisperEngine>(new WhisperEngine(ctx, options));
}

WhisperEngine::WhisperEngine(whisper_context* ctx, Options options)
    : ctx_(ctx), options_(std::move(options)) {}

WhisperEngine::~WhisperEngine() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

std::expected<EngineOutput, std::string>
WhisperEngine::transcribe(const std::string& audio_path, const DecodeOptions& options) {
    auto pcm = audio::load_pcm_mono_16k(audio_path, options_.ffmpeg_fallback);
    if (!pcm) return std::unexpected(pcm.error());

    std::string language = options.language.empty() ? "auto" : options.language;
    if (language != "auto" && whisper_lang_id(language.c_str()) < 0) {
        return std::unexpected("unknown language: " + language);
    }

    if (pcm->empty()) {
        return EngineOutput{
            .language = language == "auto" ? "" : language,
            .segments = std::make_unique<EmptySegmentStream>(),
        };
    }

    StatePtr state(whisper_init_state(ctx_));
    if (!state) return std::unexpected(std::string("could not allocate whisper state"));

    auto strategy = options.beam_size > 1 ? WHISPER_SAMPLING_BEAM_SEARCH : WHISPER_SAMPLING_GREEDY;
    whisper_full_params wparams = whisper_full_default_params(strategy);

    wparams.n_threads = options_.threads;
    wparams.print_progress = false;
    wparams.print_realtime = false;
    wparams.print_timestamps = false;
    wparams.print_special = false;
    wparams.translate = false;
    wparams.language = language.c_str();
    wparams.detect_language = false;
    wparams.temperature = options.temperature;
    wparams.temperature_inc = 0.0f; // single temperature, no fallback ladder
    wparams.beam_search.beam_size = options.beam_size;
    if (!options.initial_prompt.empty()) {
        wparams.initial_prompt = options.initial_prompt.c_str();
    }

    if (options.vad_filter && !options_.vad_model_path.empty()) {
        wparams.vad = true;
        wparams.vad_model_path = options_.vad_model_path.c_str();
    }

    int rc = whisper_full_with_state(ctx_, state.get(), wparams, pcm->data(), static_cast<int>(pcm->size()));
    if (rc != 0) {
        return std::unexpected("whisper_full failed with code " + std::to_string(rc));
    }

    std::string detected;
    int lang_id = whisper_full_lang_id_from_state(state.get());
    if (lang_id >= 0) {
        if (const char* name = whisper_lang_str(lang_id)) detected = name;
    }

    return EngineOutput{
        .language = std::move(detected),
        .segments = std::make_unique<WhisperSegmentStream>(std::move(state)),
    };
}
