#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "orchestrator.hpp"

#include <filesystem>
#include <fstream>
#include <future>
#include <sstream>
#include <string>

using namespace std::chrono_literals;

namespace {

// Wires an orchestrator to a fake engine and a private temp directory.
struct Harness {
    TmpDir dir;
    Config config;
    std::unique_ptr<FakeEngine> pending = std::make_unique<FakeEngine>();
    FakeEngine& engine = *pending;
    std::string load_error;

    ModelManager models{[this]() -> std::expected<std::unique_ptr<SpeechEngine>, std::string> {
        if (!load_error.empty()) return std::unexpected(load_error);
        return std::unique_ptr<SpeechEngine>(std::move(pending));
    }};
    std::unique_ptr<UploadIngestor> ingestor;
    std::unique_ptr<Transcriber> transcriber;
    std::unique_ptr<RequestOrchestrator> orchestrator;

    explicit Harness(uint64_t max_bytes = 1024 * 1024) {
        config.model.load_timeout_s = 5;
        config.transcription.default_language = "it";
        ingestor = std::make_unique<UploadIngestor>(UploadLimits{
            .max_bytes = max_bytes,
            .allowed_formats = config.upload.allowed_formats,
            .temp_dir = dir.path.string(),
        });
        transcriber = std::make_unique<Transcriber>(true);
        rebuild();
    }

    // Picks up changes made to config.
    void rebuild() {
        orchestrator = std::make_unique<RequestOrchestrator>(config, *ingestor, models, *transcriber);
    }

    std::expected<TranscriptionResult, TranscribeError>
    submit(const std::string& filename, const std::string& content, const TranscribeParams& params = {}) {
        std::istringstream in(content);
        StreamUploadSource source(in, filename);
        return orchestrator->handle(source, params, "test-request");
    }
};

} // namespace

TEST_CASE("RequestOrchestrator success", "[orchestrator]") {
    Harness h;
    h.engine.segments = {
        {.id = 0, .start = 0.0, .end = 1.0, .text = " Buongiorno"},
        {.id = 1, .start = 1.0, .end = 2.5, .text = " a tutti."},
    };

    SECTION("TranscribesAndCleansUp") {
        auto result = h.submit("meeting.wav", "RIFFfakewav");
        REQUIRE(result);
        REQUIRE(result->text == "Buongiorno a tutti.");
        REQUIRE(result->language == "it");
        REQUIRE(result->duration_s >= 0.0);
        REQUIRE_FALSE(result->segments);

        // The engine saw the stored upload; it is gone afterwards.
        REQUIRE(h.engine.file_existed);
        REQUIRE(h.engine.file_size == 11);
        REQUIRE(std::filesystem::path(h.engine.last_path).parent_path() == h.dir.path);
        REQUIRE_FALSE(std::filesystem::exists(h.engine.last_path));
        REQUIRE(h.dir.file_count() == 0);
        REQUIRE(h.orchestrator->cleanup_failures() == 0);
    }

    SECTION("SegmentsOnRequest") {
        TranscribeParams params{.include_segments = true};
        auto result = h.submit("meeting.mp3", "ID3data", params);
        REQUIRE(result);
        REQUIRE(result->segments);
        REQUIRE(result->segments->size() == 2);
        REQUIRE((*result->segments)[0].text == "Buongiorno");
        REQUIRE((*result->segments)[1].end == 2.5);
    }

    SECTION("DefaultsFillUnsetParams") {
        h.config.transcription.default_beam_size = 3;
        h.config.transcription.default_temperature = 0.1f;
        h.rebuild();

        REQUIRE(h.submit("a.ogg", "OggS"));
        REQUIRE(h.engine.last_options.language == "it");
        REQUIRE(h.engine.last_options.beam_size == 3);
        REQUIRE(h.engine.last_options.temperature == 0.1f);
    }

    SECTION("ExplicitParamsReachEngine") {
        TranscribeParams params{
            .language = "en",
            .temperature = 0.5f,
            .beam_size = 1,
            .initial_prompt = "Acme Corp",
        };
        REQUIRE(h.submit("a.flac", "fLaC", params));
        REQUIRE(h.engine.last_options.language == "en");
        REQUIRE(h.engine.last_options.temperature == 0.5f);
        REQUIRE(h.engine.last_options.beam_size == 1);
        REQUIRE(h.engine.last_options.initial_prompt == "Acme Corp");
    }

    SECTION("ModelLoadedOnceAcrossRequests") {
        REQUIRE(h.submit("a.wav", "one"));
        REQUIRE(h.submit("b.wav", "two"));
        REQUIRE(h.engine.calls == 2);
        REQUIRE(h.models.status().state == LoadState::Ready);
    }
}

TEST_CASE("RequestOrchestrator rejections", "[orchestrator]") {

    SECTION("UnsupportedFormatNeverReachesModel") {
        Harness h;
        auto result = h.submit("notes.xyz", "whatever");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().kind == ErrorKind::UnsupportedFormat);
        REQUIRE(h.dir.file_count() == 0);
        REQUIRE(h.engine.calls == 0);
        REQUIRE(h.models.status().state == LoadState::Uninitialized);
    }

    SECTION("OversizeUpload") {
        Harness h(16);
        auto result = h.submit("long.wav", std::string(17, 'a'));
        REQUIRE_FALSE(result);
        REQUIRE(result.error().kind == ErrorKind::FileTooLarge);
        REQUIRE(http_status(result.error().kind) == 413);
        REQUIRE(h.dir.file_count() == 0);
        REQUIRE(h.engine.calls == 0);
    }

    SECTION("ModelFailedToLoad") {
        Harness h;
        h.load_error = "model file not found: models/ggml-small.bin";

        auto result = h.submit("a.wav", "data");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().kind == ErrorKind::ModelUnavailable);
        REQUIRE(result.error().detail == "Model failed to load: model file not found: models/ggml-small.bin");
        REQUIRE_FALSE(result.error().retryable);
        REQUIRE(http_status(result.error().kind) == 503);
        REQUIRE(h.dir.file_count() == 0);
    }

    SECTION("ModelStillLoading") {
        Harness h;
        std::promise<void> gate;
        auto opened = gate.get_future().share();
        ModelManager slow([opened]() -> std::expected<std::unique_ptr<SpeechEngine>, std::string> {
            opened.wait_for(10s);
            return std::make_unique<FakeEngine>();
        });
        h.config.model.load_timeout_s = 0;
        RequestOrchestrator orchestrator(h.config, *h.ingestor, slow, *h.transcriber);

        std::istringstream in("data");
        StreamUploadSource source(in, "a.wav");
        auto result = orchestrator.handle(source, {}, "slow-request");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().kind == ErrorKind::ModelUnavailable);
        REQUIRE(result.error().retryable);
        REQUIRE(h.dir.file_count() == 0);

        gate.set_value();
    }

    SECTION("InferenceFailureStillCleansUp") {
        Harness h;
        h.engine.error = "decoder crashed";

        auto result = h.submit("a.wav", "data");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().kind == ErrorKind::InferenceError);
        REQUIRE(result.error().detail == "Transcription failed: decoder crashed");
        REQUIRE(h.engine.file_existed);
        REQUIRE(h.dir.file_count() == 0);
    }
}

TEST_CASE("RequestOrchestrator cleanup failure", "[orchestrator]") {
    Harness h;
    // Replace the upload with a non-empty directory so removal fails.
    h.engine.on_call = [](const std::string& path) {
        std::filesystem::remove(path);
        std::filesystem::create_directory(path);
        std::ofstream(std::filesystem::path(path) / "pin") << "x";
    };
    h.engine.segments = {{.id = 0, .text = "still fine"}};

    auto result = h.submit("a.wav", "data");
    REQUIRE(result);
    REQUIRE(result->text == "still fine");
    REQUIRE(h.orchestrator->cleanup_failures() == 1);
}
