#include "config.hpp"
#include "http_server.hpp"
#include "log.hpp"
#include "model_manager.hpp"
#include "orchestrator.hpp"
#include "transcriber.hpp"
#include "upload.hpp"
#include "whisper/whisper_engine.hpp"

#include <charconv>
#include <pthread.h>
#include <print>
#include <signal.h>
#include <string>
#include <thread>

namespace {

void usage() {
    std::println("Usage: transcribed [options]");
    std::println("Options:");
    std::println("  -c, --config PATH   Config file path");
    std::println("      --host HOST     Listen address (overrides config)");
    std::println("      --port PORT     Listen port (overrides config)");
    std::println("  -v, --verbose       Debug logging");
    std::println("  -h, --help          Show this help");
}

WhisperEngine::Options engine_options(const Config& config) {
    return WhisperEngine::Options{
        .model_path = config.model.model_file(),
        .use_gpu = config.model.device != "cpu",
        .threads = config.model.threads,
        .vad_model_path = config.transcription.vad_model_path,
        .ffmpeg_fallback = config.upload.ffmpeg_fallback,
    };
}

} // namespace

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    std::string host_override;
    int port_override = 0;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--host") {
            if (i + 1 < argc) host_override = argv[++i];
        } else if (arg == "--port") {
            if (i + 1 < argc) {
                std::string v = argv[++i];
                auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), port_override);
                if (ec != std::errc() || ptr != v.data() + v.size()) {
                    std::println(stderr, "Invalid port: {}", v);
                    return 1;
                }
            }
        } else if (arg == "--help" || arg == "-h") {
            usage();
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage();
            return 1;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    config.apply_env();
    if (!host_override.empty()) config.server.host = host_override;
    if (port_override > 0) config.server.port = port_override;

    if (auto lvl = logging::parse_level(config.server.log_level)) {
        logging::set_level(*lvl);
    } else {
        logging::warn("config: unknown log level '{}', using info", config.server.log_level);
    }
    if (verbose) logging::set_level(logging::Level::Debug);

    if (config.auth.allowed_api_keys.empty()) {
        logging::warn("auth: no API keys configured, every transcription request will be rejected");
    }
    if (config.transcription.vad_filter && config.transcription.vad_model_path.empty()) {
        logging::warn("config: vad_filter is on but no VAD model is configured, VAD disabled");
    }

    // Handle SIGINT/SIGTERM on a dedicated thread; block them everywhere else.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &mask, nullptr);

    logging::info("Starting transcribe-service {} (model: {}, device: {}, compute: {})",
                  TRANSCRIBE_VERSION, config.model.name, config.model.device, config.model.compute_type);

    ModelManager models([options = engine_options(config)]()
                            -> std::expected<std::unique_ptr<SpeechEngine>, std::string> {
        auto engine = WhisperEngine::load(options);
        if (!engine) return std::unexpected(engine.error());
        return std::unique_ptr<SpeechEngine>(std::move(*engine));
    });

    UploadIngestor ingestor(UploadLimits{
        .max_bytes = config.upload.max_file_size_bytes(),
        .allowed_formats = config.upload.allowed_formats,
        .temp_dir = config.upload.temp_dir,
    });
    Transcriber transcriber(config.model.serialize_inference);
    RequestOrchestrator orchestrator(config, ingestor, models, transcriber);
    HttpServer server(config, orchestrator, models);

    if (!server.bind(config.server.host, config.server.port)) {
        return 1;
    }
    models.start_loading_async();

    std::jthread signal_waiter([&server, mask]() {
        int sig = 0;
        if (sigwait(&mask, &sig) == 0) {
            logging::info("Received signal {}, shutting down", sig);
        }
        server.stop();
    });

    logging::info("Listening on http://{}:{}", config.server.host, config.server.port);
    bool ok = server.listen();

    // Wake the signal thread if the listener stopped on its own.
    if (!ok) pthread_kill(signal_waiter.native_handle(), SIGTERM);
    signal_waiter.join();

    logging::info("Shutting down transcribe-service");
    return ok ? 0 : 1;
}
