#include "transcribe_client.hpp"

#include <charconv>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  file <path>          Transcribe an audio file");
    std::println(stderr, "      --language L     Language code (default: server setting)");
    std::println(stderr, "      --temperature T  Sampling temperature, 0..1");
    std::println(stderr, "      --beam-size N    Beam size, 1..10");
    std::println(stderr, "      --prompt TEXT    Initial prompt");
    std::println(stderr, "      --segments       Print timestamped segments");
    std::println(stderr, "  health               Show server and model status");
    std::println(stderr, "  models               List available models");
    std::println(stderr, "  download <name>      Fetch ggml-<name>.bin [--dir DIR, default models]");
    std::println(stderr, "Global options:");
    std::println(stderr, "  --url URL            Server URL (env TRANSCRIBE_URL, default http://localhost:8080)");
    std::println(stderr, "  --api-key KEY        API key (env TRANSCRIBE_API_KEY)");
}

static std::string env_or(const char* name, const char* fallback) {
    const char* v = std::getenv(name);
    return v && *v ? v : fallback;
}

template <typename T>
static bool parse_number(const std::string& s, T& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

static int print_error(const ApiResponse& resp) {
    std::println(stderr, "Error ({}): {}", resp.status,
                 resp.body.value("detail", resp.body.dump()));
    if (resp.body.contains("request_id")) {
        std::println(stderr, "Request ID: {}", resp.body["request_id"].get<std::string>());
    }
    return 1;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string url = env_or("TRANSCRIBE_URL", "http://localhost:8080");
    std::string api_key = env_or("TRANSCRIBE_API_KEY", "");
    std::string positional;
    std::string dir = "models";
    TranscribeRequest request;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--url" && has_value) {
            url = argv[++i];
        } else if (arg == "--api-key" && has_value) {
            api_key = argv[++i];
        } else if (arg == "--language" && has_value) {
            request.language = argv[++i];
        } else if (arg == "--temperature" && has_value) {
            float t = 0.0f;
            if (!parse_number(argv[++i], t)) {
                std::println(stderr, "Invalid temperature: {}", argv[i]);
                return 1;
            }
            request.temperature = t;
        } else if (arg == "--beam-size" && has_value) {
            int b = 0;
            if (!parse_number(argv[++i], b)) {
                std::println(stderr, "Invalid beam size: {}", argv[i]);
                return 1;
            }
            request.beam_size = b;
        } else if (arg == "--prompt" && has_value) {
            request.initial_prompt = argv[++i];
        } else if (arg == "--segments") {
            request.include_segments = true;
        } else if (arg == "--dir" && has_value) {
            dir = argv[++i];
        } else if (positional.empty() && !arg.starts_with("--")) {
            positional = arg;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    if (command == "download") {
        if (positional.empty()) {
            std::println(stderr, "download: model name required (tiny, base, small, medium, large-v3, ...)");
            return 1;
        }
        std::println(stderr, "Downloading ggml-{}.bin into {} ...", positional, dir);
        auto path = TranscribeClient::download_model(positional, dir);
        if (!path) {
            std::println(stderr, "Error: {}", path.error());
            return 1;
        }
        std::println("{}", *path);
        return 0;
    }

    TranscribeClient client(url, api_key);

    if (command == "health") {
        auto resp = client.health();
        if (!resp) {
            std::println(stderr, "Failed to reach server at {}: {}", url, resp.error());
            return 1;
        }
        auto& b = resp->body;
        std::println("Status:  {}", b.value("status", "unknown"));
        std::println("Model:   {} ({})", b.value("model", ""), b.value("model_state", ""));
        std::println("Device:  {}", b.value("device", ""));
        std::println("Version: {}", b.value("version", ""));
        if (b.contains("error")) std::println("Error:   {}", b["error"].get<std::string>());
        return b.value("status", "") == "healthy" ? 0 : 2;
    }

    if (command == "models") {
        auto resp = client.models();
        if (!resp) {
            std::println(stderr, "Failed to reach server at {}: {}", url, resp.error());
            return 1;
        }
        auto active = resp->body.value("active", "");
        for (auto& m : resp->body.value("models", json::array())) {
            auto name = m.get<std::string>();
            std::println("{} {}", name == active ? "*" : " ", name);
        }
        return 0;
    }

    if (command == "file") {
        if (positional.empty()) {
            std::println(stderr, "file: path required");
            return 1;
        }
        request.file_path = positional;

        auto resp = client.transcribe(request);
        if (!resp) {
            std::println(stderr, "Failed to reach server at {}: {}", url, resp.error());
            return 1;
        }
        if (resp->status != 200) return print_error(*resp);

        auto& b = resp->body;
        if (request.include_segments && b.contains("segments")) {
            for (auto& s : b["segments"]) {
                std::println("[{:8.2f} -> {:8.2f}] {}", s.value("start", 0.0), s.value("end", 0.0),
                             s.value("text", ""));
            }
        } else {
            std::println("{}", b.value("text", ""));
        }
        std::println(stderr, "language: {}, {:.2f}s", b.value("language", ""),
                     b.value("duration_seconds", 0.0));
        return 0;
    }

    std::println(stderr, "Unknown command: {}", command);
    usage(argv[0]);
    return 1;
}
