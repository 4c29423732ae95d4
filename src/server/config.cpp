#include "config.hpp"

#include "log.hpp"
#include "paths.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string_view>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::vector<std::string> split_list(const std::string& s, bool lowercase) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        auto end = s.find(',', start);
        if (end == std::string::npos) end = s.size();

        auto item = s.substr(start, end - start);
        auto first = item.find_first_not_of(" \t\n\r");
        if (first != std::string::npos) {
            auto last = item.find_last_not_of(" \t\n\r");
            item = item.substr(first, last - first + 1);
            if (lowercase) {
                std::transform(item.begin(), item.end(), item.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            }
            out.push_back(std::move(item));
        }
        start = end + 1;
    }
    return out;
}

namespace {

// Accepts either a JSON array of strings or a comma-separated string.
std::vector<std::string> read_list(const json& j, bool lowercase) {
    if (j.is_string()) return split_list(j.get<std::string>(), lowercase);

    std::vector<std::string> out;
    for (auto& item : j) {
        auto joined = split_list(item.get<std::string>(), lowercase);
        out.insert(out.end(), joined.begin(), joined.end());
    }
    return out;
}

template <typename T>
std::optional<T> parse_number(std::string_view s) {
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

std::optional<bool> parse_bool(std::string_view s) {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

bool valid_port(int port) {
    return port > 0 && port <= 65535;
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        logging::warn("config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("server")) {
            auto& s = j["server"];
            if (s.contains("host")) cfg.server.host = s["host"].get<std::string>();
            if (s.contains("port")) {
                int port = s["port"].get<int>();
                if (valid_port(port)) {
                    cfg.server.port = port;
                } else {
                    logging::warn("config: server.port {} out of range, using {}", port, cfg.server.port);
                }
            }
            if (s.contains("log_level")) cfg.server.log_level = s["log_level"].get<std::string>();
            if (s.contains("threads")) cfg.server.threads = s["threads"].get<int>();
            if (s.contains("read_timeout_s")) cfg.server.read_timeout_s = s["read_timeout_s"].get<int>();
            if (s.contains("write_timeout_s")) cfg.server.write_timeout_s = s["write_timeout_s"].get<int>();
            if (s.contains("cors_origin")) cfg.server.cors_origin = s["cors_origin"].get<std::string>();
        }

        if (j.contains("auth")) {
            auto& a = j["auth"];
            if (a.contains("allowed_api_keys")) cfg.auth.allowed_api_keys = read_list(a["allowed_api_keys"], false);
        }

        if (j.contains("model")) {
            auto& m = j["model"];
            if (m.contains("name")) cfg.model.name = m["name"].get<std::string>();
            if (m.contains("path")) cfg.model.path = m["path"].get<std::string>();
            if (m.contains("dir")) cfg.model.dir = m["dir"].get<std::string>();
            if (m.contains("device")) cfg.model.device = m["device"].get<std::string>();
            if (m.contains("compute_type")) cfg.model.compute_type = m["compute_type"].get<std::string>();
            if (m.contains("threads")) cfg.model.threads = m["threads"].get<int>();
            if (m.contains("load_timeout_s")) cfg.model.load_timeout_s = m["load_timeout_s"].get<int>();
            if (m.contains("serialize_inference")) cfg.model.serialize_inference = m["serialize_inference"].get<bool>();
        }

        if (j.contains("transcription")) {
            auto& t = j["transcription"];
            if (t.contains("default_language")) cfg.transcription.default_language = t["default_language"].get<std::string>();
            if (t.contains("default_temperature")) cfg.transcription.default_temperature = t["default_temperature"].get<float>();
            if (t.contains("default_beam_size")) cfg.transcription.default_beam_size = t["default_beam_size"].get<int>();
            if (t.contains("vad_filter")) cfg.transcription.vad_filter = t["vad_filter"].get<bool>();
            if (t.contains("vad_model_path")) cfg.transcription.vad_model_path = t["vad_model_path"].get<std::string>();
        }

        if (j.contains("upload")) {
            auto& u = j["upload"];
            if (u.contains("max_file_size_mb")) cfg.upload.max_file_size_mb = u["max_file_size_mb"].get<uint32_t>();
            if (u.contains("allowed_formats")) cfg.upload.allowed_formats = read_list(u["allowed_formats"], true);
            if (u.contains("temp_dir")) cfg.upload.temp_dir = u["temp_dir"].get<std::string>();
            if (u.contains("ffmpeg_fallback")) cfg.upload.ffmpeg_fallback = u["ffmpeg_fallback"].get<bool>();
        }

    } catch (const json::exception& e) {
        logging::error("config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

void Config::apply_env() {
    apply_env([](const char* name) -> const char* { return std::getenv(name); });
}

void Config::apply_env(const EnvLookup& lookup) {
    auto str = [&](const char* name, std::string& dst) {
        if (const char* v = lookup(name)) dst = v;
    };
    auto num = [&]<typename T>(const char* name, T& dst) {
        const char* v = lookup(name);
        if (!v) return;
        if (auto parsed = parse_number<T>(v)) {
            dst = *parsed;
        } else {
            logging::warn("config: ignoring {}={}, not a number", name, v);
        }
    };
    auto flag = [&](const char* name, bool& dst) {
        const char* v = lookup(name);
        if (!v) return;
        if (auto parsed = parse_bool(v)) {
            dst = *parsed;
        } else {
            logging::warn("config: ignoring {}={}, not a boolean", name, v);
        }
    };

    str("HOST", server.host);
    int port = server.port;
    num("PORT", port);
    if (valid_port(port)) {
        server.port = port;
    } else {
        logging::warn("config: ignoring PORT={}, out of range", port);
    }
    str("LOG_LEVEL", server.log_level);
    num("SERVER_THREADS", server.threads);
    str("CORS_ORIGIN", server.cors_origin);

    if (const char* v = lookup("ALLOWED_API_KEYS")) auth.allowed_api_keys = split_list(v);

    str("WHISPER_MODEL", model.name);
    str("WHISPER_MODEL_PATH", model.path);
    str("WHISPER_MODEL_DIR", model.dir);
    str("WHISPER_DEVICE", model.device);
    str("WHISPER_COMPUTE_TYPE", model.compute_type);
    num("WHISPER_THREADS", model.threads);
    num("MODEL_LOAD_TIMEOUT_S", model.load_timeout_s);

    str("DEFAULT_LANGUAGE", transcription.default_language);
    num("DEFAULT_TEMPERATURE", transcription.default_temperature);
    num("DEFAULT_BEAM_SIZE", transcription.default_beam_size);
    flag("ENABLE_VAD_FILTER", transcription.vad_filter);
    str("WHISPER_VAD_MODEL_PATH", transcription.vad_model_path);

    num("MAX_FILE_SIZE_MB", upload.max_file_size_mb);
    if (const char* v = lookup("ALLOWED_AUDIO_FORMATS")) upload.allowed_formats = split_list(v, true);
    str("TRANSCRIBE_TMPDIR", upload.temp_dir);
}
