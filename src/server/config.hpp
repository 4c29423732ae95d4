#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

struct Config {
    struct Server {
        std::string host = "0.0.0.0";
        int port = 8080;
        std::string log_level = "info";
        int threads = 8;
        int read_timeout_s = 600;
        int write_timeout_s = 600;
        std::string cors_origin = "*";
    } server;

    struct Auth {
        std::vector<std::string> allowed_api_keys;
    } auth;

    struct Model {
        std::string name = "small";
        std::string path;           // empty: <dir>/ggml-<name>.bin
        std::string dir = "models";
        std::string device = "auto"; // "auto", "cpu", "cuda"
        std::string compute_type = "int8";
        int threads = 4;
        int load_timeout_s = 120;
        bool serialize_inference = true;

        std::string model_file() const {
            if (!path.empty()) return path;
            return dir + "/ggml-" + name + ".bin";
        }
    } model;

    struct Transcription {
        std::string default_language = "it";
        float default_temperature = 0.0f;
        int default_beam_size = 5;
        bool vad_filter = true;
        std::string vad_model_path;
    } transcription;

    struct Upload {
        uint32_t max_file_size_mb = 25;
        std::vector<std::string> allowed_formats = {"mp3", "wav", "m4a", "ogg", "flac", "webm"};
        std::string temp_dir;       // empty: $TMPDIR or /tmp
        bool ffmpeg_fallback = true;

        uint64_t max_file_size_bytes() const {
            return static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024;
        }
    } upload;

    using EnvLookup = std::function<const char*(const char*)>;

    static Config load(const std::string& path);
    static Config load_default();

    // Environment variables override file values (HOST, PORT, WHISPER_MODEL, ...).
    void apply_env(const EnvLookup& lookup);
    void apply_env();
};

// Splits "a, b,,c" into {"a", "b", "c"}, optionally lowercasing.
std::vector<std::string> split_list(const std::string& s, bool lowercase = false);
