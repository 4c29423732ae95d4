#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

struct TranscribeRequest {
    std::string file_path;
    std::optional<std::string> language;
    std::optional<float> temperature;
    std::optional<int> beam_size;
    std::optional<std::string> initial_prompt;
    bool include_segments = false;
};

// A server reply: HTTP status plus the decoded JSON body.
struct ApiResponse {
    long status = 0;
    nlohmann::json body;
};

class TranscribeClient {
public:
    TranscribeClient(std::string base_url, std::string api_key);
    ~TranscribeClient();

    TranscribeClient(const TranscribeClient&) = delete;
    TranscribeClient& operator=(const TranscribeClient&) = delete;

    std::expected<ApiResponse, std::string> transcribe(const TranscribeRequest& request);
    std::expected<ApiResponse, std::string> health();
    std::expected<ApiResponse, std::string> models();

    // Downloads ggml-<name>.bin from the whisper.cpp model repository into dir.
    // Returns the path of the written file.
    static std::expected<std::string, std::string> download_model(const std::string& name,
                                                                  const std::string& dir);

    // Builds "<base>/api/v1/transcribe?language=..&..." with escaped values.
    std::string transcribe_url(const TranscribeRequest& request) const;

private:
    std::expected<ApiResponse, std::string> get(const std::string& path);

    std::string base_url_;
    std::string api_key_;
};
