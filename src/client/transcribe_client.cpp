#include "transcribe_client.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <curl/curl.h>
#include <filesystem>
#include <format>
#include <vector>

using json = nlohmann::json;
namespace fs = std::filesystem;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

static size_t file_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    return std::fwrite(ptr, size, nmemb, static_cast<FILE*>(userdata)) * size;
}

static std::expected<ApiResponse, std::string> parse_response(long status, const std::string& body) {
    try {
        return ApiResponse{
            .status = status,
            .body = json::parse(body),
        };
    } catch (const json::exception&) {
        return std::unexpected(std::format("HTTP {}: unexpected response: {}", status, body));
    }
}

TranscribeClient::TranscribeClient(std::string base_url, std::string api_key)
    : base_url_(std::move(base_url)), api_key_(std::move(api_key)) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

TranscribeClient::~TranscribeClient() {
    curl_global_cleanup();
}

std::string TranscribeClient::transcribe_url(const TranscribeRequest& request) const {
    std::string url = base_url_ + "/api/v1/transcribe";

    std::vector<std::pair<std::string, std::string>> query;
    if (request.language) query.emplace_back("language", *request.language);
    if (request.temperature) query.emplace_back("temperature", std::format("{}", *request.temperature));
    if (request.beam_size) query.emplace_back("beam_size", std::to_string(*request.beam_size));
    if (request.initial_prompt) query.emplace_back("initial_prompt", *request.initial_prompt);
    if (request.include_segments) query.emplace_back("include_segments", "true");

    char sep = '?';
    for (auto& [key, value] : query) {
        char* escaped = curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size()));
        url += sep;
        url += key + "=" + (escaped ? escaped : "");
        curl_free(escaped);
        sep = '&';
    }
    return url;
}

std::expected<ApiResponse, std::string> TranscribeClient::transcribe(const TranscribeRequest& request) {
    std::error_code ec;
    if (!fs::is_regular_file(request.file_path, ec)) {
        return std::unexpected("not a file: " + request.file_path);
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    // Stream the file from disk instead of loading it into memory.
    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_filedata(part, request.file_path.c_str());

    curl_slist* headers = nullptr;
    std::string key_header = "X-API-Key: " + api_key_;
    if (!api_key_.empty()) headers = curl_slist_append(headers, key_header.c_str());

    auto endpoint = transcribe_url(request);
    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 900L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    return parse_response(status, response_body);
}

std::expected<ApiResponse, std::string> TranscribeClient::health() {
    return get("/health");
}

std::expected<ApiResponse, std::string> TranscribeClient::models() {
    return get("/api/v1/models");
}

std::expected<ApiResponse, std::string> TranscribeClient::get(const std::string& path) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    auto endpoint = base_url_ + path;
    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 30L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    return parse_response(status, response_body);
}

std::expected<std::string, std::string>
TranscribeClient::download_model(const std::string& name, const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(std::format("cannot create {}: {}", dir, ec.message()));
    }

    auto target = fs::path(dir) / ("ggml-" + name + ".bin");
    auto partial = fs::path(target.string() + ".part");
    auto url = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-" + name + ".bin";

    FILE* out = std::fopen(partial.c_str(), "wb");
    if (!out) {
        return std::unexpected(std::format("cannot write {}: {}", partial.string(), std::strerror(errno)));
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        std::fclose(out);
        fs::remove(partial, ec);
        return std::unexpected("curl_easy_init failed");
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, file_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, out);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);

    bool closed = std::fclose(out) == 0;

    if (res != CURLE_OK || !closed) {
        fs::remove(partial, ec);
        if (res != CURLE_OK) {
            return std::unexpected(std::format("download of {} failed: {}", url, curl_easy_strerror(res)));
        }
        return std::unexpected(std::format("writing {} failed", partial.string()));
    }

    fs::rename(partial, target, ec);
    if (ec) {
        auto reason = ec.message();
        fs::remove(partial, ec);
        return std::unexpected(std::format("cannot move model into place: {}", reason));
    }
    return target.string();
}
