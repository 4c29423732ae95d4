#include "api.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

using json = nlohmann::json;

namespace api {

namespace {

const std::vector<std::string> available_models = {"tiny", "base", "small", "medium", "large"};

std::optional<bool> parse_bool(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return std::nullopt;
}

template <typename T>
std::optional<T> parse_number(const std::string& s) {
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

} // namespace

AuthResult check_api_key(const std::string& key, const std::vector<std::string>& allowed) {
    if (key.empty()) return AuthResult::Missing;
    if (std::ranges::find(allowed, key) == allowed.end()) return AuthResult::Invalid;
    return AuthResult::Ok;
}

std::expected<TranscribeParams, std::string> parse_params(const QueryLookup& query) {
    TranscribeParams params;

    if (auto v = query("language"); v && !v->empty()) {
        params.language = *v;
    }

    if (auto v = query("temperature"); v && !v->empty()) {
        auto t = parse_number<float>(*v);
        if (!t) return std::unexpected(std::format("temperature: '{}' is not a number", *v));
        if (!(*t >= 0.0f && *t <= 1.0f)) {
            return std::unexpected(std::format("temperature: {} is outside [0, 1]", *t));
        }
        params.temperature = *t;
    }

    if (auto v = query("beam_size"); v && !v->empty()) {
        auto b = parse_number<int>(*v);
        if (!b) return std::unexpected(std::format("beam_size: '{}' is not an integer", *v));
        if (*b < 1 || *b > 10) {
            return std::unexpected(std::format("beam_size: {} is outside [1, 10]", *b));
        }
        params.beam_size = *b;
    }

    if (auto v = query("initial_prompt"); v && !v->empty()) {
        params.initial_prompt = *v;
    }

    if (auto v = query("include_segments"); v && !v->empty()) {
        auto b = parse_bool(*v);
        if (!b) return std::unexpected(std::format("include_segments: '{}' is not a boolean", *v));
        params.include_segments = *b;
    }

    return params;
}

json to_json(const TranscriptionResult& result) {
    json j = {
        {"text", result.text},
        {"language", result.language},
        {"duration_seconds", result.duration_s},
    };

    if (result.segments) {
        j["segments"] = json::array();
        for (auto& s : *result.segments) {
            j["segments"].push_back({
                {"id", s.id},
                {"start", s.start},
                {"end", s.end},
                {"text", s.text},
            });
        }
    }
    return j;
}

json error_json(std::string_view error, const std::string& detail, const std::string& request_id) {
    return {
        {"error", std::string(error)},
        {"detail", detail},
        {"request_id", request_id},
    };
}

json health_json(const HealthInfo& info) {
    json j = {
        {"status", info.model.engine_loaded ? "healthy" : "degraded"},
        {"model", info.model_name},
        {"device", info.device},
        {"compute_type", info.compute_type},
        {"model_state", std::string(load_state_name(info.model.state))},
        {"version", info.version},
    };
    if (info.model.state == LoadState::Failed) {
        j["error"] = info.model.error;
    }
    return j;
}

json models_json(const std::string& active) {
    return {
        {"models", available_models},
        {"active", active},
    };
}

} // namespace api
