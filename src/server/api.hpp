#pragma once

#include "errors.hpp"
#include "model_manager.hpp"
#include "orchestrator.hpp"
#include "transcriber.hpp"

#include <expected>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// JSON shapes and request checks of the HTTP API, kept apart from the
// transport so they can be tested directly.
namespace api {

enum class AuthResult { Ok, Missing, Invalid };

AuthResult check_api_key(const std::string& key, const std::vector<std::string>& allowed);

// Returns the query value for a name, or nullopt if absent.
using QueryLookup = std::function<std::optional<std::string>(const std::string& name)>;

// Parses language, temperature, beam_size, initial_prompt and include_segments.
// The error is a human-readable reason for a 422 response.
std::expected<TranscribeParams, std::string> parse_params(const QueryLookup& query);

nlohmann::json to_json(const TranscriptionResult& result);

nlohmann::json error_json(std::string_view error, const std::string& detail,
                          const std::string& request_id);

struct HealthInfo {
    ModelStatus model;
    std::string model_name;
    std::string device;
    std::string compute_type;
    std::string version;
};

nlohmann::json health_json(const HealthInfo& info);

nlohmann::json models_json(const std::string& active);

} // namespace api
