#include "http_server.hpp"

#include "api.hpp"
#include "log.hpp"
#include "request_id.hpp"
#include "upload.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

constexpr const char* transcribe_path = "/api/v1/transcribe";

// Feeds the "file" part of a multipart/form-data body to the ingestor as it
// arrives off the socket. Other parts are skipped.
class MultipartUploadSource : public UploadSource {
public:
    explicit MultipartUploadSource(const httplib::ContentReader& reader)
        : reader_(reader) {}

    bool read(const BeginHandler& on_begin, const ChunkHandler& on_chunk) override {
        bool in_file = false;
        bool seen_file = false;

        return reader_(
            [&](const httplib::MultipartFormData& part) {
                in_file = part.name == "file" && !seen_file;
                if (!in_file) return true;
                seen_file = true;
                return on_begin(part.filename);
            },
            [&](const char* data, size_t len) {
                if (!in_file) return true;
                return on_chunk(data, len);
            });
    }

private:
    const httplib::ContentReader& reader_;
};

std::string dump(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

HttpServer::HttpServer(Config config, RequestOrchestrator& orchestrator, ModelManager& models)
    : config_(std::move(config)), orchestrator_(orchestrator), models_(models) {
    int threads = config_.server.threads > 0 ? config_.server.threads : 1;
    server_.new_task_queue = [threads] { return new httplib::ThreadPool(static_cast<size_t>(threads)); };

    server_.set_read_timeout(config_.server.read_timeout_s, 0);
    server_.set_write_timeout(config_.server.write_timeout_s, 0);

    server_.set_default_headers({
        {"Access-Control-Allow-Origin", config_.server.cors_origin},
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type, X-API-Key"},
    });

    server_.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    server_.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });

    server_.Get("/api/v1/models", [this](const httplib::Request& req, httplib::Response& res) {
        handle_models(req, res);
    });

    server_.Post(transcribe_path, [this](const httplib::Request& req, httplib::Response& res,
                                         const httplib::ContentReader& content_reader) {
        handle_transcribe(req, res, content_reader);
    });

    server_.set_exception_handler([this](const httplib::Request& req, httplib::Response& res,
                                         std::exception_ptr ep) {
        std::string detail;
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            detail = e.what();
        } catch (...) {
            detail = "unknown exception";
        }
        logging::error("http: {} {} failed: {}", req.method, req.path, detail);
        send_error(res, 500, "internal_error", "Transcription failed: " + detail, generate_request_id());
    });
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::bind(const std::string& host, int port) {
    if (!server_.bind_to_port(host, port)) {
        logging::error("http: could not bind to {}:{}", host, port);
        return false;
    }
    return true;
}

int HttpServer::bind_any(const std::string& host) {
    return server_.bind_to_any_port(host);
}

bool HttpServer::listen() {
    return server_.listen_after_bind();
}

void HttpServer::stop() {
    if (server_.is_running()) server_.stop();
}

bool HttpServer::wait_until_ready() const {
    server_.wait_until_ready();
    return server_.is_running();
}

void HttpServer::handle_health(const httplib::Request&, httplib::Response& res) {
    api::HealthInfo info{
        .model = models_.status(),
        .model_name = config_.model.name,
        .device = config_.model.device,
        .compute_type = config_.model.compute_type,
        .version = TRANSCRIBE_VERSION,
    };
    res.set_content(dump(api::health_json(info)), "application/json");
}

void HttpServer::handle_models(const httplib::Request&, httplib::Response& res) {
    res.set_content(dump(api::models_json(config_.model.name)), "application/json");
}

void HttpServer::handle_transcribe(const httplib::Request& req, httplib::Response& res,
                                   const httplib::ContentReader& content_reader) {
    auto request_id = generate_request_id();

    switch (api::check_api_key(req.get_header_value("X-API-Key"), config_.auth.allowed_api_keys)) {
        case api::AuthResult::Ok:
            break;
        case api::AuthResult::Missing:
            res.set_header("WWW-Authenticate", "ApiKey");
            send_error(res, 401, "unauthorized", "Missing X-API-Key header", request_id);
            return;
        case api::AuthResult::Invalid:
            send_error(res, 403, "forbidden", "Invalid API key", request_id);
            return;
    }

    auto params = api::parse_params([&req](const std::string& name) -> std::optional<std::string> {
        if (!req.has_param(name)) return std::nullopt;
        return req.get_param_value(name);
    });
    if (!params) {
        send_error(res, 422, "invalid_parameter", params.error(), request_id);
        return;
    }

    logging::info("request {}: transcription request from {} (language={})", request_id,
                  req.remote_addr, params->language.value_or("default"));

    if (!req.is_multipart_form_data()) {
        send_error(res, http_status(ErrorKind::MissingFile), error_kind_name(ErrorKind::MissingFile),
                   "No file uploaded", request_id);
        return;
    }

    MultipartUploadSource source(content_reader);
    auto result = orchestrator_.handle(source, *params, request_id);
    if (!result) {
        auto& err = result.error();
        if (err.retryable) res.set_header("Retry-After", "30");
        send_error(res, http_status(err.kind), error_kind_name(err.kind), err.detail, request_id);
        return;
    }

    res.set_content(dump(api::to_json(*result)), "application/json");
}

void HttpServer::send_error(httplib::Response& res, int status, std::string_view error,
                            const std::string& detail, const std::string& request_id) {
    res.status = status;
    res.set_header("Connection", "close");
    res.set_content(dump(api::error_json(error, detail, request_id)), "application/json");
}
