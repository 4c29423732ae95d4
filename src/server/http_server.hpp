#pragma once

#include "config.hpp"
#include "model_manager.hpp"
#include "orchestrator.hpp"

#include <httplib.h>
#include <string>

// HTTP front end:
//   GET  /health              model readiness, no auth
//   GET  /api/v1/models       available model names, no auth
//   POST /api/v1/transcribe   multipart "file" upload, X-API-Key required
class HttpServer {
public:
    HttpServer(Config config, RequestOrchestrator& orchestrator, ModelManager& models);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool bind(const std::string& host, int port);
    // Binds to an ephemeral port and returns it, or -1.
    int bind_any(const std::string& host);

    // Serves until stop(). Returns false if the listener failed.
    bool listen();
    void stop();

    bool wait_until_ready() const;

private:
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_models(const httplib::Request& req, httplib::Response& res);
    void handle_transcribe(const httplib::Request& req, httplib::Response& res,
                           const httplib::ContentReader& content_reader);

    void send_error(httplib::Response& res, int status, std::string_view error,
                    const std::string& detail, const std::string& request_id);

    Config config_;
    RequestOrchestrator& orchestrator_;
    ModelManager& models_;
    httplib::Server server_;
};
