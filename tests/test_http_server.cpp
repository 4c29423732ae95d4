#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "http_server.hpp"

#include <arpa/inet.h>
#include <httplib.h>
#include <netinet/in.h>
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

// A full server on an ephemeral loopback port, backed by a fake engine.
struct ServerHarness {
    TmpDir dir;
    Config config;
    FakeEngine* engine = nullptr;
    std::string load_error;

    std::unique_ptr<ModelManager> models;
    std::unique_ptr<UploadIngestor> ingestor;
    std::unique_ptr<Transcriber> transcriber;
    std::unique_ptr<RequestOrchestrator> orchestrator;
    std::unique_ptr<HttpServer> server;
    std::jthread listener;
    int port = -1;

    explicit ServerHarness(std::string fail_with = {}) : load_error(std::move(fail_with)) {
        config.auth.allowed_api_keys = {"secret"};
        config.server.threads = 2;
        config.server.cors_origin = "https://app.example";
        config.model.load_timeout_s = 5;
        config.upload.max_file_size_mb = 1;

        models = std::make_unique<ModelManager>(
            [this]() -> std::expected<std::unique_ptr<SpeechEngine>, std::string> {
                if (!load_error.empty()) return std::unexpected(load_error);
                auto fake = std::make_unique<FakeEngine>();
                fake->language = "en";
                fake->segments = {{.id = 0, .start = 0.0, .end = 1.0, .text = " Hello there."}};
                engine = fake.get();
                return std::unique_ptr<SpeechEngine>(std::move(fake));
            });
        ingestor = std::make_unique<UploadIngestor>(UploadLimits{
            .max_bytes = config.upload.max_file_size_bytes(),
            .allowed_formats = config.upload.allowed_formats,
            .temp_dir = dir.path.string(),
        });
        transcriber = std::make_unique<Transcriber>(true);
        orchestrator = std::make_unique<RequestOrchestrator>(config, *ingestor, *models, *transcriber);
        server = std::make_unique<HttpServer>(config, *orchestrator, *models);

        port = server->bind_any("127.0.0.1");
        REQUIRE(port > 0);
        listener = std::jthread([this] { server->listen(); });
        REQUIRE(server->wait_until_ready());
    }

    ~ServerHarness() {
        server->stop();
        if (listener.joinable()) listener.join();
    }

    httplib::Client client() const {
        httplib::Client cli("127.0.0.1", port);
        cli.set_read_timeout(10, 0);
        return cli;
    }

    httplib::Result upload(const std::string& filename, const std::string& content,
                           const std::string& query = "", const std::string& key = "secret") {
        auto cli = client();
        httplib::Headers headers;
        if (!key.empty()) headers.emplace("X-API-Key", key);
        httplib::MultipartFormDataItems items = {
            {"file", content, filename, "application/octet-stream"},
        };
        return cli.Post("/api/v1/transcribe" + query, headers, items);
    }
};

// Polls pred until it holds or the timeout passes.
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 5s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

// Plain TCP connection to the harness, for requests httplib::Client cannot
// leave unfinished.
struct RawConnection {
    int fd = -1;

    explicit RawConnection(int port) {
        fd = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(fd >= 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        REQUIRE(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    }

    ~RawConnection() { close(); }

    void send_all(const std::string& data) {
        size_t off = 0;
        while (off < data.size()) {
            ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
            REQUIRE(n > 0);
            off += static_cast<size_t>(n);
        }
    }

    void close() {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
};

} // namespace

TEST_CASE("HttpServer public endpoints", "[http]") {
    ServerHarness h;

    SECTION("HealthReportsModelState") {
        REQUIRE(h.models->wait_until_ready(5s));

        auto res = h.client().Get("/health");
        REQUIRE(res);
        REQUIRE(res->status == 200);
        auto body = json::parse(res->body);
        REQUIRE(body["status"] == "healthy");
        REQUIRE(body["model_state"] == "ready");
        REQUIRE(body["model"] == "small");
        REQUIRE(body["version"] == TRANSCRIBE_VERSION);
    }

    SECTION("HealthBeforeLoadIsDegraded") {
        auto res = h.client().Get("/health");
        REQUIRE(res);
        REQUIRE(res->status == 200);
        REQUIRE(json::parse(res->body)["status"] == "degraded");
    }

    SECTION("ModelsList") {
        auto res = h.client().Get("/api/v1/models");
        REQUIRE(res);
        REQUIRE(res->status == 200);
        auto body = json::parse(res->body);
        REQUIRE(body["active"] == "small");
        REQUIRE(body["models"].size() == 5);
    }

    SECTION("CorsHeaders") {
        auto res = h.client().Get("/api/v1/models");
        REQUIRE(res);
        REQUIRE(res->get_header_value("Access-Control-Allow-Origin") == "https://app.example");
    }

    SECTION("Preflight") {
        auto res = h.client().Options("/api/v1/transcribe");
        REQUIRE(res);
        REQUIRE(res->status == 204);
        REQUIRE(res->get_header_value("Access-Control-Allow-Headers").find("X-API-Key") != std::string::npos);
    }
}

TEST_CASE("HttpServer transcribe endpoint", "[http]") {
    ServerHarness h;

    SECTION("Success") {
        auto res = h.upload("greeting.wav", "RIFF....WAVE");
        REQUIRE(res);
        REQUIRE(res->status == 200);
        auto body = json::parse(res->body);
        REQUIRE(body["text"] == "Hello there.");
        REQUIRE(body["language"] == "en");
        REQUIRE(body["duration_seconds"].is_number());
        REQUIRE_FALSE(body.contains("segments"));
        REQUIRE(h.dir.file_count() == 0);
    }

    SECTION("SegmentsAndParams") {
        auto res = h.upload("greeting.mp3", "ID3", "?language=en&beam_size=2&include_segments=true");
        REQUIRE(res);
        REQUIRE(res->status == 200);
        auto body = json::parse(res->body);
        REQUIRE(body["segments"].size() == 1);
        REQUIRE(body["segments"][0]["text"] == "Hello there.");
        REQUIRE(h.engine->last_options.beam_size == 2);
        REQUIRE(h.engine->last_options.language == "en");
    }

    SECTION("MissingKey") {
        auto res = h.upload("a.wav", "data", "", "");
        REQUIRE(res);
        REQUIRE(res->status == 401);
        REQUIRE(res->get_header_value("WWW-Authenticate") == "ApiKey");
        auto body = json::parse(res->body);
        REQUIRE(body["error"] == "unauthorized");
        REQUIRE_FALSE(body["request_id"].get<std::string>().empty());
    }

    SECTION("WrongKey") {
        auto res = h.upload("a.wav", "data", "", "guess");
        REQUIRE(res);
        REQUIRE(res->status == 403);
        REQUIRE(json::parse(res->body)["error"] == "forbidden");
    }

    SECTION("InvalidParameter") {
        auto res = h.upload("a.wav", "data", "?temperature=2");
        REQUIRE(res);
        REQUIRE(res->status == 422);
        auto body = json::parse(res->body);
        REQUIRE(body["error"] == "invalid_parameter");
        REQUIRE(body["detail"] == "temperature: 2 is outside [0, 1]");
    }

    SECTION("UnsupportedFormat") {
        auto res = h.upload("notes.xyz", "data");
        REQUIRE(res);
        REQUIRE(res->status == 400);
        auto body = json::parse(res->body);
        REQUIRE(body["error"] == "unsupported_format");
        REQUIRE(h.dir.file_count() == 0);
    }

    SECTION("NoFilePart") {
        auto cli = h.client();
        httplib::MultipartFormDataItems items = {{"note", "hello", "", ""}};
        auto res = cli.Post("/api/v1/transcribe", httplib::Headers{{"X-API-Key", "secret"}}, items);
        REQUIRE(res);
        REQUIRE(res->status == 400);
        REQUIRE(json::parse(res->body)["error"] == "missing_file");
    }

    SECTION("OversizeUpload") {
        auto res = h.upload("a.wav", std::string(1536 * 1024, 'a'));
        REQUIRE(res);
        REQUIRE(res->status == 413);
        auto body = json::parse(res->body);
        REQUIRE(body["error"] == "file_too_large");
        REQUIRE(body["detail"].get<std::string>().find("1MB") != std::string::npos);
        REQUIRE(h.dir.file_count() == 0);
        REQUIRE(h.engine == nullptr);
    }

    SECTION("ClientDisconnectMidUpload") {
        const std::string boundary = "ts-boundary-7f3a";
        std::string part_head = "--" + boundary + "\r\n"
                                "Content-Disposition: form-data; name=\"file\"; filename=\"a.wav\"\r\n"
                                "Content-Type: application/octet-stream\r\n\r\n";
        std::string request = "POST /api/v1/transcribe HTTP/1.1\r\n"
                              "Host: 127.0.0.1\r\n"
                              "X-API-Key: secret\r\n"
                              "Content-Type: multipart/form-data; boundary=" + boundary + "\r\n"
                              "Content-Length: 900000\r\n\r\n";

        RawConnection conn(h.port);
        conn.send_all(request + part_head + std::string(64 * 1024, 'a'));

        // The partial upload lands in the temp dir, then goes away once the
        // peer hangs up.
        REQUIRE(eventually([&] { return h.dir.file_count() == 1; }));
        conn.close();
        REQUIRE(eventually([&] { return h.dir.file_count() == 0; }));
        REQUIRE(h.engine == nullptr);
    }

    SECTION("NonStandardExceptionIs500") {
        REQUIRE(h.models->wait_until_ready(5s));
        h.engine->throws_non_std = true;

        auto res = h.upload("a.wav", "data");
        REQUIRE(res);
        REQUIRE(res->status == 500);
        auto body = json::parse(res->body);
        REQUIRE(body["error"] == "internal_error");
        REQUIRE(body["detail"] == "Transcription failed: unknown exception");
        REQUIRE(h.dir.file_count() == 0);
    }

    SECTION("NotMultipart") {
        auto cli = h.client();
        auto res = cli.Post("/api/v1/transcribe", httplib::Headers{{"X-API-Key", "secret"}},
                            "raw bytes", "application/octet-stream");
        REQUIRE(res);
        REQUIRE(res->status == 400);
        REQUIRE(json::parse(res->body)["error"] == "missing_file");
    }
}

TEST_CASE("HttpServer with a broken model", "[http]") {
    ServerHarness h("model file not found: models/ggml-small.bin");

    auto res = h.upload("a.wav", "data");
    REQUIRE(res);
    REQUIRE(res->status == 503);
    REQUIRE_FALSE(res->has_header("Retry-After"));
    auto body = json::parse(res->body);
    REQUIRE(body["error"] == "model_unavailable");
    REQUIRE(h.dir.file_count() == 0);

    auto health = json::parse(h.client().Get("/health")->body);
    REQUIRE(health["status"] == "degraded");
    REQUIRE(health["model_state"] == "failed");
    REQUIRE(health["error"] == "model file not found: models/ggml-small.bin");
}
