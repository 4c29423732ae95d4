#pragma once

#include "errors.hpp"
#include "model_manager.hpp"
#include "transcriber.hpp"
#include "upload.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

struct TranscriptionResult {
    std::string text;
    std::string language;
    double duration_s = 0.0;    // inference wall-clock only
    std::optional<std::vector<Segment>> segments;
};

// Runs one transcription request end to end:
//   ingest -> resolve params -> wait for model -> transcribe -> cleanup.
// The uploaded temp file never outlives the call.
class RequestOrchestrator {
public:
    RequestOrchestrator(const Config& config, UploadIngestor& ingestor,
                        ModelManager& models, Transcriber& transcriber);

    std::expected<TranscriptionResult, TranscribeError>
        handle(UploadSource& source, const TranscribeParams& params, const std::string& request_id);

    // Temp files that could not be removed (logged as cleanup warnings).
    uint64_t cleanup_failures() const { return cleanup_failures_.load(std::memory_order_relaxed); }

private:
    std::expected<TranscriptionResult, TranscribeError>
        transcribe_artifact(const TempArtifact& artifact, const TranscribeParams& params,
                            const std::string& request_id);

    void discard(TempArtifact& artifact, const std::string& request_id);

    Config::Transcription defaults_;
    std::chrono::milliseconds load_timeout_;

    UploadIngestor& ingestor_;
    ModelManager& models_;
    Transcriber& transcriber_;

    std::atomic<uint64_t> cleanup_failures_{0};
};
