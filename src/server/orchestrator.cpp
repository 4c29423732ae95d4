#include "orchestrator.hpp"

#include "log.hpp"

RequestOrchestrator::RequestOrchestrator(const Config& config, UploadIngestor& ingestor,
                                         ModelManager& models, Transcriber& transcriber)
    : defaults_(config.transcription),
      load_timeout_(std::chrono::seconds(config.model.load_timeout_s)),
      ingestor_(ingestor), models_(models), transcriber_(transcriber) {}

std::expected<TranscriptionResult, TranscribeError>
RequestOrchestrator::handle(UploadSource& source, const TranscribeParams& params,
                            const std::string& request_id) {
    auto artifact = ingestor_.ingest(source);
    if (!artifact) {
        logging::warn("request {}: upload rejected ({}): {}", request_id,
                      error_kind_name(artifact.error().kind), artifact.error().detail);
        return std::unexpected(artifact.error());
    }

    logging::info("request {}: saved upload to {} ({} bytes)", request_id,
                  artifact->path(), artifact->byte_size());

    auto result = transcribe_artifact(*artifact, params, request_id);
    discard(*artifact, request_id);

    if (result) {
        logging::info("request {}: transcribed in {:.2f}s, {} chars, language {}", request_id,
                      result->duration_s, result->text.size(), result->language);
    } else {
        logging::error("request {}: {} ({})", request_id, result.error().detail,
                       error_kind_name(result.error().kind));
    }
    return result;
}

std::expected<TranscriptionResult, TranscribeError>
RequestOrchestrator::transcribe_artifact(const TempArtifact& artifact, const TranscribeParams& params,
                                         const std::string& request_id) {
    auto effective = resolve_params(params, defaults_);

    auto engine = models_.wait_until_ready(load_timeout_);
    if (!engine) return std::unexpected(engine.error());

    logging::debug("request {}: running inference", request_id);
    auto transcript = transcriber_.run(**engine, artifact.path(), effective);
    if (!transcript) return std::unexpected(transcript.error());

    return TranscriptionResult{
        .text = std::move(transcript->text),
        .language = std::move(transcript->language),
        .duration_s = transcript->inference_s,
        .segments = std::move(transcript->segments),
    };
}

void RequestOrchestrator::discard(TempArtifact& artifact, const std::string& request_id) {
    auto removed = artifact.remove();
    if (!removed) {
        cleanup_failures_.fetch_add(1, std::memory_order_relaxed);
        logging::warn("request {}: cleanup of {} failed: {}", request_id, artifact.path(), removed.error());
        return;
    }
    logging::debug("request {}: removed {}", request_id, artifact.path());
}
