#include "model_manager.hpp"

#include "log.hpp"

#include <format>
#include <stdexcept>
#include <system_error>

std::string_view load_state_name(LoadState state) {
    switch (state) {
        case LoadState::Uninitialized: return "uninitialized";
        case LoadState::Loading: return "loading";
        case LoadState::Ready: return "ready";
        case LoadState::Failed: return "failed";
    }
    return "unknown";
}

ModelManager::ModelManager(Loader loader, Launcher launch)
    : loader_(std::move(loader)), launch_(std::move(launch)) {
    if (!launch_) {
        launch_ = [](std::function<void()> fn) { return std::jthread(std::move(fn)); };
    }
}

ModelManager::~ModelManager() = default;

void ModelManager::start_loading_async() {
    std::string failure;
    {
        std::lock_guard lock(mutex_);
        if (state_ != LoadState::Uninitialized) return;

        state_ = LoadState::Loading;
        try {
            loader_thread_ = launch_([this] { load(); });
            return;
        } catch (const std::system_error& e) {
            error_ = std::string("could not start loader thread: ") + e.what();
            state_ = LoadState::Failed;
            failure = error_;
        }
    }
    ready_cv_.notify_all();
    logging::error("model: {}", failure);
}

void ModelManager::load() {
    logging::info("model: loading");
    auto start = std::chrono::steady_clock::now();

    std::expected<std::unique_ptr<SpeechEngine>, std::string> result;
    try {
        result = loader_();
    } catch (const std::exception& e) {
        result = std::unexpected(std::string(e.what()));
    }

    if (result && !*result) {
        result = std::unexpected(std::string("loader returned no engine"));
    }

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    {
        std::lock_guard lock(mutex_);
        load_seconds_ = elapsed;
        if (result) {
            engine_ = std::move(*result);
            state_ = LoadState::Ready;
        } else {
            error_ = result.error();
            state_ = LoadState::Failed;
        }
    }
    ready_cv_.notify_all();

    if (result) {
        logging::info("model: ready after {:.1f}s", elapsed);
    } else {
        logging::error("model: load failed after {:.1f}s: {}", elapsed, result.error());
    }
}

std::expected<SpeechEngine*, TranscribeError>
ModelManager::wait_until_ready(std::chrono::milliseconds timeout) {
    start_loading_async();

    std::unique_lock lock(mutex_);
    ready_cv_.wait_for(lock, timeout, [this] {
        return state_ == LoadState::Ready || state_ == LoadState::Failed;
    });

    switch (state_) {
        case LoadState::Ready:
            return engine_.get();
        case LoadState::Failed:
            return std::unexpected(TranscribeError{
                .kind = ErrorKind::ModelUnavailable,
                .detail = "Model failed to load: " + error_,
            });
        default:
            return std::unexpected(TranscribeError{
                .kind = ErrorKind::ModelUnavailable,
                .detail = std::format("Model is still loading (waited {:.1f}s), retry later",
                                      timeout.count() / 1000.0),
                .retryable = true,
            });
    }
}

ModelStatus ModelManager::status() const {
    std::lock_guard lock(mutex_);
    return ModelStatus{
        .state = state_,
        .engine_loaded = engine_ != nullptr,
        .error = error_,
        .load_seconds = load_seconds_,
    };
}
