#pragma once

#include "errors.hpp"
#include "whisper/engine.hpp"

#include <chrono>
#include <condition_variable>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

enum class LoadState { Uninitialized, Loading, Ready, Failed };

std::string_view load_state_name(LoadState state);

struct ModelStatus {
    LoadState state = LoadState::Uninitialized;
    bool engine_loaded = false;
    std::string error;          // set when Failed
    double load_seconds = 0.0;  // set once Ready or Failed
};

// Owns the speech engine and loads it once, on a background thread.
// Ready and Failed are terminal: there is no reload.
class ModelManager {
public:
    using Loader = std::function<std::expected<std::unique_ptr<SpeechEngine>, std::string>()>;
    // Starts the loader thread. May throw std::system_error.
    using Launcher = std::function<std::jthread(std::function<void()>)>;

    explicit ModelManager(Loader loader, Launcher launch = {});
    ~ModelManager();

    ModelManager(const ModelManager&) = delete;
    ModelManager& operator=(const ModelManager&) = delete;

    // No-op unless the state is Uninitialized.
    void start_loading_async();

    // Blocks until the engine is Ready, loading failed, or the timeout elapses.
    // Starts loading if nobody has yet. The returned engine stays owned by
    // the manager and is valid for the manager's lifetime.
    std::expected<SpeechEngine*, TranscribeError> wait_until_ready(std::chrono::milliseconds timeout);

    ModelStatus status() const;

private:
    void load();

    Loader loader_;
    Launcher launch_;

    mutable std::mutex mutex_;
    std::condition_variable ready_cv_;
    LoadState state_ = LoadState::Uninitialized;
    std::string error_;
    std::unique_ptr<SpeechEngine> engine_;
    double load_seconds_ = 0.0;

    // Declared last so it is joined before the state above is destroyed.
    std::jthread loader_thread_;
};
