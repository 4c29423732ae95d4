#include "log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <print>

namespace logging {

namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_write_mutex;

} // namespace

void set_level(Level level) {
    g_level.store(level, std::memory_order_relaxed);
}

Level level() {
    return g_level.load(std::memory_order_relaxed);
}

bool enabled(Level lvl) {
    return lvl >= level();
}

std::optional<Level> parse_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    return std::nullopt;
}

std::string_view level_name(Level lvl) {
    switch (lvl) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
    }
    return "?";
}

void write(Level lvl, std::string_view msg) {
    auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());

    std::lock_guard lock(g_write_mutex);
    std::println(stderr, "{:%FT%TZ} {:<5} {}", now, level_name(lvl), msg);
}

} // namespace logging
