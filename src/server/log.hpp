#pragma once

#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Leveled stderr logging. Lines look like
//   2026-10-17T09:12:03Z INFO  model: loaded in 2.4s
namespace logging {

enum class Level { Debug = 0, Info, Warn, Error };

void set_level(Level level);
Level level();
bool enabled(Level level);

std::optional<Level> parse_level(std::string_view name);
std::string_view level_name(Level level);

void write(Level level, std::string_view msg);

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Debug)) write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Info)) write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Warn)) write(Level::Warn, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Error)) write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace logging
