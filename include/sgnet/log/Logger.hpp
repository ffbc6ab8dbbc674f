#pragma once

#include <cstdint>
#include <exception>
#include <source_location>
#include <sstream>
#include <string_view>
#include <utility>

namespace sgnet::log {

enum class Level : uint8_t {
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

// Process-wide threshold. Messages below it are dropped before formatting.
void setLevel(Level level) noexcept;
Level level() noexcept;
bool isEnabled(Level level) noexcept;

// Single-character tag used in the line prefix: D, I, W, E.
char levelTag(Level level) noexcept;

// Writes one line "[L] [file:line] message". Error lines go to stderr,
// everything else to stdout. Both streams are flushed.
void writeLine(Level level, const std::source_location& location, std::string_view message) noexcept;

// Reports a failure of the logger itself on stderr without allocating.
void reportFailure(const char* what) noexcept;

template <typename... Args>
void message(Level level, const std::source_location& location, Args&&... args) noexcept {
    if (!isEnabled(level)) {
        return;
    }

    try {
        std::ostringstream out;
        (out << ... << std::forward<Args>(args));
        writeLine(level, location, out.str());
    } catch (const std::exception& ex) {
        reportFailure(ex.what());
    }
}

}  // namespace sgnet::log

#define SGNET_LOG_DEBUG(...) \
    ::sgnet::log::message(::sgnet::log::Level::Debug, std::source_location::current(), __VA_ARGS__)
#define SGNET_LOG_INFO(...) \
    ::sgnet::log::message(::sgnet::log::Level::Info, std::source_location::current(), __VA_ARGS__)
#define SGNET_LOG_WARN(...) \
    ::sgnet::log::message(::sgnet::log::Level::Warn, std::source_location::current(), __VA_ARGS__)
#define SGNET_LOG_ERROR(...) \
    ::sgnet::log::message(::sgnet::log::Level::Error, std::source_location::current(), __VA_ARGS__)
