#include "sgnet/log/Logger.hpp"

#include <array>
#include <atomic>
#include <cstdio>
#include <cstring>

namespace sgnet::log {

namespace {

std::atomic<Level> g_threshold{Level::Warn};

const char* baseName(const char* path) noexcept {
    const char* last_slash = std::strrchr(path, '/');
    return last_slash != nullptr ? last_slash + 1 : path;
}

}  // namespace

void setLevel(Level level) noexcept {
    g_threshold.store(level, std::memory_order_relaxed);
}

Level level() noexcept {
    return g_threshold.load(std::memory_order_relaxed);
}

bool isEnabled(Level level) noexcept {
    const Level threshold = g_threshold.load(std::memory_order_relaxed);
    return level != Level::Off && threshold != Level::Off &&
           static_cast<uint8_t>(level) >= static_cast<uint8_t>(threshold);
}

char levelTag(Level level) noexcept {
    static constexpr std::array<char, 5> kTags{'D', 'I', 'W', 'E', '?'};
    const auto index = static_cast<size_t>(level);
    return index < kTags.size() ? kTags[index] : kTags.back();
}

void writeLine(Level level, const std::source_location& location, std::string_view message) noexcept {
    std::FILE* const sink = (level == Level::Error) ? stderr : stdout;
    std::fprintf(sink,
                 "[%c] [%s:%u] %.*s\n",
                 levelTag(level),
                 baseName(location.file_name()),
                 static_cast<unsigned>(location.line()),
                 static_cast<int>(message.size()),
                 message.data());
    std::fflush(sink);
}

void reportFailure(const char* what) noexcept {
    std::fputs("[E] logger failure: ", stderr);
    std::fputs(what != nullptr ? what : "unknown", stderr);
    std::fputc('\n', stderr);
    std::fflush(stderr);
}

}  // namespace sgnet::log
