#include "Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace rune {
namespace log {

namespace {

std::atomic<Level> g_level{Level::info};
std::mutex         g_mu;

const char* level_tag(Level level) {
    switch (level) {
        case Level::debug: return "[DEBUG]";
        case Level::info:  return "[INFO]";
        case Level::warn:  return "[WARN]";
        case Level::error: return "[ERROR]";
    }
    return "[?]";
}

} // namespace

void set_level(Level level) {
    g_level.store(level);
}

Level level() {
    return g_level.load();
}

Level level_from_string(const std::string& name) {
    if (name == "debug") return Level::debug;
    if (name == "warn")  return Level::warn;
    if (name == "error") return Level::error;
    return Level::info;
}

void write(Level lvl, const char* tag, const std::string& message) {
    if (static_cast<int>(lvl) < static_cast<int>(g_level.load())) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_mu);
    std::cerr << level_tag(lvl) << ' ' << tag << ": " << message << std::endl;
}

} // namespace log
} // namespace rune
