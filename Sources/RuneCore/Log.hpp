#pragma once

#include <string>

namespace rune {
namespace log {

enum class Level { debug, info, warn, error };

/// Lines below this level are dropped.  Defaults to `info`.
void set_level(Level level);
Level level();

/// Parses "debug" / "info" / "warn" / "error"; unknown names yield `info`.
Level level_from_string(const std::string& name);

/// Writes "[LEVEL] tag: message" to stderr.  Thread-safe.
void write(Level level, const char* tag, const std::string& message);

inline void debug(const char* tag, const std::string& m) { write(Level::debug, tag, m); }
inline void info(const char* tag, const std::string& m)  { write(Level::info, tag, m); }
inline void warn(const char* tag, const std::string& m)  { write(Level::warn, tag, m); }
inline void error(const char* tag, const std::string& m) { write(Level::error, tag, m); }

} // namespace log
} // namespace rune
