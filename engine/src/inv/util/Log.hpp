#pragma once
#include <string>

namespace inv::log {

enum class Level { Debug = 0, Info, Warn, Error, Off };

// Console logging: "[LEVEL] msg" on stdout, filtered by a process-wide level.
void message(const std::string &msg, Level level = Level::Info);
void setMinLevel(Level level);
Level minLevel();
bool enabled(Level level);
const char *levelName(Level level);

// Accepts "debug", "info", "warn", "error", "off"; false if unknown.
bool parseLevel(const std::string &text, Level &out);

inline void debug(const std::string &msg) { message(msg, Level::Debug); }
inline void info(const std::string &msg) { message(msg, Level::Info); }
inline void warn(const std::string &msg) { message(msg, Level::Warn); }
inline void error(const std::string &msg) { message(msg, Level::Error); }

} // namespace inv::log
