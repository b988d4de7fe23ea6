#include "inv/util/Log.hpp"
#include <atomic>
#include <iostream>

namespace inv::log {

namespace {
std::atomic<Level> gMinLevel{Level::Info};
}

const char *levelName(Level level) {
  switch (level) {
  case Level::Debug: return "DEBUG";
  case Level::Info: return "INFO";
  case Level::Warn: return "WARN";
  case Level::Error: return "ERROR";
  case Level::Off: break;
  }
  return "OFF";
}

void setMinLevel(Level level) { gMinLevel.store(level); }
Level minLevel() { return gMinLevel.load(); }

bool enabled(Level level) {
  return level != Level::Off &&
         static_cast<int>(level) >= static_cast<int>(gMinLevel.load());
}

void message(const std::string &msg, Level level) {
  if (!enabled(level))
    return;
  std::cout << "[" << levelName(level) << "] " << msg << std::endl;
}

bool parseLevel(const std::string &text, Level &out) {
  if (text == "debug") out = Level::Debug;
  else if (text == "info") out = Level::Info;
  else if (text == "warn") out = Level::Warn;
  else if (text == "error") out = Level::Error;
  else if (text == "off") out = Level::Off;
  else return false;
  return true;
}

} // namespace inv::log
