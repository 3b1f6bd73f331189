#include "frontier/core/Log.h"

#include <array>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>

namespace frontier::core {
namespace {
  std::mutex g_logMutex;
  LogLevel g_level = LogLevel::Info;
  std::optional<u32> g_turn;

  struct LevelName {
    LogLevel level;
    std::string_view upper;
    std::string_view lower;
  };

  constexpr std::array<LevelName, 6> kLevels = {{
    {LogLevel::Trace, "TRACE", "trace"},
    {LogLevel::Debug, "DEBUG", "debug"},
    {LogLevel::Info,  "INFO",  "info"},
    {LogLevel::Warn,  "WARN",  "warn"},
    {LogLevel::Error, "ERROR", "error"},
    {LogLevel::Off,   "OFF",   "off"},
  }};

  std::string wallClock() {
    const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
  #if defined(_WIN32)
    localtime_s(&tm, &t);
  #else
    localtime_r(&t, &tm);
  #endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S");
    return oss.str();
  }
} // namespace

void setLogLevel(LogLevel level) { g_level = level; }
LogLevel getLogLevel() { return g_level; }

std::string_view toString(LogLevel level) {
  for (const auto& l : kLevels) {
    if (l.level == level) return l.upper;
  }
  return "UNKNOWN";
}

bool parseLogLevel(std::string_view text, LogLevel& out) {
  for (const auto& l : kLevels) {
    if (l.lower == text) {
      out = l.level;
      return true;
    }
  }
  return false;
}

void setLogTurn(u32 turn) {
  std::lock_guard<std::mutex> lock(g_logMutex);
  g_turn = turn;
}

void clearLogTurn() {
  std::lock_guard<std::mutex> lock(g_logMutex);
  g_turn.reset();
}

void log(LogLevel level, std::string_view message) {
  if (g_level == LogLevel::Off || level < g_level) return;

  std::lock_guard<std::mutex> lock(g_logMutex);
  std::cerr << "[" << wallClock() << "][" << toString(level) << "]";
  if (g_turn) std::cerr << "[turn " << *g_turn << "]";
  std::cerr << " " << message << "\n";
}

} // namespace frontier::core
