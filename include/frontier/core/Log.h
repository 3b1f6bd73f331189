#pragma once

#include "frontier/core/Types.h"

#include <string_view>

namespace frontier::core {

enum class LogLevel : u8 {
  Trace = 0,
  Debug,
  Info,
  Warn,
  Error,
  Off,
};

// Lines below the threshold are dropped.
void setLogLevel(LogLevel level);
LogLevel getLogLevel();

std::string_view toString(LogLevel level);

// Lower-case names as given on the command line ("info", "warn", ...).
bool parseLogLevel(std::string_view text, LogLevel& out);

// While a journey runs every line carries its turn number.
void setLogTurn(u32 turn);
void clearLogTurn();

// Writes to stderr; stdout is the game screen.
void log(LogLevel level, std::string_view message);

} // namespace frontier::core

#define FRONTIER_LOG(level, msg) ::frontier::core::log(::frontier::core::LogLevel::level, (msg))

#define FRONTIER_LOG_TRACE(msg) FRONTIER_LOG(Trace, msg)
#define FRONTIER_LOG_DEBUG(msg) FRONTIER_LOG(Debug, msg)
#define FRONTIER_LOG_INFO(msg)  FRONTIER_LOG(Info, msg)
#define FRONTIER_LOG_WARN(msg)  FRONTIER_LOG(Warn, msg)
#define FRONTIER_LOG_ERROR(msg) FRONTIER_LOG(Error, msg)
