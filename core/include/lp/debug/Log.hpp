#pragma once
#include <string>

namespace lp {

// Levels in increasing severity. Messages below the process threshold
// are discarded.
enum class LogLevel : int {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3
};

void setLogLevel(LogLevel level);
LogLevel logLevel();

// Accepts "debug", "info", "warn"/"warning", "error" (case-insensitive).
bool parseLogLevel(const std::string& text, LogLevel& out);
const char* logLevelName(LogLevel level);

// printf-style. Writes "[YYYY-mm-dd HH:MM:SS] LEVEL [tag] message" to stderr.
void logDebug(const char* tag, const char* fmt, ...);
void logInfo(const char* tag, const char* fmt, ...);
void logWarn(const char* tag, const char* fmt, ...);
void logError(const char* tag, const char* fmt, ...);

} // namespace lp
