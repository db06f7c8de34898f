#include "lp/debug/Log.hpp"

#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace lp {

namespace {

std::atomic<int> sThreshold{static_cast<int>(LogLevel::Info)};
std::mutex sWriteMtx;

void vlog(LogLevel level, const char* tag, const char* fmt, va_list args) {
  if (static_cast<int>(level) < sThreshold.load()) return;

  char stamp[32];
  std::time_t now = std::time(nullptr);
  std::tm tmNow{};
  localtime_r(&now, &tmNow);
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tmNow);

  char body[1024];
  std::vsnprintf(body, sizeof(body), fmt, args);

  // One fprintf per line so concurrent threads never interleave mid-line.
  std::lock_guard<std::mutex> lock(sWriteMtx);
  std::fprintf(stderr, "[%s] %s [%s] %s\n", stamp, logLevelName(level), tag, body);
}

} // anonymous namespace

void setLogLevel(LogLevel level) {
  sThreshold.store(static_cast<int>(level));
}

LogLevel logLevel() {
  return static_cast<LogLevel>(sThreshold.load());
}

bool parseLogLevel(const std::string& text, LogLevel& out) {
  std::string lower;
  for (char c : text) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  if (lower == "debug") { out = LogLevel::Debug; return true; }
  if (lower == "info") { out = LogLevel::Info; return true; }
  if (lower == "warn" || lower == "warning") { out = LogLevel::Warn; return true; }
  if (lower == "error") { out = LogLevel::Error; return true; }
  return false;
}

const char* logLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARNING";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO";
}

void logDebug(const char* tag, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog(LogLevel::Debug, tag, fmt, args);
  va_end(args);
}

void logInfo(const char* tag, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog(LogLevel::Info, tag, fmt, args);
  va_end(args);
}

void logWarn(const char* tag, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog(LogLevel::Warn, tag, fmt, args);
  va_end(args);
}

void logError(const char* tag, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog(LogLevel::Error, tag, fmt, args);
  va_end(args);
}

} // namespace lp
