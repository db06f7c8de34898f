#include "lp/config/DaemonConfig.hpp"

#include <cstdlib>
#include <cstring>
#include <limits>
#include <string>

#ifndef LP_DEFAULT_FONT_PATH
#define LP_DEFAULT_FONT_PATH "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf"
#endif

namespace lp {

namespace {

const char* envOrNull(const char* name) {
  const char* v = std::getenv(name);
  if (!v || !*v) return nullptr;
  return v;
}

bool parseBool(const char* text) {
  return std::strcmp(text, "1") == 0 || std::strcmp(text, "true") == 0 ||
         std::strcmp(text, "TRUE") == 0 || std::strcmp(text, "yes") == 0 ||
         std::strcmp(text, "on") == 0;
}

bool parseInt(const char* text, int& out) {
  char* end = nullptr;
  long v = std::strtol(text, &end, 10);
  if (end == text || *end != '\0') return false;
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
  out = static_cast<int>(v);
  return true;
}

void envInt(const char* name, int& field, int lo, int hi) {
  const char* v = envOrNull(name);
  if (!v) return;
  int parsed = 0;
  if (!parseInt(v, parsed) || parsed < lo || parsed > hi) {
    logWarn("Config", "ignoring %s=%s (expected integer %d..%d)", name, v, lo, hi);
    return;
  }
  field = parsed;
}

} // anonymous namespace

DaemonConfig loadDaemonConfigFromEnv() {
  DaemonConfig cfg;
  cfg.fontPath = LP_DEFAULT_FONT_PATH;

  if (const char* v = envOrNull("LED_SOCKET_PATH")) cfg.socketPath = v;
  if (const char* v = envOrNull("LED_MOCK_MODE")) cfg.mockMode = parseBool(v);
  if (const char* v = envOrNull("LED_PREVIEW")) cfg.preview = parseBool(v);
  if (const char* v = envOrNull("LED_FONT_PATH")) cfg.fontPath = v;
  if (const char* v = envOrNull("LED_GIF_DIR")) cfg.gifDir = v;
  if (const char* v = envOrNull("LED_ASSET_DIR")) cfg.assetDir = v;
  if (const char* v = envOrNull("LED_SNAPSHOT_DIR")) cfg.snapshotDir = v;
  envInt("LED_BRIGHTNESS", cfg.matrix.brightness, 1, 100);
  envInt("LED_GPIO_SLOWDOWN", cfg.matrix.gpioSlowdown, 0, 5);

  if (const char* v = envOrNull("LED_LOG_LEVEL")) {
    if (!parseLogLevel(v, cfg.logLevel)) {
      logWarn("Config", "ignoring LED_LOG_LEVEL=%s", v);
    }
  }
  return cfg;
}

ClientConfig loadClientConfigFromEnv() {
  ClientConfig cfg;
  if (const char* v = envOrNull("LED_SOCKET_PATH")) cfg.socketPath = v;
  return cfg;
}

bool applyDaemonArgs(DaemonConfig& cfg, int argc, char* argv[], std::string& error) {
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    bool hasValue = (i + 1 < argc);

    if (arg == "--mock") { cfg.mockMode = true; continue; }
    if (arg == "--preview") { cfg.preview = true; continue; }

    std::string* target = nullptr;
    if (arg == "--socket") target = &cfg.socketPath;
    else if (arg == "--font") target = &cfg.fontPath;
    else if (arg == "--gif-dir") target = &cfg.gifDir;
    else if (arg == "--asset-dir") target = &cfg.assetDir;
    else if (arg == "--snapshot-dir") target = &cfg.snapshotDir;

    if (target) {
      if (!hasValue) { error = "missing value for " + arg; return false; }
      *target = argv[++i];
      continue;
    }

    if (arg == "--brightness") {
      if (!hasValue) { error = "missing value for " + arg; return false; }
      int b = 0;
      if (!parseInt(argv[++i], b) || b < 1 || b > 100) {
        error = "--brightness expects 1..100";
        return false;
      }
      cfg.matrix.brightness = b;
      continue;
    }

    if (arg == "--log-level") {
      if (!hasValue) { error = "missing value for " + arg; return false; }
      if (!parseLogLevel(argv[++i], cfg.logLevel)) {
        error = std::string("unknown log level: ") + argv[i];
        return false;
      }
      continue;
    }

    error = "unknown argument: " + arg;
    return false;
  }
  return true;
}

} // namespace lp
