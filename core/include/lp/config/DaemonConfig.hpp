#pragma once
#include "lp/debug/Log.hpp"

#include <cstddef>
#include <string>

namespace lp {

// Panel geometry and driver tuning. Field names follow the matrix
// driver's option names.
struct MatrixConfig {
  int rows{64};
  int cols{64};
  int chainLength{1};
  int parallel{1};
  int brightness{100};
  int pwmBits{11};
  int pwmLsbNanoseconds{130};
  int gpioSlowdown{4};
  int scanMode{1};
  std::string hardwareMapping{"regular"};
  std::string ledRgbSequence{"RGB"};
  bool disableHardwarePulsing{true};
};

struct DaemonConfig {
  std::string socketPath{"/tmp/led-manager.sock"};
  int listenBacklog{5};
  std::size_t maxPayloadBytes{64 * 1024};
  int clientReadTimeoutMs{2000};

  // Worker pop timeout; bounds how long shutdown takes to be observed.
  int pollIntervalMs{500};
  // Bounded join for a cancelled render thread.
  int joinTimeoutMs{1000};
  int defaultCycleIntervalMs{10000};

  bool mockMode{false};
  bool preview{false};
  std::string snapshotDir;

  std::string fontPath;
  int fontPx{10};
  std::string gifDir{"gifs"};
  std::string assetDir{"assets"};

  LogLevel logLevel{LogLevel::Info};
  MatrixConfig matrix;
};

struct ClientConfig {
  std::string socketPath{"/tmp/led-manager.sock"};
  int timeoutMs{2000};
  int maxRetries{3};
  int retryDelayMs{100};
};

// Defaults overlaid with LED_* environment variables. Unparseable values
// are logged and ignored.
DaemonConfig loadDaemonConfigFromEnv();
ClientConfig loadClientConfigFromEnv();

// Applies --socket, --mock, --preview, --font, --gif-dir, --asset-dir,
// --snapshot-dir, --brightness, --log-level. Returns false and sets
// `error` on an unknown flag or a missing value.
bool applyDaemonArgs(DaemonConfig& cfg, int argc, char* argv[], std::string& error);

} // namespace lp
