// ledpaneld - LED panel daemon
//
// Usage: ledpaneld [--mock] [--preview] [--socket PATH] [--font PATH]
//                  [--gif-dir DIR] [--asset-dir DIR] [--snapshot-dir DIR]
//                  [--brightness N] [--log-level LEVEL]
//
// Every option can also come from the LED_* environment variables.

#include "lp/config/DaemonConfig.hpp"
#include "lp/daemon/Daemon.hpp"
#include "lp/debug/Log.hpp"

#ifdef LP_HAS_GLFW
#include "lp/device/PreviewFrameDevice.hpp"
#include "lp/gl/PanelPreviewWindow.hpp"
#endif

#include <chrono>
#include <cstdio>
#include <string>

static void usage() {
  std::fprintf(stderr,
               "usage: ledpaneld [--mock] [--preview] [--socket PATH] [--font PATH]\n"
               "                 [--gif-dir DIR] [--asset-dir DIR] [--snapshot-dir DIR]\n"
               "                 [--brightness N] [--log-level debug|info|warn|error]\n");
}

int main(int argc, char* argv[]) {
  lp::DaemonConfig cfg = lp::loadDaemonConfigFromEnv();

  std::string err;
  if (!lp::applyDaemonArgs(cfg, argc, argv, err)) {
    std::fprintf(stderr, "ledpaneld: %s\n", err.c_str());
    usage();
    return 2;
  }
  lp::setLogLevel(cfg.logLevel);

  lp::Daemon::installSignalHandlers();
  lp::Daemon daemon(cfg);

#ifdef LP_HAS_GLFW
  // The preview window has to live on the main thread, so the daemon runs
  // in the background and the window loop decides when to stop.
  auto* preview = dynamic_cast<lp::PreviewFrameDevice*>(&daemon.device());
  if (preview) {
    if (!daemon.start()) return 1;
    lp::PanelPreviewWindow window;
    if (window.init(preview->width(), preview->height())) {
      window.run(*preview, [&daemon]() {
        return daemon.isRunning() && !lp::Daemon::signalReceived();
      });
    } else {
      lp::logError("main", "preview window failed; running headless");
      while (!daemon.waitForShutdown(std::chrono::milliseconds(100))) {
        if (lp::Daemon::signalReceived()) daemon.requestShutdown();
      }
    }
    daemon.stop();
    return 0;
  }
#endif

  return daemon.run() ? 0 : 1;
}
