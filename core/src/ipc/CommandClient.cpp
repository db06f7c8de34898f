#include "lp/ipc/CommandClient.hpp"

#include "lp/debug/Log.hpp"
#include "lp/ipc/UnixSocket.hpp"
#include "lp/protocol/CommandBuilders.hpp"
#include "lp/protocol/CommandCodec.hpp"

#include <chrono>
#include <thread>

namespace lp {

CommandClient::CommandClient(const ClientConfig& config) : config_(config) {}

bool CommandClient::sendOnce(const std::string& payload, SendResult& out) {
  UnixSocket sock = UnixSocket::connectTo(config_.socketPath, out.error);
  if (!sock.valid()) return false;

  if (!sock.setTimeouts(config_.timeoutMs)) {
    logWarn("Client", "could not set socket timeouts");
  }
  if (!sock.writeAll(payload)) {
    out.error = "write to " + config_.socketPath + " failed";
    return false;
  }

  std::string text;
  UnixSocket::ReadStatus st =
      sock.readObject(text, 64 * 1024, std::chrono::milliseconds(config_.timeoutMs));
  if (st != UnixSocket::ReadStatus::Complete && st != UnixSocket::ReadStatus::Eof) {
    out.error = std::string("reading response: ") + readStatusName(st);
    return false;
  }
  if (text.empty()) {
    out.error = "No response received from LED daemon";
    return false;
  }
  if (!decodeResponse(text, out.response)) {
    out.error = "malformed response: " + text;
    return false;
  }

  out.delivered = true;
  out.ok = out.response.success;
  out.error = out.response.success ? std::string() : "Command failed: " + out.response.error;
  return true;
}

SendResult CommandClient::send(const Command& cmd) {
  const std::string payload = encodeCommand(cmd);
  SendResult out;
  const int attempts = config_.maxRetries > 0 ? config_.maxRetries : 1;
  for (int i = 0; i < attempts; i++) {
    out.attempts = i + 1;
    if (sendOnce(payload, out)) return out;
    if (i + 1 < attempts) {
      logDebug("Client", "attempt %d failed (%s), retrying", i + 1, out.error.c_str());
      std::this_thread::sleep_for(std::chrono::milliseconds(config_.retryDelayMs));
    }
  }
  out.error = "Failed to connect to LED manager daemon at " + config_.socketPath + ": " +
              out.error;
  return out;
}

SendResult CommandClient::showBoot() {
  return send(makeShowAnimation("boot", 2.0, 0.3, Priority::High));
}

SendResult CommandClient::showWifiSearching() {
  return send(makeShowAnimation("wifi_searching", 0.0, 0.2, Priority::Medium));
}

SendResult CommandClient::showWifiConnected() { return send(makeShowSymbol("w")); }
SendResult CommandClient::showWifiError() { return send(makeShowSymbol("wifi_error", Priority::High)); }
SendResult CommandClient::showTunnelActive() { return send(makeShowSymbol("t")); }
SendResult CommandClient::showDiscordActive() { return send(makeShowSymbol("d")); }
SendResult CommandClient::showSuccess() { return send(makeShowSymbol("checkmark", Priority::High)); }
SendResult CommandClient::showError() { return send(makeShowSymbol("error", Priority::High)); }

SendResult CommandClient::showActivity(double durationSec) {
  return send(makeShowAnimation("activity", durationSec, 0.1, Priority::Low));
}

SendResult CommandClient::showIdle() {
  return send(makeShowAnimation("idle", 0.0, 0.3, Priority::Low));
}

} // namespace lp
