#pragma once
#include "lp/config/DaemonConfig.hpp"
#include "lp/protocol/Command.hpp"

#include <string>

namespace lp {

struct SendResult {
  bool ok{false};        // delivered and accepted
  bool delivered{false}; // a Response came back (accepted or not)
  int attempts{0};
  Response response;
  std::string error;
};

// One connection per command. Socket failures are retried up to
// `maxRetries` times; a rejected command is not.
class CommandClient {
public:
  explicit CommandClient(const ClientConfig& config = ClientConfig{});

  const ClientConfig& config() const { return config_; }

  SendResult send(const Command& cmd);

  SendResult showBoot();
  SendResult showWifiSearching();
  SendResult showWifiConnected();
  SendResult showWifiError();
  SendResult showTunnelActive();
  SendResult showDiscordActive();
  SendResult showSuccess();
  SendResult showError();
  SendResult showActivity(double durationSec = 1.0);
  SendResult showIdle();

private:
  // Single attempt. Returns false on a transport failure.
  bool sendOnce(const std::string& payload, SendResult& out);

  ClientConfig config_;
};

} // namespace lp
