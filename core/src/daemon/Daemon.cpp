#include "lp/daemon/Daemon.hpp"

#include "lp/debug/Log.hpp"
#include "lp/device/DeviceFactory.hpp"
#include "lp/protocol/CommandCodec.hpp"

#include <csignal>
#include <utility>

namespace lp {

namespace {

volatile std::sig_atomic_t g_signal = 0;

void onTerminationSignal(int sig) {
  g_signal = sig;
}

SocketServerConfig serverConfigFor(const DaemonConfig& cfg) {
  SocketServerConfig sc;
  sc.path = cfg.socketPath;
  sc.backlog = cfg.listenBacklog;
  return sc;
}

} // anonymous namespace

void Daemon::installSignalHandlers() {
  std::signal(SIGINT, onTerminationSignal);
  std::signal(SIGTERM, onTerminationSignal);
}

bool Daemon::signalReceived() {
  return g_signal != 0;
}

Daemon::Daemon(const DaemonConfig& cfg, std::unique_ptr<FrameDevice> device)
    : cfg_(cfg),
      device_(device ? std::move(device) : createFrameDevice(cfg)),
      server_(serverConfigFor(cfg)) {
  context_ = std::make_unique<ExecutionContext>(*device_, cfg_);
  context_->setOutcomeListener([this](const RenderOutcome& o) { recordOutcome(o); });
  context_->setShutdownHandler([this]() { requestShutdown(); });
  logInfo("Daemon", "panel backend: %s (%dx%d)", device_->name(), device_->width(),
          device_->height());
}

Daemon::~Daemon() {
  stop();
}

Response Daemon::handlePayload(const std::string& payload) {
  DecodeResult r = decodeCommand(payload);
  if (!r.ok) {
    logWarn("Daemon", "rejected payload (%s): %s", protocolErrorCodeName(r.err.code),
            r.err.message.c_str());
    return Response::rejected(r.err.message);
  }
  std::uint64_t seq = submit(r.command);
  logInfo("Daemon", "queued #%llu %s (%s)", static_cast<unsigned long long>(seq),
          commandKindName(r.command.kind()), priorityName(r.command.priority()));
  return Response::accepted();
}

std::uint64_t Daemon::submit(Command cmd) {
  return queue_.push(std::move(cmd));
}

void Daemon::handleConnection(UnixSocket& client) {
  if (!client.setTimeouts(cfg_.clientReadTimeoutMs)) {
    logWarn("Daemon", "could not set client socket timeouts");
  }

  std::string payload;
  UnixSocket::ReadStatus st = client.readObject(payload, cfg_.maxPayloadBytes,
                                                std::chrono::milliseconds(cfg_.clientReadTimeoutMs));

  Response resp;
  switch (st) {
    case UnixSocket::ReadStatus::Complete:
      resp = handlePayload(payload);
      break;
    case UnixSocket::ReadStatus::Eof:
      if (payload.empty()) {
        logDebug("Daemon", "client closed without sending");
        return;
      }
      resp = handlePayload(payload);
      break;
    case UnixSocket::ReadStatus::Invalid:
      logWarn("Daemon", "rejected payload (%s): not a JSON object",
              protocolErrorCodeName(ProtocolErrorCode::NotAnObject));
      resp = Response::rejected("payload is not a JSON object");
      break;
    case UnixSocket::ReadStatus::TooLarge:
      resp = Response::rejected("payload exceeds " + std::to_string(cfg_.maxPayloadBytes) +
                                " bytes");
      break;
    case UnixSocket::ReadStatus::Error:
      logWarn("Daemon", "client read failed or timed out");
      if (payload.empty()) return;
      resp = handlePayload(payload);
      break;
  }

  if (!client.writeAll(encodeResponse(resp))) {
    logWarn("Daemon", "could not write response");
  }
}

void Daemon::recordOutcome(const RenderOutcome& outcome) {
  {
    std::lock_guard<std::mutex> lock(outcomeMtx_);
    outcomes_.push_back(outcome);
    if (outcomes_.size() > kOutcomeHistory) outcomes_.pop_front();
    outcomeTotal_++;
  }
  outcomeCv_.notify_all();
}

std::vector<RenderOutcome> Daemon::recentOutcomes() const {
  std::lock_guard<std::mutex> lock(outcomeMtx_);
  return std::vector<RenderOutcome>(outcomes_.begin(), outcomes_.end());
}

std::size_t Daemon::outcomeCount() const {
  std::lock_guard<std::mutex> lock(outcomeMtx_);
  return outcomeTotal_;
}

bool Daemon::waitForOutcomes(std::size_t count, std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(outcomeMtx_);
  return outcomeCv_.wait_for(lock, timeout, [&] { return outcomeTotal_ >= count; });
}

bool Daemon::start(bool listen) {
  if (running_.load()) return true;
  if (stopped_.load()) {
    logError("Daemon", "cannot restart a stopped daemon");
    return false;
  }

  running_.store(true);
  worker_ = std::thread(&Daemon::workerLoop, this);

  if (listen) {
    if (!server_.start([this](UnixSocket& c) { handleConnection(c); })) {
      logError("Daemon", "could not listen on %s", cfg_.socketPath.c_str());
      stop();
      return false;
    }
  }
  logInfo("Daemon", "started");
  return true;
}

void Daemon::workerLoop() {
  const std::chrono::milliseconds poll(cfg_.pollIntervalMs);
  while (running_.load()) {
    QueueEntry entry;
    if (!queue_.popFor(entry, poll)) continue;
    if (!running_.load()) break;
    context_->execute(entry);
  }
  logDebug("Daemon", "worker exiting");
}

void Daemon::requestShutdown() {
  {
    std::lock_guard<std::mutex> lock(stateMtx_);
    if (!running_.exchange(false)) return;
  }
  logInfo("Daemon", "shutdown requested");
  queue_.close();
  stateCv_.notify_all();
}

bool Daemon::waitForShutdown(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(stateMtx_);
  return stateCv_.wait_for(lock, timeout, [this] { return !running_.load(); });
}

bool Daemon::run() {
  if (!start()) return false;
  while (!waitForShutdown(std::chrono::milliseconds(100))) {
    if (signalReceived()) {
      logInfo("Daemon", "signal %d received", static_cast<int>(g_signal));
      requestShutdown();
    }
  }
  stop();
  return true;
}

void Daemon::stop() {
  if (stopped_.exchange(true)) return;

  requestShutdown();
  server_.stop();
  if (worker_.joinable()) {
    if (worker_.get_id() == std::this_thread::get_id()) {
      worker_.detach();
    } else {
      worker_.join();
    }
  }
  context_->stopAll();
  context_->drawFrame([](Canvas&) {});
  std::size_t dropped = queue_.size();
  queue_.clear();
  if (dropped > 0) {
    logInfo("Daemon", "dropped %zu queued command(s)", dropped);
  }
  if (context_->leakedCount() > 0) {
    logWarn("Daemon", "%llu render thread(s) leaked",
            static_cast<unsigned long long>(context_->leakedCount()));
  }
  logInfo("Daemon", "stopped");
}

} // namespace lp
