// D4.2 - Daemon test (mock panel, real Unix socket)
// Tests: payload handling, priority drain through the worker, client
//        round trip, malformed payloads over the socket, socket mode,
//        shutdown command, client retries against a dead socket, stop()
//        with a stalled client, overall read deadline.

#include "lp/config/DaemonConfig.hpp"
#include "lp/daemon/Daemon.hpp"
#include "lp/device/MockFrameDevice.hpp"
#include "lp/ipc/CommandClient.hpp"
#include "lp/ipc/SocketServer.hpp"
#include "lp/ipc/UnixSocket.hpp"
#include "lp/protocol/CommandBuilders.hpp"
#include "lp/protocol/CommandCodec.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <sys/socket.h>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

using std::chrono::milliseconds;

static lp::DaemonConfig testConfig(const std::string& socketPath) {
  lp::DaemonConfig cfg;
  cfg.socketPath = socketPath;
  cfg.mockMode = true;
  cfg.fontPath.clear();
  cfg.pollIntervalMs = 50;
  cfg.joinTimeoutMs = 1000;
  cfg.clientReadTimeoutMs = 1000;
  return cfg;
}

static std::unique_ptr<lp::FrameDevice> mockPanel() {
  return std::make_unique<lp::MockFrameDevice>(64, 64);
}

// Sends raw bytes and returns the decoded reply.
static lp::Response rawExchange(const std::string& path, const std::string& bytes) {
  std::string err;
  lp::UnixSocket s = lp::UnixSocket::connectTo(path, err);
  requireTrue(s.valid(), "raw connect");
  requireTrue(s.setTimeouts(2000), "raw timeouts");
  requireTrue(s.writeAll(bytes), "raw write");
  s.shutdownWrite();
  std::string text;
  lp::UnixSocket::ReadStatus st = s.readObject(text, 64 * 1024);
  requireTrue(st == lp::UnixSocket::ReadStatus::Complete ||
              st == lp::UnixSocket::ReadStatus::Eof, "raw read");
  lp::Response resp;
  requireTrue(lp::decodeResponse(text, resp), "raw reply decodes");
  return resp;
}

int main() {
  char dir[] = "/tmp/lp_daemon_XXXXXX";
  requireTrue(mkdtemp(dir) != nullptr, "temp dir");
  const std::string runDir = std::string(dir) + "/run";
  const std::string sockPath = runDir + "/led.sock";

  // --- Test 1: handlePayload ---
  {
    lp::Daemon d(testConfig(sockPath), mockPanel());
    lp::Response ok = d.handlePayload(R"({"command":"show_symbol","params":{"symbol":"dot"}})");
    requireTrue(ok.success, "valid payload accepted");
    requireTrue(d.queue().size() == 1, "accepted payload is queued");

    lp::Response unknown = d.handlePayload(R"({"command":"explode"})");
    requireTrue(!unknown.success, "unknown command rejected");
    requireTrue(unknown.error.find("explode") != std::string::npos, "error names the command");

    lp::Response prio = d.handlePayload(R"({"command":"clear","priority":7})");
    requireTrue(!prio.success, "bad priority rejected");

    lp::Response junk = d.handlePayload("not json");
    requireTrue(!junk.success && !junk.error.empty(), "malformed payload rejected");
    requireTrue(d.queue().size() == 1, "rejected payloads are not queued");
    std::printf("  handlePayload PASS\n");
  }

  // --- Test 2: worker drains by priority, FIFO within a priority ---
  {
    lp::Daemon d(testConfig(sockPath), mockPanel());
    d.submit(lp::makeClear(lp::Priority::Low));
    d.submit(lp::makeShowProgress(20, lp::Priority::Medium));
    d.submit(lp::makeShowConnectedTest(lp::Priority::High));
    d.submit(lp::makeShowSymbol("dot", lp::Priority::High));
    d.submit(lp::makeShowSymbol("smiley", lp::Priority::Medium));

    requireTrue(d.start(false), "start without socket");
    requireTrue(d.waitForOutcomes(5, milliseconds(5000)), "all five executed");
    std::vector<lp::RenderOutcome> out = d.recentOutcomes();
    requireTrue(out.size() == 5, "five outcomes");
    requireTrue(out[0].kind == lp::CommandKind::ShowConnectedTest, "first HIGH first");
    requireTrue(out[1].kind == lp::CommandKind::ShowSymbol && out[1].ok, "second HIGH second");
    requireTrue(out[2].kind == lp::CommandKind::ShowProgress, "MEDIUM in order");
    requireTrue(out[3].kind == lp::CommandKind::ShowSymbol && !out[3].ok,
                "failed command recorded");
    requireTrue(out[4].kind == lp::CommandKind::Clear, "LOW last");
    requireTrue(d.isRunning(), "worker survives a failed command");

    d.stop();
    requireTrue(!d.isRunning(), "stopped");
    requireTrue(!d.start(false), "a stopped daemon does not restart");
    std::printf("  Priority drain PASS\n");
  }

  // --- Test 3: socket round trip and shutdown ---
  {
    lp::Daemon d(testConfig(sockPath), mockPanel());
    requireTrue(d.start(true), "start with socket");

    struct stat st;
    requireTrue(::stat(sockPath.c_str(), &st) == 0, "socket file exists");
    requireTrue(S_ISSOCK(st.st_mode), "is a socket");
    requireTrue((st.st_mode & 0777) == 0666, "socket mode 0666");

    lp::ClientConfig cc;
    cc.socketPath = sockPath;
    cc.timeoutMs = 2000;
    lp::CommandClient client(cc);

    lp::SendResult r = client.send(lp::makeShowSymbol("checkmark"));
    requireTrue(r.ok && r.delivered, "client command accepted");
    requireTrue(r.attempts == 1, "first attempt");
    requireTrue(d.waitForOutcomes(1, milliseconds(3000)), "command executed");

    lp::SendResult idle = client.showIdle();
    requireTrue(idle.ok, "convenience wrapper accepted");
    requireTrue(d.waitForOutcomes(2, milliseconds(3000)), "idle executed");

    lp::Response raw = rawExchange(sockPath, "[1,2,3]");
    requireTrue(!raw.success, "array payload rejected");
    lp::Response unknown = rawExchange(sockPath, R"({"command":"launch"})");
    requireTrue(!unknown.success && unknown.error.find("launch") != std::string::npos,
                "unknown command rejected over the socket");
    lp::Response ok = rawExchange(sockPath, R"({"command":"clear"})");
    requireTrue(ok.success && ok.error.empty(), "raw clear accepted");

    lp::SendResult bye = client.send(lp::makeShutdown());
    requireTrue(bye.ok, "shutdown accepted");
    requireTrue(d.waitForShutdown(milliseconds(5000)), "shutdown observed");
    d.stop();

    requireTrue(::stat(sockPath.c_str(), &st) != 0, "socket file removed");
    requireTrue(d.context().activeRenderThreads() == 0, "no render threads after stop");
    requireTrue(d.context().leakedCount() == 0, "nothing leaked");

    lp::ClientConfig dead = cc;
    dead.maxRetries = 3;
    dead.retryDelayMs = 10;
    lp::SendResult miss = lp::CommandClient(dead).send(lp::makeClear());
    requireTrue(!miss.ok && !miss.delivered, "nothing listening");
    requireTrue(miss.attempts == 3, "retried up to the limit");
    requireTrue(!miss.error.empty(), "connection error reported");
    std::printf("  Socket round trip PASS\n");
  }

  // --- Test 4: stop() does not return while a stalled client is still being handled ---
  {
    const std::string slowPath = std::string(dir) + "/slow.sock";
    std::atomic<bool> handlerDone{false};
    lp::UnixSocket::ReadStatus seen = lp::UnixSocket::ReadStatus::Complete;

    lp::SocketServerConfig sc;
    sc.path = slowPath;
    lp::SocketServer server(sc);
    requireTrue(server.start([&](lp::UnixSocket& c) {
      c.setTimeouts(5000);
      std::string partial;
      seen = c.readObject(partial, 1024);
      handlerDone.store(true);
    }), "slow server starts");

    std::string err;
    lp::UnixSocket client = lp::UnixSocket::connectTo(slowPath, err);
    requireTrue(client.valid(), "slow client connects");
    requireTrue(client.writeAll(R"({"command")"), "partial payload written");

    auto deadline = std::chrono::steady_clock::now() + milliseconds(2000);
    while (server.inFlight() == 0 && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(milliseconds(5));
    }
    requireTrue(server.inFlight() == 1, "connection in flight");

    auto t0 = std::chrono::steady_clock::now();
    server.stop();
    requireTrue(std::chrono::steady_clock::now() - t0 < milliseconds(2000),
                "stop does not wait for the client's own timeout");
    requireTrue(handlerDone.load(), "handler finished before stop returned");
    requireTrue(server.inFlight() == 0, "nothing in flight");
    requireTrue(seen == lp::UnixSocket::ReadStatus::Eof, "handler saw the shutdown");
    std::printf("  Stop with stalled client PASS\n");
  }

  // --- Test 5: a dripping peer cannot extend a read past its deadline ---
  {
    int fds[2];
    requireTrue(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0, "socketpair");
    lp::UnixSocket reader(fds[0]);
    lp::UnixSocket writer(fds[1]);
    requireTrue(reader.setTimeouts(2000), "per-recv timeout");

    std::atomic<bool> stopDrip{false};
    std::thread drip([&writer, &stopDrip]() {
      writer.writeAll("{");
      for (int i = 0; i < 30 && !stopDrip.load(); i++) {
        std::this_thread::sleep_for(milliseconds(100));
        writer.writeAll(" ");
      }
    });

    std::string partial;
    auto t0 = std::chrono::steady_clock::now();
    lp::UnixSocket::ReadStatus st = reader.readObject(partial, 1024, milliseconds(300));
    auto took = std::chrono::steady_clock::now() - t0;
    stopDrip.store(true);
    drip.join();

    requireTrue(st == lp::UnixSocket::ReadStatus::Error, "deadline reported as error");
    requireTrue(took < milliseconds(1500), "read gave up at its deadline");
    requireTrue(!partial.empty() && partial[0] == '{', "partial payload kept");
    std::printf("  Read deadline PASS\n");
  }

  rmdir(runDir.c_str());
  rmdir(dir);

  std::printf("\nD4.2 daemon PASS\n");
  return 0;
}
