// ledctl - send one command to ledpaneld
//
// Usage: ledctl <command> [--priority low|medium|high|0|1|2]
//               [--params '<json object>'] [--socket PATH]
//
// Prints the daemon's response as JSON. Exit status is 0 when the command
// was queued, 1 when it was rejected or the daemon was unreachable, 2 on
// bad usage.

#include "lp/config/DaemonConfig.hpp"
#include "lp/debug/Log.hpp"
#include "lp/ipc/CommandClient.hpp"
#include "lp/protocol/CommandCodec.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <cstdio>
#include <cstring>
#include <string>
#include <utility>

static void usage() {
  std::fprintf(stderr,
               "usage: ledctl <command> [--priority low|medium|high] [--params JSON]"
               " [--socket PATH]\n\ncommands:\n");
  for (lp::CommandKind k : lp::allCommandKinds()) {
    std::fprintf(stderr, "  %s\n", lp::commandKindName(k));
  }
}

static bool parsePriority(const std::string& s, lp::Priority& out) {
  if (s == "low" || s == "0") out = lp::Priority::Low;
  else if (s == "medium" || s == "1") out = lp::Priority::Medium;
  else if (s == "high" || s == "2") out = lp::Priority::High;
  else return false;
  return true;
}

int main(int argc, char* argv[]) {
  if (argc < 2 || std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0) {
    usage();
    return 2;
  }

  lp::ClientConfig cfg = lp::loadClientConfigFromEnv();
  lp::setLogLevel(lp::LogLevel::Warn);

  lp::CommandKind kind;
  if (!lp::parseCommandKind(argv[1], kind)) {
    std::fprintf(stderr, "ledctl: unknown command '%s'\n", argv[1]);
    usage();
    return 2;
  }

  lp::Priority priority = lp::Priority::Medium;
  std::string paramsText = "{}";
  for (int i = 2; i < argc; i++) {
    std::string arg = argv[i];
    if (i + 1 >= argc) {
      std::fprintf(stderr, "ledctl: %s needs a value\n", arg.c_str());
      return 2;
    }
    std::string val = argv[++i];
    if (arg == "--priority") {
      if (!parsePriority(val, priority)) {
        std::fprintf(stderr, "ledctl: bad priority '%s'\n", val.c_str());
        return 2;
      }
    } else if (arg == "--params") {
      paramsText = val;
    } else if (arg == "--socket") {
      cfg.socketPath = val;
    } else {
      std::fprintf(stderr, "ledctl: unknown option %s\n", arg.c_str());
      return 2;
    }
  }

  rapidjson::Document params;
  params.Parse(paramsText.c_str());
  if (params.HasParseError() || !params.IsObject()) {
    std::fprintf(stderr, "ledctl: --params must be a JSON object (%s)\n",
                 params.HasParseError() ? rapidjson::GetParseError_En(params.GetParseError())
                                        : "not an object");
    return 2;
  }

  lp::CommandClient client(cfg);
  lp::SendResult r = client.send(lp::Command(kind, priority, std::move(params)));
  if (!r.delivered) {
    std::fprintf(stderr, "ledctl: %s\n", r.error.c_str());
    return 1;
  }
  std::printf("%s\n", lp::encodeResponse(r.response).c_str());
  return r.ok ? 0 : 1;
}
