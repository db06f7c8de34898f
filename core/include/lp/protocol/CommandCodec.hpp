#pragma once
#include "lp/protocol/Command.hpp"

#include <string>

namespace lp {

enum class ProtocolErrorCode {
  None,
  MalformedJson,
  NotAnObject,
  MissingCommand,
  UnknownCommand,
  BadPriority,
  BadParams,
  PayloadTooLarge
};

const char* protocolErrorCodeName(ProtocolErrorCode code);

struct ProtocolError {
  ProtocolErrorCode code{ProtocolErrorCode::None};
  std::string message;
};

struct DecodeResult {
  bool ok{true};
  ProtocolError err{};
  Command command;
};

// {"command": "<kind>", "priority": <0|1|2>, "params": {...}}
std::string encodeCommand(const Command& cmd);

// Missing "priority" means MEDIUM, missing "params" means {}.
DecodeResult decodeCommand(const std::string& jsonText);

// {"success": bool, "message": "...", "error": "..."|null}
std::string encodeResponse(const Response& response);
bool decodeResponse(const std::string& jsonText, Response& out);

} // namespace lp
