#include "lp/protocol/CommandCodec.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <utility>

namespace lp {

namespace {

DecodeResult fail(ProtocolErrorCode code, const std::string& message) {
  DecodeResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  return r;
}

} // anonymous namespace

const char* protocolErrorCodeName(ProtocolErrorCode code) {
  switch (code) {
    case ProtocolErrorCode::None:            return "NONE";
    case ProtocolErrorCode::MalformedJson:   return "MALFORMED_JSON";
    case ProtocolErrorCode::NotAnObject:     return "NOT_AN_OBJECT";
    case ProtocolErrorCode::MissingCommand:  return "MISSING_COMMAND";
    case ProtocolErrorCode::UnknownCommand:  return "UNKNOWN_COMMAND";
    case ProtocolErrorCode::BadPriority:     return "BAD_PRIORITY";
    case ProtocolErrorCode::BadParams:       return "BAD_PARAMS";
    case ProtocolErrorCode::PayloadTooLarge: return "PAYLOAD_TOO_LARGE";
  }
  return "UNKNOWN";
}

std::string encodeCommand(const Command& cmd) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("command");
  w.String(commandKindName(cmd.kind()));
  w.Key("priority");
  w.Int(static_cast<int>(cmd.priority()));
  w.Key("params");
  cmd.params().Accept(w);
  w.EndObject();
  return sb.GetString();
}

DecodeResult decodeCommand(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str(), jsonText.size());

  if (d.HasParseError()) {
    return fail(ProtocolErrorCode::MalformedJson,
                std::string("invalid JSON: ") + rapidjson::GetParseError_En(d.GetParseError()) +
                " at offset " + std::to_string(d.GetErrorOffset()));
  }
  if (!d.IsObject()) {
    return fail(ProtocolErrorCode::NotAnObject, "payload is not a JSON object");
  }

  auto cmdIt = d.FindMember("command");
  if (cmdIt == d.MemberEnd() || !cmdIt->value.IsString()) {
    return fail(ProtocolErrorCode::MissingCommand, "missing string field: command");
  }

  CommandKind kind;
  const std::string name = cmdIt->value.GetString();
  if (!parseCommandKind(name, kind)) {
    return fail(ProtocolErrorCode::UnknownCommand, "unknown command: " + name);
  }

  Priority priority = Priority::Medium;
  auto prIt = d.FindMember("priority");
  if (prIt != d.MemberEnd() && !prIt->value.IsNull()) {
    if (!prIt->value.IsInt64() || !priorityFromInt(prIt->value.GetInt64(), priority)) {
      return fail(ProtocolErrorCode::BadPriority, "priority must be 0, 1 or 2");
    }
  }

  rapidjson::Document params;
  params.SetObject();
  auto paramsIt = d.FindMember("params");
  if (paramsIt != d.MemberEnd() && !paramsIt->value.IsNull()) {
    if (!paramsIt->value.IsObject()) {
      return fail(ProtocolErrorCode::BadParams, "params must be a JSON object");
    }
    params.CopyFrom(paramsIt->value, params.GetAllocator());
  }

  DecodeResult r;
  r.command = Command(kind, priority, std::move(params));
  return r;
}

std::string encodeResponse(const Response& response) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("success");
  w.Bool(response.success);
  w.Key("message");
  w.String(response.message.c_str(), static_cast<rapidjson::SizeType>(response.message.size()));
  w.Key("error");
  if (response.error.empty()) {
    w.Null();
  } else {
    w.String(response.error.c_str(), static_cast<rapidjson::SizeType>(response.error.size()));
  }
  w.EndObject();
  return sb.GetString();
}

bool decodeResponse(const std::string& jsonText, Response& out) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str(), jsonText.size());
  if (d.HasParseError() || !d.IsObject()) return false;

  auto okIt = d.FindMember("success");
  if (okIt == d.MemberEnd() || !okIt->value.IsBool()) return false;

  Response r;
  r.success = okIt->value.GetBool();

  auto msgIt = d.FindMember("message");
  if (msgIt != d.MemberEnd() && msgIt->value.IsString()) r.message = msgIt->value.GetString();

  auto errIt = d.FindMember("error");
  if (errIt != d.MemberEnd() && errIt->value.IsString()) r.error = errIt->value.GetString();

  out = std::move(r);
  return true;
}

} // namespace lp
