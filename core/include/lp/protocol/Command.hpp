#pragma once
#include <rapidjson/document.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace lp {

enum class CommandKind : std::uint8_t {
  ShowSymbol,
  ShowAnimation,
  ShowProgress,
  ShowSprintProgress,
  ShowSprintHorizontal,
  ShowSingleLayout,
  ShowUserStoryLayout,
  ShowUserStoryLayoutCycling,
  ShowGif,
  StopAnimation,
  Clear,
  Test,
  ShowConnectedTest,
  Shutdown
};

inline constexpr std::size_t kCommandKindCount = 14;

const std::array<CommandKind, kCommandKindCount>& allCommandKinds();

// Wire name, e.g. "show_symbol".
const char* commandKindName(CommandKind kind);
bool parseCommandKind(const std::string& name, CommandKind& out);

enum class Priority : int {
  Low = 0,
  Medium = 1,
  High = 2
};

const char* priorityName(Priority p);
bool priorityFromInt(std::int64_t value, Priority& out);

// An immutable request. Params are shared, so copies are cheap and the
// worker can hand the same params to a render thread without copying.
class Command {
public:
  Command();
  Command(CommandKind kind, Priority priority);
  Command(CommandKind kind, Priority priority, rapidjson::Document params);

  CommandKind kind() const { return kind_; }
  Priority priority() const { return priority_; }

  // Always a JSON object (possibly empty).
  const rapidjson::Value& params() const { return *params_; }

  // Deep equality over (kind, priority, params).
  bool operator==(const Command& other) const;
  bool operator!=(const Command& other) const { return !(*this == other); }

private:
  CommandKind kind_{CommandKind::Clear};
  Priority priority_{Priority::Medium};
  std::shared_ptr<const rapidjson::Document> params_;
};

// Reply to a client once its command is queued (or rejected). Says
// nothing about whether the command rendered.
struct Response {
  bool success{true};
  std::string message;
  std::string error; // serialized as null when empty

  static Response accepted();
  static Response rejected(const std::string& error);
};

// What the executor recorded after running a dequeued command.
struct RenderOutcome {
  std::uint64_t sequence{0};
  CommandKind kind{CommandKind::Clear};
  bool ok{true};
  std::string error;
};

} // namespace lp
