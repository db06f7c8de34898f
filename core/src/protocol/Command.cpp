#include "lp/protocol/Command.hpp"

#include <utility>

namespace lp {

namespace {

std::shared_ptr<const rapidjson::Document> emptyParams() {
  auto d = std::make_shared<rapidjson::Document>();
  d->SetObject();
  return d;
}

} // anonymous namespace

const std::array<CommandKind, kCommandKindCount>& allCommandKinds() {
  static const std::array<CommandKind, kCommandKindCount> kinds = {
    CommandKind::ShowSymbol,
    CommandKind::ShowAnimation,
    CommandKind::ShowProgress,
    CommandKind::ShowSprintProgress,
    CommandKind::ShowSprintHorizontal,
    CommandKind::ShowSingleLayout,
    CommandKind::ShowUserStoryLayout,
    CommandKind::ShowUserStoryLayoutCycling,
    CommandKind::ShowGif,
    CommandKind::StopAnimation,
    CommandKind::Clear,
    CommandKind::Test,
    CommandKind::ShowConnectedTest,
    CommandKind::Shutdown,
  };
  return kinds;
}

const char* commandKindName(CommandKind kind) {
  switch (kind) {
    case CommandKind::ShowSymbol:                 return "show_symbol";
    case CommandKind::ShowAnimation:              return "show_animation";
    case CommandKind::ShowProgress:               return "show_progress";
    case CommandKind::ShowSprintProgress:         return "show_sprint_progress";
    case CommandKind::ShowSprintHorizontal:       return "show_sprint_horizontal";
    case CommandKind::ShowSingleLayout:           return "show_single_layout";
    case CommandKind::ShowUserStoryLayout:        return "show_user_story_layout";
    case CommandKind::ShowUserStoryLayoutCycling: return "show_user_story_layout_cycling";
    case CommandKind::ShowGif:                    return "show_gif";
    case CommandKind::StopAnimation:              return "stop_animation";
    case CommandKind::Clear:                      return "clear";
    case CommandKind::Test:                       return "test";
    case CommandKind::ShowConnectedTest:          return "show_connected_test";
    case CommandKind::Shutdown:                   return "shutdown";
  }
  return "unknown";
}

bool parseCommandKind(const std::string& name, CommandKind& out) {
  for (CommandKind k : allCommandKinds()) {
    if (name == commandKindName(k)) {
      out = k;
      return true;
    }
  }
  return false;
}

const char* priorityName(Priority p) {
  switch (p) {
    case Priority::Low:    return "LOW";
    case Priority::Medium: return "MEDIUM";
    case Priority::High:   return "HIGH";
  }
  return "MEDIUM";
}

bool priorityFromInt(std::int64_t value, Priority& out) {
  if (value < 0 || value > 2) return false;
  out = static_cast<Priority>(value);
  return true;
}

Command::Command() : params_(emptyParams()) {}

Command::Command(CommandKind kind, Priority priority)
    : kind_(kind), priority_(priority), params_(emptyParams()) {}

Command::Command(CommandKind kind, Priority priority, rapidjson::Document params)
    : kind_(kind), priority_(priority) {
  if (!params.IsObject()) params.SetObject();
  params_ = std::make_shared<const rapidjson::Document>(std::move(params));
}

bool Command::operator==(const Command& other) const {
  if (kind_ != other.kind_ || priority_ != other.priority_) return false;
  if (params_ == other.params_) return true;
  return static_cast<const rapidjson::Value&>(*params_) ==
         static_cast<const rapidjson::Value&>(*other.params_);
}

Response Response::accepted() {
  Response r;
  r.success = true;
  r.message = "Command queued";
  return r;
}

Response Response::rejected(const std::string& error) {
  Response r;
  r.success = false;
  r.error = error;
  return r;
}

} // namespace lp
