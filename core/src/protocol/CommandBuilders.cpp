#include "lp/protocol/CommandBuilders.hpp"

#include <utility>

namespace lp {

namespace {

rapidjson::Document newParams() {
  rapidjson::Document d;
  d.SetObject();
  return d;
}

void addString(rapidjson::Document& d, const char* key, const std::string& value) {
  d.AddMember(rapidjson::StringRef(key),
              rapidjson::Value(value.c_str(), static_cast<rapidjson::SizeType>(value.size()),
                               d.GetAllocator()),
              d.GetAllocator());
}

void addUserStoryParams(rapidjson::Document& d, const ProgressNode& sprint,
                        const std::vector<ProgressNode>& stories) {
  auto& a = d.GetAllocator();
  ProgressNode header = sprint;
  header.children.clear();
  d.AddMember("sprint_data", progressNodeToJson(header, a), a);
  d.AddMember("user_stories", progressListToJson(stories, a), a);
}

} // anonymous namespace

Command makeShowSymbol(const std::string& symbol, Priority priority) {
  auto d = newParams();
  addString(d, "symbol", symbol);
  return Command(CommandKind::ShowSymbol, priority, std::move(d));
}

Command makeShowAnimation(const std::string& animation, double durationSec,
                          double frameDelaySec, Priority priority) {
  auto d = newParams();
  auto& a = d.GetAllocator();
  addString(d, "animation", animation);
  if (durationSec > 0.0) {
    d.AddMember("duration", durationSec, a);
  } else {
    d.AddMember("duration", rapidjson::Value(rapidjson::kNullType), a);
  }
  d.AddMember("frame_delay", frameDelaySec, a);
  return Command(CommandKind::ShowAnimation, priority, std::move(d));
}

Command makeShowProgress(double percentage, Priority priority) {
  auto d = newParams();
  d.AddMember("percentage", percentage, d.GetAllocator());
  return Command(CommandKind::ShowProgress, priority, std::move(d));
}

Command makeShowSprintProgress(double projectPercentage,
                               const std::vector<ProgressNode>& sprints,
                               Priority priority) {
  auto d = newParams();
  auto& a = d.GetAllocator();
  d.AddMember("project_percentage", projectPercentage, a);
  d.AddMember("sprints", progressListToJson(sprints, a), a);
  return Command(CommandKind::ShowSprintProgress, priority, std::move(d));
}

Command makeShowSprintHorizontal(const std::vector<ProgressNode>& sprints, Priority priority) {
  auto d = newParams();
  auto& a = d.GetAllocator();
  d.AddMember("sprints", progressListToJson(sprints, a), a);
  return Command(CommandKind::ShowSprintHorizontal, priority, std::move(d));
}

Command makeShowSingleLayout(const SingleLayoutModel& model, Priority priority) {
  auto d = newParams();
  auto& a = d.GetAllocator();
  addString(d, "project_name", model.projectName);
  d.AddMember("percentage", model.percentage, a);
  d.AddMember("current_sprint", model.currentSprint, a);
  d.AddMember("total_sprints", model.totalSprints, a);
  d.AddMember("completed_stories", model.completedStories, a);
  d.AddMember("total_stories", model.totalStories, a);
  d.AddMember("sprints", progressListToJson(model.sprints, a), a);
  return Command(CommandKind::ShowSingleLayout, priority, std::move(d));
}

Command makeShowUserStoryLayout(const ProgressNode& sprint,
                                const std::vector<ProgressNode>& stories,
                                Priority priority) {
  auto d = newParams();
  addUserStoryParams(d, sprint, stories);
  return Command(CommandKind::ShowUserStoryLayout, priority, std::move(d));
}

Command makeShowUserStoryLayoutCycling(const ProgressNode& sprint,
                                       const std::vector<ProgressNode>& stories,
                                       double cycleIntervalSec, Priority priority) {
  auto d = newParams();
  addUserStoryParams(d, sprint, stories);
  d.AddMember("cycle_interval", cycleIntervalSec, d.GetAllocator());
  return Command(CommandKind::ShowUserStoryLayoutCycling, priority, std::move(d));
}

Command makeShowGif(const std::string& gifName, bool loop, Priority priority) {
  auto d = newParams();
  addString(d, "gif_name", gifName);
  d.AddMember("loop", loop, d.GetAllocator());
  return Command(CommandKind::ShowGif, priority, std::move(d));
}

Command makeStopAnimation(Priority priority) {
  return Command(CommandKind::StopAnimation, priority);
}

Command makeClear(Priority priority) {
  return Command(CommandKind::Clear, priority);
}

Command makeTest(Priority priority) {
  return Command(CommandKind::Test, priority);
}

Command makeShowConnectedTest(Priority priority) {
  return Command(CommandKind::ShowConnectedTest, priority);
}

Command makeShutdown(Priority priority) {
  return Command(CommandKind::Shutdown, priority);
}

} // namespace lp
