#include "lp/layout/ProgressModel.hpp"

#include "lp/protocol/Params.hpp"

#include <stdexcept>

namespace lp {

ProgressNode progressNodeFromJson(const rapidjson::Value& v) {
  if (!v.IsObject()) {
    throw std::invalid_argument("progress entry must be an object");
  }

  ProgressNode n;
  n.name = stringOr(v, "name", "");
  n.index = intOr(v, "index", 0);

  if (const auto* progress = objectOrNull(v, "progress")) {
    n.percentage = numberOr(*progress, "percentage", 0.0);
  } else {
    n.percentage = numberOr(v, "percentage", 0.0);
  }

  n.children = progressListFromJson(arrayOrNull(v, "user_stories"));
  return n;
}

std::vector<ProgressNode> progressListFromJson(const rapidjson::Value* arr) {
  std::vector<ProgressNode> out;
  if (!arr) return out;
  out.reserve(arr->Size());
  for (const auto& item : arr->GetArray()) {
    out.push_back(progressNodeFromJson(item));
  }
  return out;
}

rapidjson::Value progressNodeToJson(const ProgressNode& node,
                                    rapidjson::Document::AllocatorType& alloc) {
  rapidjson::Value obj(rapidjson::kObjectType);
  if (!node.name.empty()) {
    obj.AddMember("name", rapidjson::Value(node.name.c_str(), alloc), alloc);
  }
  obj.AddMember("index", node.index, alloc);

  rapidjson::Value progress(rapidjson::kObjectType);
  progress.AddMember("percentage", node.percentage, alloc);
  obj.AddMember("progress", progress, alloc);

  if (!node.children.empty()) {
    obj.AddMember("user_stories", progressListToJson(node.children, alloc), alloc);
  }
  return obj;
}

rapidjson::Value progressListToJson(const std::vector<ProgressNode>& nodes,
                                    rapidjson::Document::AllocatorType& alloc) {
  rapidjson::Value arr(rapidjson::kArrayType);
  for (const auto& n : nodes) {
    arr.PushBack(progressNodeToJson(n, alloc), alloc);
  }
  return arr;
}

SingleLayoutModel singleLayoutFromParams(const rapidjson::Value& params) {
  SingleLayoutModel m;
  m.projectName = stringOr(params, "project_name", "");
  m.percentage = numberOr(params, "percentage", 0.0);
  m.currentSprint = intOr(params, "current_sprint", 0);
  m.totalSprints = intOr(params, "total_sprints", 0);
  m.completedStories = intOr(params, "completed_stories", 0);
  m.totalStories = intOr(params, "total_stories", 0);
  m.sprints = progressListFromJson(arrayOrNull(params, "sprints"));
  return m;
}

SprintViewModel sprintViewFromParams(const rapidjson::Value& params) {
  SprintViewModel m;
  m.projectPercentage = numberOr(params, "project_percentage", 0.0);
  m.sprints = progressListFromJson(arrayOrNull(params, "sprints"));
  return m;
}

std::vector<ProgressNode> sprintRowsFromParams(const rapidjson::Value& params) {
  return progressListFromJson(arrayOrNull(params, "sprints"));
}

UserStoryModel userStoryFromParams(const rapidjson::Value& params) {
  UserStoryModel m;
  if (const auto* sprint = objectOrNull(params, "sprint_data")) {
    m.sprint = progressNodeFromJson(*sprint);
  }
  m.stories = progressListFromJson(arrayOrNull(params, "user_stories"));
  return m;
}

} // namespace lp
