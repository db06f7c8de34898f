#pragma once
#include <rapidjson/document.h>

#include <string>
#include <vector>

namespace lp {

// One node of a project -> sprint -> story progress tree. The JSON form is
//   {"name": "...", "index": N, "progress": {"percentage": P},
//    "user_stories": [ ...nodes... ]}
// and every field is optional.
struct ProgressNode {
  std::string name;
  int index{0};
  double percentage{0.0};
  std::vector<ProgressNode> children;
};

ProgressNode progressNodeFromJson(const rapidjson::Value& v);
std::vector<ProgressNode> progressListFromJson(const rapidjson::Value* arr);

rapidjson::Value progressNodeToJson(const ProgressNode& node,
                                    rapidjson::Document::AllocatorType& alloc);
rapidjson::Value progressListToJson(const std::vector<ProgressNode>& nodes,
                                    rapidjson::Document::AllocatorType& alloc);

// show_single_layout
struct SingleLayoutModel {
  std::string projectName;
  double percentage{0.0};
  int currentSprint{0};
  int totalSprints{0};
  int completedStories{0};
  int totalStories{0};
  std::vector<ProgressNode> sprints;
};

// show_sprint_progress
struct SprintViewModel {
  double projectPercentage{0.0};
  std::vector<ProgressNode> sprints;
};

// show_user_story_layout / show_user_story_layout_cycling. `sprint.index`
// selects the S<n> label.
struct UserStoryModel {
  ProgressNode sprint;
  std::vector<ProgressNode> stories;
};

// Parsers throw std::invalid_argument on mistyped fields.
SingleLayoutModel singleLayoutFromParams(const rapidjson::Value& params);
SprintViewModel sprintViewFromParams(const rapidjson::Value& params);
std::vector<ProgressNode> sprintRowsFromParams(const rapidjson::Value& params);
UserStoryModel userStoryFromParams(const rapidjson::Value& params);

} // namespace lp
