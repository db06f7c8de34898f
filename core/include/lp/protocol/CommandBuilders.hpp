#pragma once
#include "lp/layout/ProgressModel.hpp"
#include "lp/protocol/Command.hpp"

#include <string>
#include <vector>

namespace lp {

// Typed constructors for each command kind, with the default priority
// each kind is usually sent at.

Command makeShowSymbol(const std::string& symbol, Priority priority = Priority::Medium);

// durationSec <= 0 means "until preempted".
Command makeShowAnimation(const std::string& animation,
                          double durationSec = 0.0,
                          double frameDelaySec = 0.2,
                          Priority priority = Priority::Medium);

Command makeShowProgress(double percentage, Priority priority = Priority::Low);

Command makeShowSprintProgress(double projectPercentage,
                               const std::vector<ProgressNode>& sprints,
                               Priority priority = Priority::Low);

Command makeShowSprintHorizontal(const std::vector<ProgressNode>& sprints,
                                 Priority priority = Priority::Low);

Command makeShowSingleLayout(const SingleLayoutModel& model,
                             Priority priority = Priority::Low);

Command makeShowUserStoryLayout(const ProgressNode& sprint,
                                const std::vector<ProgressNode>& stories,
                                Priority priority = Priority::Low);

Command makeShowUserStoryLayoutCycling(const ProgressNode& sprint,
                                       const std::vector<ProgressNode>& stories,
                                       double cycleIntervalSec = 10.0,
                                       Priority priority = Priority::Low);

Command makeShowGif(const std::string& gifName, bool loop = true,
                    Priority priority = Priority::Medium);

Command makeStopAnimation(Priority priority = Priority::High);
Command makeClear(Priority priority = Priority::Medium);
Command makeTest(Priority priority = Priority::Medium);
Command makeShowConnectedTest(Priority priority = Priority::High);
Command makeShutdown(Priority priority = Priority::High);

} // namespace lp
