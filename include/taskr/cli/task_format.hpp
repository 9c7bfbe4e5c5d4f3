#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "taskr/tasks/labels.hpp"
#include "taskr/tasks/task.hpp"
#include "taskr/util/date.hpp"

namespace taskr::cli {

// Description for display: priority marks and the next-item label removed
std::string displayDescription(const taskr::tasks::Task& task,
                               const taskr::tasks::LabelMatcher& labels);

// Due date for display, empty for tasks without one
std::string displayDue(const taskr::tasks::Task& task);

// ANSI colour for a due date urgency, empty for kNone
std::string urgencyColor(taskr::util::Urgency urgency);

nlohmann::json taskToJson(const taskr::tasks::Task& task, const std::string& document);

// Quote a CSV field when needed
std::string csvField(const std::string& value);

} // namespace taskr::cli
