#include "spec_table.h"

#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include <string>
#include <unordered_set>
#include <vector>

namespace modelhost {

Status SpecTable::add_task(TaskConfig task) {
  if (task.task_id.empty()) {
    return {StatusCode::CONFIG_INVALID, "task id must not be empty"};
  }
  if (task.options.empty()) {
    return {StatusCode::CONFIG_INVALID,
            absl::StrCat("task ", task.task_id, " has no options")};
  }
  std::unordered_set<std::string> names;
  for (const auto& option : task.options) {
    if (!names.insert(option.name).second) {
      return {StatusCode::CONFIG_INVALID,
              absl::StrCat("duplicated option ",
                           option.name,
                           " for task ",
                           task.task_id)};
    }
    if (option.spec.declared_bytes < 0 ||
        option.spec.declared_bytes >= kMaxResourceBytes) {
      return {StatusCode::CONFIG_INVALID,
              absl::StrCat("memory requirement out of range for option ",
                           option.name,
                           " of task ",
                           task.task_id)};
    }
  }
  if (names.count(task.selected_option) == 0) {
    return {StatusCode::CONFIG_INVALID,
            absl::StrCat("selected option ",
                         task.selected_option,
                         " is not an option of task ",
                         task.task_id)};
  }

  absl::MutexLock lock(&mutex_);
  if (index_.count(task.task_id) != 0) {
    return {StatusCode::CONFIG_INVALID,
            absl::StrCat("duplicated task ", task.task_id)};
  }
  index_[task.task_id] = tasks_.size();
  tasks_.push_back(std::move(task));
  return {};
}

const TaskConfig* SpecTable::find_task(const std::string& task_id) const {
  auto it = index_.find(task_id);
  if (it == index_.end()) {
    return nullptr;
  }
  return &tasks_[it->second];
}

bool SpecTable::contains(const std::string& task_id) const {
  absl::MutexLock lock(&mutex_);
  return index_.count(task_id) != 0;
}

Status SpecTable::check_option(const std::string& task_id,
                               const std::string& option_name) const {
  absl::MutexLock lock(&mutex_);
  const TaskConfig* task = find_task(task_id);
  if (task == nullptr) {
    return {StatusCode::INVALID_TASK,
            absl::StrCat("Invalid task type: ", task_id)};
  }
  if (task->find_option(option_name) == nullptr) {
    return {StatusCode::INVALID_OPTION,
            absl::StrCat(
                "Invalid model name: ", option_name, " for task ", task_id)};
  }
  return {};
}

Status SpecTable::selected_spec(const std::string& task_id,
                                ResourceSpec* spec,
                                std::string* option_name) const {
  absl::MutexLock lock(&mutex_);
  const TaskConfig* task = find_task(task_id);
  if (task == nullptr) {
    return {StatusCode::INVALID_TASK,
            absl::StrCat("Invalid task type: ", task_id)};
  }
  const ResourceSpec* selected = task->selected_spec();
  // add_task and select keep the selection valid
  CHECK(selected != nullptr) << "dangling selection for task " << task_id;
  *spec = *selected;
  if (option_name != nullptr) {
    *option_name = task->selected_option;
  }
  return {};
}

Status SpecTable::select(const std::string& task_id,
                         const std::string& option_name) {
  absl::MutexLock lock(&mutex_);
  auto it = index_.find(task_id);
  if (it == index_.end()) {
    return {StatusCode::INVALID_TASK,
            absl::StrCat("Invalid task type: ", task_id)};
  }
  TaskConfig& task = tasks_[it->second];
  if (task.find_option(option_name) == nullptr) {
    return {StatusCode::INVALID_OPTION,
            absl::StrCat(
                "Invalid model name: ", option_name, " for task ", task_id)};
  }
  task.selected_option = option_name;
  return {};
}

std::vector<TaskConfig> SpecTable::tasks() const {
  absl::MutexLock lock(&mutex_);
  return tasks_;
}

std::vector<std::string> SpecTable::task_ids() const {
  absl::MutexLock lock(&mutex_);
  std::vector<std::string> ids;
  ids.reserve(tasks_.size());
  for (const auto& task : tasks_) {
    ids.push_back(task.task_id);
  }
  return ids;
}

size_t SpecTable::size() const {
  absl::MutexLock lock(&mutex_);
  return tasks_.size();
}

}  // namespace modelhost
