#pragma once

#include <absl/synchronization/mutex.h>

#include <string>
#include <unordered_map>
#include <vector>

#include "common/macros.h"
#include "common/status.h"
#include "resource_spec.h"

namespace modelhost {

// maps task ids to their options and current selection. the table is built
// once from configuration; the only mutation afterwards is select().
// all methods are thread safe.
class SpecTable final {
 public:
  SpecTable() = default;

  // disable copy and move
  SpecTable(const SpecTable&) = delete;
  SpecTable& operator=(const SpecTable&) = delete;
  SpecTable(SpecTable&&) = delete;
  SpecTable& operator=(SpecTable&&) = delete;

  // add a task, returns CONFIG_INVALID if the task id is empty or duplicated,
  // the options are empty or duplicated, or the selection is not an option.
  Status add_task(TaskConfig task);

  bool contains(const std::string& task_id) const;

  // returns INVALID_TASK or INVALID_OPTION without touching the selection
  Status check_option(const std::string& task_id,
                      const std::string& option_name) const;

  // copy the currently selected spec of the task into spec
  Status selected_spec(const std::string& task_id,
                       ResourceSpec* spec,
                       std::string* option_name = nullptr) const;

  // change the selected option of the task
  Status select(const std::string& task_id, const std::string& option_name);

  // consistent snapshot of all tasks, in insertion order
  std::vector<TaskConfig> tasks() const;

  std::vector<std::string> task_ids() const;

  size_t size() const;

 private:
  // returns nullptr if not found
  const TaskConfig* find_task(const std::string& task_id) const
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  mutable absl::Mutex mutex_;

  std::vector<TaskConfig> tasks_ GUARDED_BY(mutex_);

  // task id -> index into tasks_
  std::unordered_map<std::string, size_t> index_ GUARDED_BY(mutex_);
};

}  // namespace modelhost
