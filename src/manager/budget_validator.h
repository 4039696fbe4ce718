#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "resource_spec.h"

namespace modelhost {

struct TaskRequirement {
  std::string task_id;
  std::string option_name;
  std::string model_id;
  int64_t declared_bytes = 0;
};

struct BudgetReport {
  // total_required_bytes <= max_allowed_bytes
  bool valid = false;

  int64_t total_capacity_bytes = 0;
  int64_t total_required_bytes = 0;
  double threshold = 0.0;

  // total_capacity_bytes * threshold
  int64_t max_allowed_bytes = 0;

  // selected option of every task, in spec table order
  std::vector<TaskRequirement> requirements;
};

// checks that the selected options of all tasks together declare no more than
// threshold * total_capacity_bytes. pure, independent of what is loaded.
BudgetReport validate_budget(const std::vector<TaskConfig>& tasks,
                             int64_t total_capacity_bytes,
                             double threshold);

}  // namespace modelhost
