#include "budget_validator.h"

#include <glog/logging.h>

#include <limits>
#include <vector>

namespace modelhost {
namespace {

// a + b, clamped to the int64_t range
int64_t saturating_add(int64_t a, int64_t b) {
  int64_t sum = 0;
  if (__builtin_add_overflow(a, b, &sum)) {
    return b > 0 ? std::numeric_limits<int64_t>::max()
                 : std::numeric_limits<int64_t>::min();
  }
  return sum;
}

}  // namespace

BudgetReport validate_budget(const std::vector<TaskConfig>& tasks,
                             int64_t total_capacity_bytes,
                             double threshold) {
  BudgetReport report;
  report.total_capacity_bytes = total_capacity_bytes;
  report.threshold = threshold;
  report.max_allowed_bytes = static_cast<int64_t>(
      static_cast<double>(total_capacity_bytes) * threshold);

  report.requirements.reserve(tasks.size());
  for (const auto& task : tasks) {
    const ResourceSpec* spec = task.selected_spec();
    CHECK(spec != nullptr) << "dangling selection for task " << task.task_id;
    TaskRequirement requirement;
    requirement.task_id = task.task_id;
    requirement.option_name = task.selected_option;
    requirement.model_id = spec->model_id;
    requirement.declared_bytes = spec->declared_bytes;
    report.total_required_bytes =
        saturating_add(report.total_required_bytes, spec->declared_bytes);
    report.requirements.push_back(std::move(requirement));
  }

  report.valid = report.total_required_bytes <= report.max_allowed_bytes;
  return report;
}

}  // namespace modelhost
