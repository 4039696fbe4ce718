#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace modelhost {

static constexpr int64_t GiB = int64_t(1024) * 1024 * 1024;

// upper bound (exclusive) for a single memory requirement. sums of up to
// 1024 such figures stay within int64_t.
static constexpr int64_t kMaxResourceBytes =
    std::numeric_limits<int64_t>::max() / 1024;

// one loadable option for a task. immutable once constructed.
struct ResourceSpec {
  // identifier of the weights/artifact, e.g. a hugging face model id
  std::string model_id;

  // inference framework used to produce the resource, e.g. "sglang"
  std::string backend;

  // advertised device memory requirement in bytes
  int64_t declared_bytes = 0;

  // display only
  std::string speed_class = "medium";
  std::string description;
  std::optional<std::string> quantization;

  // e.g. frames per second for vision models
  std::optional<double> throughput_hint;
};

struct ResourceOption {
  std::string name;
  ResourceSpec spec;
};

// one task with its options. selected_option must be one of the option names.
struct TaskConfig {
  std::string task_id;

  std::string selected_option;

  // options in declaration order, names are unique
  std::vector<ResourceOption> options;

  // returns nullptr if the option does not exist
  const ResourceSpec* find_option(const std::string& name) const {
    for (const auto& option : options) {
      if (option.name == name) {
        return &option.spec;
      }
    }
    return nullptr;
  }

  const ResourceSpec* selected_spec() const {
    return find_option(selected_option);
  }
};

}  // namespace modelhost
