#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "common/status.h"
#include "spec_table.h"

namespace modelhost {

// global settings from the "inference" section of the models config.
struct InferenceOptions {
  // per model memory cap, opaque to the manager ("auto" or a figure)
  std::string max_memory_per_model = "auto";

  // fraction of device memory the selected options may declare in total
  double offload_threshold = 0.85;

  // load every selected option at startup
  bool warmup_on_startup = false;

  // batch size hints, opaque to the manager
  int32_t default_batch_size = 1;
  int32_t max_batch_size = 8;
};

// parse a models config document into the spec table and inference options.
// returns CONFIG_INVALID with a description of the first problem found.
// the spec table is left partially filled on error and must be discarded.
Status parse_model_config(const nlohmann::json& config,
                          SpecTable* table,
                          InferenceOptions* options);

// read and parse the models config json file
Status load_model_config(const std::string& config_path,
                         SpecTable* table,
                         InferenceOptions* options);

// render the spec table and inference options in the config file layout
nlohmann::json to_json(const std::vector<TaskConfig>& tasks,
                       const InferenceOptions& options);

}  // namespace modelhost
