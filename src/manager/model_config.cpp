#include "model_config.h"

#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace modelhost {
namespace {

using nlohmann::json;

Status invalid(const std::string& msg) {
  return {StatusCode::CONFIG_INVALID, msg};
}

// missing and null are treated the same for optional fields
bool is_missing(const json& data, const char* key) {
  return !data.contains(key) || data[key].is_null();
}

Status read_string(const json& data,
                   const char* key,
                   const std::string& where,
                   bool required,
                   std::optional<std::string>* value) {
  if (is_missing(data, key)) {
    if (required) {
      return invalid(absl::StrCat(where, " is missing required field '", key,
                                  "'"));
    }
    return {};
  }
  if (!data[key].is_string()) {
    return invalid(absl::StrCat(where, ": '", key, "' must be a string"));
  }
  *value = data[key].get<std::string>();
  return {};
}

Status read_number(const json& data,
                   const char* key,
                   const std::string& where,
                   std::optional<double>* value) {
  if (is_missing(data, key)) {
    return {};
  }
  if (!data[key].is_number()) {
    return invalid(absl::StrCat(where, ": '", key, "' must be a number"));
  }
  *value = data[key].get<double>();
  return {};
}

Status read_integer(const json& data,
                    const char* key,
                    const std::string& where,
                    int32_t* value) {
  if (is_missing(data, key)) {
    return {};
  }
  if (!data[key].is_number_integer()) {
    return invalid(absl::StrCat(where, ": '", key, "' must be an integer"));
  }
  *value = data[key].get<int32_t>();
  return {};
}

Status parse_option(const std::string& where,
                    const json& data,
                    ResourceSpec* spec) {
  if (!data.is_object()) {
    return invalid(absl::StrCat(where, " must be an object"));
  }

  std::optional<std::string> model_id;
  std::optional<std::string> framework;
  std::optional<std::string> speed;
  std::optional<std::string> description;
  std::optional<double> vram_gb;
  std::optional<double> fps;

  Status status = read_string(data, "model_id", where, true, &model_id);
  if (status.ok()) {
    status = read_string(data, "framework", where, true, &framework);
  }
  if (status.ok()) {
    status = read_string(data, "speed", where, false, &speed);
  }
  if (status.ok()) {
    status = read_string(data, "description", where, false, &description);
  }
  if (status.ok()) {
    status = read_string(data, "quantization", where, false,
                         &spec->quantization);
  }
  if (status.ok()) {
    status = read_number(data, "vram_gb", where, &vram_gb);
  }
  if (status.ok()) {
    status = read_number(data, "fps", where, &fps);
  }
  if (!status.ok()) {
    return status;
  }

  if (vram_gb.value_or(0) < 0) {
    return invalid(absl::StrCat(where, ": 'vram_gb' must not be negative"));
  }
  const double bytes = vram_gb.value_or(0) * static_cast<double>(GiB);
  if (!std::isfinite(bytes) ||
      bytes >= static_cast<double>(kMaxResourceBytes)) {
    return invalid(absl::StrCat(where, ": 'vram_gb' is out of range"));
  }

  spec->model_id = model_id.value();
  spec->backend = framework.value();
  spec->declared_bytes = static_cast<int64_t>(bytes);
  spec->speed_class = speed.value_or("medium");
  spec->description = description.value_or("");
  spec->throughput_hint = fps;
  return {};
}

Status parse_task(const std::string& task_id,
                  const json& data,
                  TaskConfig* task) {
  const std::string where = absl::StrCat("task '", task_id, "'");
  if (!data.is_object()) {
    return invalid(absl::StrCat(where, " must be an object"));
  }

  std::optional<std::string> selected;
  Status status = read_string(data, "selected", where, true, &selected);
  if (!status.ok()) {
    return status;
  }
  if (!data.contains("options") || !data["options"].is_object() ||
      data["options"].empty()) {
    return invalid(
        absl::StrCat(where, " must have a non-empty 'options' object"));
  }

  task->task_id = task_id;
  task->selected_option = selected.value();
  for (const auto& [name, option_data] : data["options"].items()) {
    ResourceOption option;
    option.name = name;
    status = parse_option(
        absl::StrCat(where, " option '", name, "'"), option_data, &option.spec);
    if (!status.ok()) {
      return status;
    }
    task->options.push_back(std::move(option));
  }
  if (task->find_option(task->selected_option) == nullptr) {
    return invalid(absl::StrCat(where,
                                ": selected option '",
                                task->selected_option,
                                "' is not one of its options"));
  }
  return {};
}

Status parse_inference(const json& data, InferenceOptions* options) {
  const std::string where = "inference";
  if (!data.is_object()) {
    return invalid("'inference' must be an object");
  }

  // max_memory_per_model is either "auto" or a figure, keep it as text
  if (!is_missing(data, "max_memory_per_model")) {
    const auto& value = data["max_memory_per_model"];
    if (value.is_string()) {
      options->max_memory_per_model = value.get<std::string>();
    } else if (value.is_number()) {
      options->max_memory_per_model = value.dump();
    } else {
      return invalid("inference: 'max_memory_per_model' must be a string");
    }
  }

  std::optional<double> threshold;
  Status status = read_number(data, "offload_threshold", where, &threshold);
  if (!status.ok()) {
    return status;
  }
  if (threshold.has_value()) {
    if (threshold.value() < 0.0 || threshold.value() > 1.0) {
      return invalid("inference: 'offload_threshold' must be within [0, 1]");
    }
    options->offload_threshold = threshold.value();
  }

  if (!is_missing(data, "warmup_on_startup")) {
    if (!data["warmup_on_startup"].is_boolean()) {
      return invalid("inference: 'warmup_on_startup' must be a boolean");
    }
    options->warmup_on_startup = data["warmup_on_startup"].get<bool>();
  }

  status = read_integer(
      data, "default_batch_size", where, &options->default_batch_size);
  if (status.ok()) {
    status =
        read_integer(data, "max_batch_size", where, &options->max_batch_size);
  }
  if (!status.ok()) {
    return status;
  }
  if (options->default_batch_size < 1 || options->max_batch_size < 1) {
    return invalid("inference: batch sizes must be positive");
  }
  if (options->default_batch_size > options->max_batch_size) {
    return invalid(
        "inference: 'default_batch_size' must not exceed 'max_batch_size'");
  }
  return {};
}

}  // namespace

Status parse_model_config(const json& config,
                          SpecTable* table,
                          InferenceOptions* options) {
  CHECK(table != nullptr);
  CHECK(options != nullptr);

  if (!config.is_object()) {
    return invalid("config must be an object");
  }
  if (!config.contains("models") || !config["models"].is_object()) {
    return invalid("config is missing the 'models' object");
  }

  for (const auto& [task_id, task_data] : config["models"].items()) {
    TaskConfig task;
    Status status = parse_task(task_id, task_data, &task);
    if (!status.ok()) {
      return status;
    }
    status = table->add_task(std::move(task));
    if (!status.ok()) {
      return status;
    }
  }

  if (config.contains("inference")) {
    return parse_inference(config["inference"], options);
  }
  return {};
}

Status load_model_config(const std::string& config_path,
                         SpecTable* table,
                         InferenceOptions* options) {
  if (!std::filesystem::exists(config_path)) {
    return invalid(absl::StrCat("Config file not found: ", config_path));
  }
  std::ifstream ifs(config_path);
  if (!ifs.is_open()) {
    return invalid(absl::StrCat("Failed to open config file: ", config_path));
  }

  const json config =
      json::parse(ifs, /*cb=*/nullptr, /*allow_exceptions=*/false);
  if (config.is_discarded()) {
    return invalid(absl::StrCat("Malformed json in config file: ", config_path));
  }

  Status status = parse_model_config(config, table, options);
  if (!status.ok()) {
    return {status.code(),
            absl::StrCat(config_path, ": ", status.message())};
  }
  LOG(INFO) << "Loaded " << table->size() << " tasks from " << config_path;
  return status;
}

json to_json(const std::vector<TaskConfig>& tasks,
             const InferenceOptions& options) {
  json models = json::object();
  for (const auto& task : tasks) {
    json task_data;
    task_data["selected"] = task.selected_option;
    json options_data = json::object();
    for (const auto& option : task.options) {
      const ResourceSpec& spec = option.spec;
      json option_data;
      option_data["model_id"] = spec.model_id;
      option_data["framework"] = spec.backend;
      option_data["vram_gb"] =
          static_cast<double>(spec.declared_bytes) / static_cast<double>(GiB);
      option_data["speed"] = spec.speed_class;
      option_data["description"] = spec.description;
      option_data["quantization"] =
          spec.quantization ? json(*spec.quantization) : json(nullptr);
      option_data["fps"] =
          spec.throughput_hint ? json(*spec.throughput_hint) : json(nullptr);
      options_data[option.name] = std::move(option_data);
    }
    task_data["options"] = std::move(options_data);
    models[task.task_id] = std::move(task_data);
  }

  json inference;
  inference["max_memory_per_model"] = options.max_memory_per_model;
  inference["offload_threshold"] = options.offload_threshold;
  inference["warmup_on_startup"] = options.warmup_on_startup;
  inference["default_batch_size"] = options.default_batch_size;
  inference["max_batch_size"] = options.max_batch_size;

  json config;
  config["models"] = std::move(models);
  config["inference"] = std::move(inference);
  return config;
}

}  // namespace modelhost
