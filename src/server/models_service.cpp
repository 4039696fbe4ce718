#include "models_service.h"

#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <glog/logging.h>

#include <string>

namespace modelhost {
namespace {

using json = nlohmann::json;
using boost::beast::http::verb;

double to_gb(int64_t bytes) {
  return static_cast<double>(bytes) / static_cast<double>(GiB);
}

std::string format_time(absl::Time time) {
  return absl::FormatTime(absl::RFC3339_full, time, absl::UTCTimeZone());
}

bool send(HttpServer::Transport& transport,
          const ModelsService::Response& response) {
  return transport.send_json(response.body, response.status_code);
}

bool method_not_allowed(HttpServer::Transport& transport) {
  json body;
  body["error"] = "METHOD_NOT_ALLOWED";
  body["message"] = "Method not allowed for " + transport.path();
  return transport.send_json(body, 405);
}

}  // namespace

ModelsService::ModelsService(ResourceManager* manager,
                             const InferenceOptions& options)
    : manager_(manager), options_(options) {
  CHECK(manager_ != nullptr);
  // the manager threshold is the one in effect
  options_.offload_threshold = manager_->options().offload_threshold();
  options_.warmup_on_startup = manager_->options().warmup_enabled();
}

ModelsService::Response ModelsService::get_config() const {
  json config = to_json(manager_->spec_table().tasks(), options_);
  config["device"] = manager_->status().device;
  return {200, std::move(config)};
}

ModelsService::Response ModelsService::get_status() const {
  const ManagerStatus status = manager_->status();
  json loaded = json::array();
  for (const auto& info : status.loaded) {
    json model;
    model["task_type"] = info.task_id;
    model["model_id"] = info.model_id;
    model["model_name"] = info.option_name;
    model["framework"] = info.backend;
    model["quantization"] =
        info.quantization ? json(*info.quantization) : json(nullptr);
    model["vram_used_bytes"] = info.actual_bytes;
    model["vram_used_gb"] = to_gb(info.actual_bytes);
    model["loaded_at"] = format_time(info.loaded_at);
    loaded.push_back(std::move(model));
  }

  json body;
  body["device"] = status.device;
  body["loaded_models"] = std::move(loaded);
  body["loading"] = status.loading;
  body["total_vram_gb"] = to_gb(status.total_capacity_bytes);
  body["total_vram_allocated_gb"] = to_gb(status.used_bytes);
  body["total_vram_available_gb"] = to_gb(status.available_bytes);
  body["memory_usage"] = status.memory_usage;
  body["timestamp"] = format_time(absl::Now());
  return {200, std::move(body)};
}

ModelsService::Response ModelsService::select(const std::string& task_id,
                                              const std::string& option_name) {
  if (task_id.empty() || option_name.empty()) {
    return error_response(Status(StatusCode::INVALID_ARGUMENT,
                                 "task_type and model_name are required"));
  }
  const Status status = manager_->reselect(task_id, option_name);
  if (!status.ok()) {
    return error_response(status);
  }
  json body;
  body["status"] = "success";
  body["task_type"] = task_id;
  body["selected_model"] = option_name;
  return {200, std::move(body)};
}

ModelsService::Response ModelsService::validate() const {
  const BudgetReport report = manager_->validate_budget();
  json requirements = json::object();
  for (const auto& requirement : report.requirements) {
    json data;
    data["model_name"] = requirement.option_name;
    data["model_id"] = requirement.model_id;
    data["vram_gb"] = to_gb(requirement.declared_bytes);
    requirements[requirement.task_id] = std::move(data);
  }

  json body;
  body["valid"] = report.valid;
  body["total_vram_gb"] = to_gb(report.total_capacity_bytes);
  body["total_required_gb"] = to_gb(report.total_required_bytes);
  body["threshold"] = report.threshold;
  body["max_allowed_gb"] = to_gb(report.max_allowed_bytes);
  body["model_requirements"] = std::move(requirements);
  return {200, std::move(body)};
}

ModelsService::Response ModelsService::load(const std::string& task_id) {
  const Status status = manager_->load(task_id);
  if (!status.ok()) {
    return error_response(status);
  }
  json body;
  body["status"] = "success";
  body["task_type"] = task_id;
  body["message"] = "Model loaded successfully";
  return {200, std::move(body)};
}

ModelsService::Response ModelsService::unload(const std::string& task_id) {
  const Status status = manager_->unload(task_id);
  if (!status.ok()) {
    return error_response(status);
  }
  json body;
  body["status"] = "success";
  body["task_type"] = task_id;
  body["message"] = "Model unloaded successfully";
  return {200, std::move(body)};
}

void ModelsService::register_routes(HttpServer* server) {
  server->register_uri("/models/config",
                       [this](HttpServer::Transport& transport) -> bool {
                         if (transport.method() != verb::get) {
                           return method_not_allowed(transport);
                         }
                         return send(transport, get_config());
                       });
  server->register_uri("/models/status",
                       [this](HttpServer::Transport& transport) -> bool {
                         if (transport.method() != verb::get) {
                           return method_not_allowed(transport);
                         }
                         return send(transport, get_status());
                       });
  server->register_uri(
      "/models/select", [this](HttpServer::Transport& transport) -> bool {
        if (transport.method() != verb::post) {
          return method_not_allowed(transport);
        }
        return send(transport,
                    select(transport.param("task_type").value_or(""),
                           transport.param("model_name").value_or("")));
      },
      /*blocking=*/true);
  server->register_uri("/models/validate",
                       [this](HttpServer::Transport& transport) -> bool {
                         if (transport.method() != verb::post) {
                           return method_not_allowed(transport);
                         }
                         return send(transport, validate());
                       });

  static const std::string kLoadPrefix = "/models/load/";
  server->register_prefix(
      kLoadPrefix, [this](HttpServer::Transport& transport) -> bool {
        if (transport.method() != verb::post) {
          return method_not_allowed(transport);
        }
        return send(transport, load(transport.path().substr(kLoadPrefix.size())));
      },
      /*blocking=*/true);
  static const std::string kUnloadPrefix = "/models/unload/";
  server->register_prefix(
      kUnloadPrefix, [this](HttpServer::Transport& transport) -> bool {
        if (transport.method() != verb::post) {
          return method_not_allowed(transport);
        }
        return send(transport,
                    unload(transport.path().substr(kUnloadPrefix.size())));
      },
      /*blocking=*/true);
}

int ModelsService::to_http_status(const Status& status) {
  switch (status.code()) {
    case StatusCode::OK:
      return 200;
    case StatusCode::INVALID_TASK:
      return 404;
    case StatusCode::INVALID_OPTION:
    case StatusCode::INVALID_ARGUMENT:
    case StatusCode::CONFIG_INVALID:
      return 400;
    case StatusCode::RESOURCE_EXHAUSTED:
      // Insufficient Storage
      return 507;
    case StatusCode::LOAD_FAILURE:
    case StatusCode::UNLOAD_FAILURE:
      return 500;
  }
  return 500;
}

ModelsService::Response ModelsService::error_response(const Status& status) {
  json body;
  body["error"] = to_string(status.code());
  body["message"] = status.message();
  return {to_http_status(status), std::move(body)};
}

}  // namespace modelhost
