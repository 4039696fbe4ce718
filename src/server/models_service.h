#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "common/status.h"
#include "http_server.h"
#include "manager/model_config.h"
#include "manager/resource_manager.h"

namespace modelhost {

// operator api of the resource manager. every call returns the json body and
// the http status code to send; errors are reported as {"error", "message"}.
class ModelsService final {
 public:
  struct Response {
    int status_code = 200;
    nlohmann::json body;
  };

  // manager must outlive the service
  ModelsService(ResourceManager* manager, const InferenceOptions& options);

  // GET /models/config
  Response get_config() const;

  // GET /models/status
  Response get_status() const;

  // POST /models/select?task_type=..&model_name=..
  Response select(const std::string& task_id, const std::string& option_name);

  // POST /models/validate
  Response validate() const;

  // POST /models/load/<task>
  Response load(const std::string& task_id);

  // POST /models/unload/<task>
  Response unload(const std::string& task_id);

  // register the routes above on the http server. select, load and unload
  // call into loaders and run as blocking handlers.
  void register_routes(HttpServer* server);

  // maps an error to its http status code
  static int to_http_status(const Status& status);

  static Response error_response(const Status& status);

 private:
  ResourceManager* manager_;

  InferenceOptions options_;
};

}  // namespace modelhost
