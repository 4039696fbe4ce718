#include "status.h"

#include <string>

namespace modelhost {

const char* to_string(StatusCode code) {
  switch (code) {
    case StatusCode::OK:
      return "OK";
    case StatusCode::INVALID_TASK:
      return "INVALID_TASK";
    case StatusCode::INVALID_OPTION:
      return "INVALID_OPTION";
    case StatusCode::RESOURCE_EXHAUSTED:
      return "RESOURCE_EXHAUSTED";
    case StatusCode::LOAD_FAILURE:
      return "LOAD_FAILURE";
    case StatusCode::UNLOAD_FAILURE:
      return "UNLOAD_FAILURE";
    case StatusCode::CONFIG_INVALID:
      return "CONFIG_INVALID";
    case StatusCode::INVALID_ARGUMENT:
      return "INVALID_ARGUMENT";
  }
  return "UNKNOWN";
}

std::string Status::to_string() const {
  if (ok()) {
    return "OK";
  }
  std::string result = modelhost::to_string(code_);
  if (!msg_.empty()) {
    result += ": " + msg_;
  }
  return result;
}

}  // namespace modelhost
