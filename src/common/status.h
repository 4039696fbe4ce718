#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace modelhost {

enum class StatusCode : uint8_t {
  // Not an error; returned on success.
  OK = 0,
  // The task id is not present in the spec table.
  INVALID_TASK = 1,
  // The option name is not present for a known task.
  INVALID_OPTION = 2,
  // Not enough device memory even after evicting every cached resource.
  RESOURCE_EXHAUSTED = 3,
  // The loader failed to produce the resource.
  LOAD_FAILURE = 4,
  // The loader failed to release the resource.
  UNLOAD_FAILURE = 5,
  // The models configuration is malformed.
  CONFIG_INVALID = 6,
  // Client specified an invalid argument.
  INVALID_ARGUMENT = 7,
};

// returns the canonical name of the status code, e.g. "RESOURCE_EXHAUSTED"
const char* to_string(StatusCode code);

class Status final {
 public:
  Status() = default;

  Status(StatusCode code) : code_(code) {}

  Status(StatusCode code, std::string msg)
      : code_(code), msg_(std::move(msg)) {}

  StatusCode code() const { return code_; }

  const std::string& message() const { return msg_; }

  bool ok() const { return code_ == StatusCode::OK; }

  std::string to_string() const;

 private:
  StatusCode code_ = StatusCode::OK;
  std::string msg_;
};

inline std::ostream& operator<<(std::ostream& os, const Status& status) {
  os << status.to_string();
  return os;
}

}  // namespace modelhost
