#pragma once

#include <absl/time/time.h>

namespace modelhost {

// wall clock stopwatch started on construction
class Timer final {
 public:
  Timer();

  double elapsed_seconds() const;

 private:
  const absl::Time start_;
};

}  // namespace modelhost
