#include "timer.h"

#include <absl/time/clock.h>

namespace modelhost {

Timer::Timer() : start_(absl::Now()) {}

double Timer::elapsed_seconds() const {
  return absl::ToDoubleSeconds(absl::Now() - start_);
}

}  // namespace modelhost
