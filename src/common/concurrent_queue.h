#pragma once

#include <absl/synchronization/mutex.h>

#include <queue>

#include "macros.h"

namespace modelhost {

// unbounded fifo shared by any number of producers and consumers.
template <typename T>
class ConcurrentQueue {
 public:
  void push(T value) {
    absl::MutexLock lock(&mutex_);
    queue_.push(std::move(value));
  }

  // blocks while empty
  T pop() {
    absl::MutexLock lock(&mutex_);
    auto has_value = [this]() { return !queue_.empty(); };
    mutex_.Await(absl::Condition(&has_value));
    T value = std::move(queue_.front());
    queue_.pop();
    return value;
  }

 private:
  absl::Mutex mutex_;
  std::queue<T> queue_ GUARDED_BY(mutex_);
};

}  // namespace modelhost
