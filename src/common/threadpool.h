#pragma once

#include <folly/Function.h>

#include <thread>
#include <vector>

#include "concurrent_queue.h"

namespace modelhost {

// runs scheduled work on a fixed set of threads in fifo order. destruction
// blocks until everything scheduled so far has run.
class ThreadPool final {
 public:
  using Runnable = folly::Function<void()>;

  explicit ThreadPool(size_t num_threads);

  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  // null runnables are dropped
  void schedule(Runnable runnable);

  size_t num_threads() const { return workers_.size(); }

 private:
  void run_worker();

  ConcurrentQueue<Runnable> tasks_;
  std::vector<std::thread> workers_;
};

}  // namespace modelhost
