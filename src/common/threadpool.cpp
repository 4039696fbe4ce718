#include "threadpool.h"

#include <glog/logging.h>

namespace modelhost {

ThreadPool::ThreadPool(size_t num_threads) {
  CHECK_GT(num_threads, 0) << "thread pool needs at least one thread";
  workers_.reserve(num_threads);
  while (workers_.size() < num_threads) {
    workers_.emplace_back(&ThreadPool::run_worker, this);
  }
}

ThreadPool::~ThreadPool() {
  // one stop marker per worker, queued behind the pending work
  for (size_t i = 0; i < workers_.size(); ++i) {
    tasks_.push(Runnable());
  }
  for (auto& worker : workers_) {
    worker.join();
  }
}

void ThreadPool::schedule(Runnable runnable) {
  if (runnable) {
    tasks_.push(std::move(runnable));
  }
}

void ThreadPool::run_worker() {
  for (Runnable runnable = tasks_.pop(); runnable; runnable = tasks_.pop()) {
    runnable();
  }
}

}  // namespace modelhost
