#pragma once

#include <absl/strings/str_cat.h>
#include <absl/synchronization/mutex.h>
#include <absl/time/clock.h>

#include <atomic>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/macros.h"
#include "resource_loader.h"

namespace modelhost {

class FakeResource final : public Resource {
 public:
  FakeResource(std::string model_id, int64_t serial)
      : model_id_(std::move(model_id)), serial_(serial) {}

  const std::string& model_id() const { return model_id_; }

  int64_t serial() const { return serial_; }

  bool released() const { return released_; }

  void release() { released_ = true; }

 private:
  std::string model_id_;
  int64_t serial_ = 0;
  std::atomic<bool> released_{false};
};

// in-process loader for tests. records every call and can be told to fail,
// throw or block loads per model id.
class FakeLoader final : public ResourceLoader {
 public:
  Status load(const ResourceSpec& spec, LoadResult* result) override {
    absl::MutexLock lock(&mutex_);
    ++loads_started_;
    ++load_counts_[spec.model_id];
    events_.push_back("load:" + spec.model_id);

    // hold the call while loads are blocked
    auto unblocked = [this]() { return !blocked_; };
    mutex_.Await(absl::Condition(&unblocked));

    if (throwing_.count(spec.model_id) != 0) {
      throw std::runtime_error("loader exploded for " + spec.model_id);
    }
    if (failing_.count(spec.model_id) != 0) {
      return {StatusCode::LOAD_FAILURE,
              absl::StrCat("failed to load ", spec.model_id)};
    }
    auto it = actual_bytes_.find(spec.model_id);
    result->actual_bytes =
        it == actual_bytes_.end() ? spec.declared_bytes : it->second;
    result->handle = std::make_shared<FakeResource>(spec.model_id, ++serial_);
    ++num_live_;
    return {};
  }

  Status unload(const ResourceHandle& handle) override {
    auto* resource = dynamic_cast<FakeResource*>(handle.get());
    absl::MutexLock lock(&mutex_);
    if (resource == nullptr) {
      return {StatusCode::UNLOAD_FAILURE, "unknown handle"};
    }
    ++num_unloads_;
    ++unload_counts_[resource->model_id()];
    events_.push_back("unload:" + resource->model_id());
    if (failing_unloads_.count(resource->model_id()) != 0) {
      return {StatusCode::UNLOAD_FAILURE,
              absl::StrCat("failed to unload ", resource->model_id())};
    }
    resource->release();
    --num_live_;
    return {};
  }

  void set_actual_bytes(const std::string& model_id, int64_t bytes) {
    absl::MutexLock lock(&mutex_);
    actual_bytes_[model_id] = bytes;
  }

  void fail_load(const std::string& model_id, bool fail = true) {
    absl::MutexLock lock(&mutex_);
    update(&failing_, model_id, fail);
  }

  void throw_on_load(const std::string& model_id, bool fail = true) {
    absl::MutexLock lock(&mutex_);
    update(&throwing_, model_id, fail);
  }

  void fail_unload(const std::string& model_id, bool fail = true) {
    absl::MutexLock lock(&mutex_);
    update(&failing_unloads_, model_id, fail);
  }

  void block_loads() {
    absl::MutexLock lock(&mutex_);
    blocked_ = true;
  }

  void unblock_loads() {
    absl::MutexLock lock(&mutex_);
    blocked_ = false;
  }

  // wait until at least n load calls have entered the loader
  void wait_for_loads_started(int n) {
    absl::MutexLock lock(&mutex_);
    auto started = [this, n]() { return loads_started_ >= n; };
    mutex_.Await(absl::Condition(&started));
  }

  int num_loads() const {
    absl::MutexLock lock(&mutex_);
    return loads_started_;
  }

  int num_loads(const std::string& model_id) const {
    absl::MutexLock lock(&mutex_);
    auto it = load_counts_.find(model_id);
    return it == load_counts_.end() ? 0 : it->second;
  }

  int num_unloads() const {
    absl::MutexLock lock(&mutex_);
    return num_unloads_;
  }

  int num_unloads(const std::string& model_id) const {
    absl::MutexLock lock(&mutex_);
    auto it = unload_counts_.find(model_id);
    return it == unload_counts_.end() ? 0 : it->second;
  }

  // resources loaded and not yet successfully unloaded
  int num_live() const {
    absl::MutexLock lock(&mutex_);
    return num_live_;
  }

  // "load:<model_id>" and "unload:<model_id>" in call order
  std::vector<std::string> events() const {
    absl::MutexLock lock(&mutex_);
    return events_;
  }

 private:
  static void update(std::set<std::string>* models,
                     const std::string& model_id,
                     bool add) {
    if (add) {
      models->insert(model_id);
    } else {
      models->erase(model_id);
    }
  }

  mutable absl::Mutex mutex_;
  bool blocked_ GUARDED_BY(mutex_) = false;
  int loads_started_ GUARDED_BY(mutex_) = 0;
  int num_unloads_ GUARDED_BY(mutex_) = 0;
  int num_live_ GUARDED_BY(mutex_) = 0;
  int64_t serial_ GUARDED_BY(mutex_) = 0;
  std::map<std::string, int> load_counts_ GUARDED_BY(mutex_);
  std::map<std::string, int> unload_counts_ GUARDED_BY(mutex_);
  std::map<std::string, int64_t> actual_bytes_ GUARDED_BY(mutex_);
  std::set<std::string> failing_ GUARDED_BY(mutex_);
  std::set<std::string> throwing_ GUARDED_BY(mutex_);
  std::set<std::string> failing_unloads_ GUARDED_BY(mutex_);
  std::vector<std::string> events_ GUARDED_BY(mutex_);
};

}  // namespace modelhost
