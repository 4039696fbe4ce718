#pragma once

#include <absl/synchronization/mutex.h>
#include <absl/time/time.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "budget_validator.h"
#include "common/macros.h"
#include "common/status.h"
#include "memory/device.h"
#include "resource_cache.h"
#include "resource_loader.h"
#include "spec_table.h"

namespace modelhost {

struct LoadedResourceInfo {
  std::string task_id;
  std::string option_name;
  std::string model_id;
  std::string backend;
  std::optional<std::string> quantization;
  int64_t actual_bytes = 0;
  absl::Time loaded_at;
};

struct ManagerStatus {
  std::string device;

  // resident tasks, least recently used first
  std::vector<LoadedResourceInfo> loaded;

  // tasks with a load in flight
  std::vector<std::string> loading;

  // callers blocked on one of those loads
  int num_waiters = 0;

  int64_t total_capacity_bytes = 0;

  // loaded + reserved for in-flight loads + waiting to be released
  int64_t used_bytes = 0;

  int64_t available_bytes = 0;

  // used_bytes / total_capacity_bytes
  double memory_usage = 0.0;
};

// Keeps device resident resources for tasks under the device capacity.
//
// Resources are loaded on demand through the loader and cached per task; when
// a new load does not fit, the least recently used resources are evicted
// first. Admission uses the declared size of the selected option, accounting
// uses the size measured by the loader.
//
// The manager is thread safe. Loader calls run without the manager lock held,
// concurrent requests for the same uncached task share a single load.
class ResourceManager final {
 public:
  struct Options {
    // fraction of device memory the selected options may declare in total
    DEFINE_ARG(double, offload_threshold) = 0.85;

    // load every task in warmup()
    DEFINE_ARG(bool, warmup_enabled) = false;

    // number of concurrent loads during warmup
    DEFINE_ARG(size_t, warmup_threads) = 1;
  };

  // spec_table, loader and device must outlive the manager
  ResourceManager(const Options& options,
                  SpecTable* spec_table,
                  ResourceLoader* loader,
                  const Device* device);

  // unloads every resident resource
  ~ResourceManager();

  // disable copy and move
  ResourceManager(const ResourceManager&) = delete;
  ResourceManager& operator=(const ResourceManager&) = delete;
  ResourceManager(ResourceManager&&) = delete;
  ResourceManager& operator=(ResourceManager&&) = delete;

  // return the cached resource of the task, loading it if needed.
  // errors: INVALID_TASK, RESOURCE_EXHAUSTED, LOAD_FAILURE
  Status get(const std::string& task_id, ResourceHandle* handle);

  // load the selected option of the task unless it is already resident or
  // being loaded. handle may be null. same errors as get().
  Status load(const std::string& task_id, ResourceHandle* handle = nullptr);

  // evict least recently used resources until required_bytes fit next to the
  // resident ones. RESOURCE_EXHAUSTED if they do not fit on an empty device,
  // INVALID_ARGUMENT if required_bytes is negative or absurdly large.
  Status ensure_capacity(int64_t required_bytes);

  // evict the least recently used resource, returns its task id or nullopt
  // if nothing is resident
  std::optional<std::string> evict_lru();

  // drop the resource of the task. no-op if it is not resident.
  // errors: INVALID_TASK, UNLOAD_FAILURE (the resource is forgotten anyway)
  Status unload(const std::string& task_id);

  // change the selected option of the task. a resident resource is unloaded
  // and the new option loaded; if that load fails the task stays unloaded.
  // errors: INVALID_TASK, INVALID_OPTION, and the errors of load()
  Status reselect(const std::string& task_id, const std::string& option_name);

  // check the declared sizes of the selected options against the device
  // capacity. never touches the cache.
  BudgetReport validate_budget() const;

  // load every task if warmup is enabled, failures are logged and skipped
  void warmup();

  // unload every resident resource, waiting for in-flight loads first
  void shutdown();

  ManagerStatus status() const;

  const SpecTable& spec_table() const { return *spec_table_; }

  const Options& options() const { return options_; }

 private:
  // outcome of an in-flight load, shared with the callers waiting for it
  struct PendingLoad {
    bool done = false;
    // callers blocked until done
    int waiters = 0;
    Status status;
    ResourceHandle handle;
  };

  // evict until required_bytes fit, moving evicted entries into evicted.
  // the caller releases them once the lock is dropped.
  Status ensure_capacity_locked(int64_t required_bytes,
                                std::vector<CachedResource>* evicted)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  // wait for the pending load and return its outcome
  Status wait_for_load(const std::string& task_id,
                       std::shared_ptr<PendingLoad> pending,
                       ResourceHandle* handle)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  // wait until no load of the task is in flight
  void wait_until_settled(const std::string& task_id)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  // record the outcome of a loader call and wake up waiters
  Status finish_load(const std::string& task_id,
                     const std::string& option_name,
                     const ResourceSpec& spec,
                     const std::shared_ptr<PendingLoad>& pending,
                     Status status,
                     LoadResult result,
                     ResourceHandle* handle);

  // hand a resource removed from the cache to the loader
  Status unload_resource(CachedResource resource);

  // unload each resource once, failures are logged
  void release(std::vector<CachedResource> resources);

  // remove the entry from the cache and account its bytes as releasing
  std::optional<CachedResource> take_locked(const std::string& task_id)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  void update_gauges() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  Options options_;

  SpecTable* spec_table_;

  ResourceLoader* loader_;

  const Device* device_;

  mutable absl::Mutex mutex_;

  ResourceCache cache_ GUARDED_BY(mutex_);

  // task id -> load in flight
  std::unordered_map<std::string, std::shared_ptr<PendingLoad>> pending_loads_
      GUARDED_BY(mutex_);

  // declared bytes of loads in flight
  int64_t reserved_bytes_ GUARDED_BY(mutex_) = 0;

  // actual bytes of resources removed from the cache but not yet unloaded
  int64_t releasing_bytes_ GUARDED_BY(mutex_) = 0;

  // bumped whenever reserved or releasing bytes settle
  uint64_t settle_epoch_ GUARDED_BY(mutex_) = 0;
};

}  // namespace modelhost
