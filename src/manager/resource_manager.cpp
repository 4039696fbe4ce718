#include "resource_manager.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/time/clock.h>
#include <glog/logging.h>

#include <algorithm>
#include <exception>
#include <memory>
#include <string>
#include <vector>

#include "common/metrics.h"
#include "common/threadpool.h"

DEFINE_COUNTER(model_loads_total, "Total number of model loads");
DEFINE_COUNTER(model_load_failures_total, "Total number of failed model loads");
DEFINE_COUNTER(model_cache_hits_total,
               "Total number of requests served by a resident model");
DEFINE_COUNTER(model_evictions_total, "Total number of evicted models");
DEFINE_COUNTER(model_unload_failures_total,
               "Total number of failed model unloads");
DEFINE_COUNTER(model_load_latency_seconds, "Latency of model loads in seconds");

DEFINE_GAUGE(loaded_model_bytes, "Device memory held by resident models");
DEFINE_GAUGE(num_loaded_models, "Number of resident models");

namespace modelhost {
namespace {

std::string format_gb(int64_t bytes) {
  return absl::StrFormat(
      "%.2fGB", static_cast<double>(bytes) / static_cast<double>(GiB));
}

}  // namespace

ResourceManager::ResourceManager(const Options& options,
                                 SpecTable* spec_table,
                                 ResourceLoader* loader,
                                 const Device* device)
    : options_(options),
      spec_table_(spec_table),
      loader_(loader),
      device_(device) {
  CHECK(spec_table_ != nullptr);
  CHECK(loader_ != nullptr);
  CHECK(device_ != nullptr);
  CHECK(options_.offload_threshold() >= 0.0 &&
        options_.offload_threshold() <= 1.0)
      << "offload threshold must be within [0, 1]";
  LOG(INFO) << "ResourceManager initialized with " << spec_table_->size()
            << " tasks on device " << device_->name();
}

ResourceManager::~ResourceManager() { shutdown(); }

Status ResourceManager::get(const std::string& task_id,
                            ResourceHandle* handle) {
  {
    absl::MutexLock lock(&mutex_);
    if (const CachedResource* entry = cache_.touch(task_id)) {
      COUNTER_INC(model_cache_hits_total);
      if (handle != nullptr) {
        *handle = entry->handle;
      }
      return {};
    }
  }
  return load(task_id, handle);
}

Status ResourceManager::load(const std::string& task_id,
                             ResourceHandle* handle) {
  ResourceSpec spec;
  std::string option_name;
  std::shared_ptr<PendingLoad> pending;
  std::vector<CachedResource> evicted;
  Status admission;
  {
    absl::MutexLock lock(&mutex_);
    Status status = spec_table_->selected_spec(task_id, &spec, &option_name);
    if (!status.ok()) {
      return status;
    }

    if (const CachedResource* entry = cache_.touch(task_id)) {
      VLOG(1) << "Model " << task_id << " already loaded";
      if (handle != nullptr) {
        *handle = entry->handle;
      }
      return {};
    }

    auto it = pending_loads_.find(task_id);
    if (it != pending_loads_.end()) {
      return wait_for_load(task_id, it->second, handle);
    }

    // claim the task so concurrent callers wait for this load
    pending = std::make_shared<PendingLoad>();
    pending_loads_[task_id] = pending;

    LOG(INFO) << "Loading model for " << task_id << ": " << spec.model_id
              << " (" << format_gb(spec.declared_bytes) << " VRAM required)";
    admission = ensure_capacity_locked(spec.declared_bytes, &evicted);
    if (!admission.ok()) {
      pending_loads_.erase(task_id);
      pending->status = admission;
      pending->done = true;
      ++settle_epoch_;
      LOG(ERROR) << admission;
    } else {
      reserved_bytes_ += spec.declared_bytes;
    }
  }

  // evicted resources are freed before the new one is loaded
  release(std::move(evicted));
  if (!admission.ok()) {
    return admission;
  }

  LOG(INFO) << "Loading " << spec.backend << " model: " << spec.model_id;
  LoadResult result;
  Status status;
  {
    AUTO_COUNTER(model_load_latency_seconds);
    try {
      status = loader_->load(spec, &result);
    } catch (const std::exception& e) {
      status = Status(StatusCode::LOAD_FAILURE,
                      absl::StrCat("loader threw: ", e.what()));
    }
  }
  return finish_load(task_id,
                     option_name,
                     spec,
                     pending,
                     std::move(status),
                     std::move(result),
                     handle);
}

Status ResourceManager::finish_load(const std::string& task_id,
                                    const std::string& option_name,
                                    const ResourceSpec& spec,
                                    const std::shared_ptr<PendingLoad>& pending,
                                    Status status,
                                    LoadResult result,
                                    ResourceHandle* handle) {
  if (status.ok() && result.handle == nullptr) {
    status = Status(StatusCode::LOAD_FAILURE, "loader returned no handle");
  }
  if (status.ok() &&
      (result.actual_bytes < 0 || result.actual_bytes >= kMaxResourceBytes)) {
    status = Status(
        StatusCode::LOAD_FAILURE,
        absl::StrCat("loader reported invalid size: ", result.actual_bytes));
    // the resource cannot be accounted, hand it straight back
    try {
      const Status unloaded = loader_->unload(result.handle);
      LOG_IF(WARNING, !unloaded.ok()) << unloaded;
    } catch (const std::exception& e) {
      LOG(WARNING) << "loader threw on unload: " << e.what();
    }
    result.handle.reset();
  }

  absl::MutexLock lock(&mutex_);
  reserved_bytes_ -= spec.declared_bytes;
  pending_loads_.erase(task_id);
  ++settle_epoch_;
  pending->done = true;

  if (!status.ok()) {
    COUNTER_INC(model_load_failures_total);
    pending->status = Status(StatusCode::LOAD_FAILURE,
                             absl::StrCat("Failed to load model ",
                                          spec.model_id,
                                          " for ",
                                          task_id,
                                          ": ",
                                          status.message()));
    LOG(ERROR) << pending->status;
    return pending->status;
  }

  COUNTER_INC(model_loads_total);
  CachedResource entry;
  entry.task_id = task_id;
  entry.option_name = option_name;
  entry.spec = spec;
  entry.handle = result.handle;
  entry.actual_bytes = result.actual_bytes;
  entry.loaded_at = absl::Now();
  cache_.insert(std::move(entry));
  update_gauges();

  pending->handle = result.handle;
  if (handle != nullptr) {
    *handle = result.handle;
  }
  LOG(INFO) << "Model " << task_id << " loaded successfully (actual memory: "
            << format_gb(result.actual_bytes) << ")";
  return status;
}

Status ResourceManager::wait_for_load(const std::string& task_id,
                                      std::shared_ptr<PendingLoad> pending,
                                      ResourceHandle* handle) {
  VLOG(1) << "Waiting for in-flight load of " << task_id;
  auto done = [&pending]() { return pending->done; };
  ++pending->waiters;
  mutex_.Await(absl::Condition(&done));
  --pending->waiters;
  if (!pending->status.ok()) {
    return pending->status;
  }
  // counts as a touch if the resource is still resident
  cache_.touch(task_id);
  if (handle != nullptr) {
    *handle = pending->handle;
  }
  return {};
}

void ResourceManager::wait_until_settled(const std::string& task_id) {
  auto it = pending_loads_.find(task_id);
  while (it != pending_loads_.end()) {
    std::shared_ptr<PendingLoad> pending = it->second;
    auto done = [&pending]() { return pending->done; };
    ++pending->waiters;
    mutex_.Await(absl::Condition(&done));
    --pending->waiters;
    it = pending_loads_.find(task_id);
  }
}

Status ResourceManager::ensure_capacity(int64_t required_bytes) {
  if (required_bytes < 0 || required_bytes >= kMaxResourceBytes) {
    return {StatusCode::INVALID_ARGUMENT,
            absl::StrCat("required bytes out of range: ", required_bytes)};
  }
  std::vector<CachedResource> evicted;
  Status status;
  {
    absl::MutexLock lock(&mutex_);
    status = ensure_capacity_locked(required_bytes, &evicted);
  }
  release(std::move(evicted));
  return status;
}

Status ResourceManager::ensure_capacity_locked(
    int64_t required_bytes,
    std::vector<CachedResource>* evicted) {
  // bytes this call evicted are freed by the caller before its load
  int64_t own_bytes = 0;
  for (const auto& resource : *evicted) {
    own_bytes += resource.actual_bytes;
  }

  while (true) {
    const int64_t capacity = device_->total_memory();
    // memory held or promised by other callers
    const int64_t in_flight = reserved_bytes_ + releasing_bytes_ - own_bytes;
    if (cache_.total_bytes() + in_flight + required_bytes <= capacity) {
      return {};
    }

    // with other callers holding memory, only evict if that can be enough
    if (!cache_.empty() &&
        (in_flight == 0 || in_flight + required_bytes <= capacity)) {
      const int64_t used = cache_.total_bytes() + in_flight;
      auto entry = cache_.pop_lru();
      LOG(INFO) << absl::StrFormat(
                       "Insufficient memory (usage: %.1f%%), evicting LRU "
                       "model: ",
                       capacity > 0 ? 100.0 * used / capacity : 100.0)
                << entry->task_id;
      COUNTER_INC(model_evictions_total);
      releasing_bytes_ += entry->actual_bytes;
      own_bytes += entry->actual_bytes;
      evicted->push_back(std::move(entry.value()));
      update_gauges();
      continue;
    }

    if (!evicted->empty()) {
      // free what was evicted so far before waiting on anyone else
      std::vector<CachedResource> resources = std::move(*evicted);
      evicted->clear();
      own_bytes = 0;
      mutex_.Unlock();
      release(std::move(resources));
      mutex_.Lock();
      continue;
    }

    if (in_flight > 0) {
      // other loads or unloads are in progress, retry once they settle
      const uint64_t epoch = settle_epoch_;
      auto settled = [this, epoch]() { return settle_epoch_ != epoch; };
      mutex_.Await(absl::Condition(&settled));
      continue;
    }

    return {StatusCode::RESOURCE_EXHAUSTED,
            absl::StrCat("Insufficient memory: ",
                         format_gb(required_bytes),
                         " required, device capacity is ",
                         format_gb(capacity),
                         " and no models to evict")};
  }
}

std::optional<std::string> ResourceManager::evict_lru() {
  std::optional<CachedResource> entry;
  {
    absl::MutexLock lock(&mutex_);
    entry = cache_.pop_lru();
    if (!entry.has_value()) {
      LOG(WARNING) << "No models to evict";
      return std::nullopt;
    }
    COUNTER_INC(model_evictions_total);
    releasing_bytes_ += entry->actual_bytes;
    update_gauges();
  }

  std::string task_id = entry->task_id;
  LOG(INFO) << "Evicting LRU model: " << task_id;
  std::vector<CachedResource> resources;
  resources.push_back(std::move(entry.value()));
  release(std::move(resources));
  return task_id;
}

Status ResourceManager::unload(const std::string& task_id) {
  std::optional<CachedResource> entry;
  {
    absl::MutexLock lock(&mutex_);
    if (!spec_table_->contains(task_id)) {
      return {StatusCode::INVALID_TASK,
              absl::StrCat("Invalid task type: ", task_id)};
    }
    wait_until_settled(task_id);
    entry = take_locked(task_id);
  }
  if (!entry.has_value()) {
    LOG(WARNING) << "Model " << task_id << " not loaded";
    return {};
  }
  return unload_resource(std::move(entry.value()));
}

Status ResourceManager::reselect(const std::string& task_id,
                                 const std::string& option_name) {
  std::optional<CachedResource> stale;
  {
    absl::MutexLock lock(&mutex_);
    // validate before anything changes
    Status status = spec_table_->check_option(task_id, option_name);
    if (!status.ok()) {
      return status;
    }
    wait_until_settled(task_id);

    ResourceSpec old_spec;
    std::string old_option;
    status = spec_table_->selected_spec(task_id, &old_spec, &old_option);
    if (status.ok()) {
      status = spec_table_->select(task_id, option_name);
    }
    if (!status.ok()) {
      return status;
    }
    LOG(INFO) << "Changed " << task_id << " model from " << old_option
              << " to " << option_name;
    stale = take_locked(task_id);
  }

  if (!stale.has_value()) {
    return {};
  }
  // the stale resource no longer matches the selection, never keep it
  std::vector<CachedResource> resources;
  resources.push_back(std::move(stale.value()));
  release(std::move(resources));
  return load(task_id, nullptr);
}

BudgetReport ResourceManager::validate_budget() const {
  return ::modelhost::validate_budget(spec_table_->tasks(),
                                      device_->total_memory(),
                                      options_.offload_threshold());
}

void ResourceManager::warmup() {
  if (!options_.warmup_enabled()) {
    LOG(INFO) << "Warmup disabled, skipping model loading";
    return;
  }

  const std::vector<std::string> task_ids = spec_table_->task_ids();
  LOG(INFO) << "Warming up " << task_ids.size() << " selected models";
  {
    ThreadPool threadpool(std::max<size_t>(options_.warmup_threads(), 1));
    for (const auto& task_id : task_ids) {
      threadpool.schedule([this, task_id]() {
        const Status status = load(task_id, nullptr);
        if (!status.ok()) {
          LOG(ERROR) << "Failed to warmup " << task_id << ": " << status;
        }
      });
    }
    // the threadpool destructor waits for all loads
  }
  LOG(INFO) << "Warmup finished";
}

void ResourceManager::shutdown() {
  std::vector<CachedResource> resources;
  {
    absl::MutexLock lock(&mutex_);
    auto idle = [this]() { return pending_loads_.empty(); };
    mutex_.Await(absl::Condition(&idle));
    if (cache_.empty()) {
      return;
    }
    LOG(INFO) << "Shutting down ResourceManager, unloading " << cache_.size()
              << " models";
    while (auto entry = cache_.pop_lru()) {
      releasing_bytes_ += entry->actual_bytes;
      resources.push_back(std::move(entry.value()));
    }
    update_gauges();
  }
  release(std::move(resources));
}

ManagerStatus ResourceManager::status() const {
  ManagerStatus status;
  status.device = device_->name();
  status.total_capacity_bytes = device_->total_memory();

  absl::MutexLock lock(&mutex_);
  for (const auto& entry : cache_.entries()) {
    LoadedResourceInfo info;
    info.task_id = entry.task_id;
    info.option_name = entry.option_name;
    info.model_id = entry.spec.model_id;
    info.backend = entry.spec.backend;
    info.quantization = entry.spec.quantization;
    info.actual_bytes = entry.actual_bytes;
    info.loaded_at = entry.loaded_at;
    status.loaded.push_back(std::move(info));
  }
  for (const auto& [task_id, pending] : pending_loads_) {
    status.loading.push_back(task_id);
    status.num_waiters += pending->waiters;
  }
  std::sort(status.loading.begin(), status.loading.end());

  status.used_bytes = cache_.total_bytes() + reserved_bytes_ + releasing_bytes_;
  status.available_bytes =
      std::max<int64_t>(status.total_capacity_bytes - status.used_bytes, 0);
  if (status.total_capacity_bytes > 0) {
    status.memory_usage = static_cast<double>(status.used_bytes) /
                          static_cast<double>(status.total_capacity_bytes);
  }
  return status;
}

Status ResourceManager::unload_resource(CachedResource resource) {
  LOG(INFO) << "Unloading model: " << resource.task_id;
  Status status;
  try {
    status = loader_->unload(resource.handle);
  } catch (const std::exception& e) {
    status = Status(StatusCode::UNLOAD_FAILURE,
                    absl::StrCat("loader threw: ", e.what()));
  }
  resource.handle.reset();

  {
    absl::MutexLock lock(&mutex_);
    releasing_bytes_ -= resource.actual_bytes;
    ++settle_epoch_;
  }

  if (!status.ok()) {
    COUNTER_INC(model_unload_failures_total);
    status = Status(StatusCode::UNLOAD_FAILURE,
                    absl::StrCat("Failed to unload model ",
                                 resource.spec.model_id,
                                 " for ",
                                 resource.task_id,
                                 ": ",
                                 status.message()));
    LOG(WARNING) << status;
    return status;
  }
  LOG(INFO) << "Model " << resource.task_id << " unloaded successfully";
  return status;
}

void ResourceManager::release(std::vector<CachedResource> resources) {
  for (auto& resource : resources) {
    // failures are logged by unload_resource, the bookkeeping is gone anyway
    const Status status = unload_resource(std::move(resource));
    VLOG_IF(1, !status.ok()) << "Ignoring unload failure during release";
  }
}

std::optional<CachedResource> ResourceManager::take_locked(
    const std::string& task_id) {
  auto entry = cache_.remove(task_id);
  if (entry.has_value()) {
    releasing_bytes_ += entry->actual_bytes;
    update_gauges();
  }
  return entry;
}

void ResourceManager::update_gauges() {
  GAUGE_SET(loaded_model_bytes, static_cast<double>(cache_.total_bytes()));
  GAUGE_SET(num_loaded_models, static_cast<double>(cache_.size()));
}

}  // namespace modelhost
