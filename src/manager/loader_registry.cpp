#include "loader_registry.h"

#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace modelhost {

bool LoaderRegistry::register_loader(const std::string& backend,
                                     std::shared_ptr<ResourceLoader> loader) {
  CHECK(loader != nullptr) << "null loader for backend " << backend;
  absl::MutexLock lock(&mutex_);
  if (loaders_.count(backend) != 0) {
    LOG(WARNING) << "Loader for backend " << backend << " already registered";
    return false;
  }
  loaders_[backend] = std::move(loader);
  return true;
}

bool LoaderRegistry::has_backend(const std::string& backend) const {
  absl::MutexLock lock(&mutex_);
  return loaders_.count(backend) != 0;
}

std::vector<std::string> LoaderRegistry::backends() const {
  absl::MutexLock lock(&mutex_);
  std::vector<std::string> names;
  names.reserve(loaders_.size());
  for (const auto& [name, loader] : loaders_) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::shared_ptr<ResourceLoader> LoaderRegistry::find_loader(
    const std::string& backend) const {
  absl::MutexLock lock(&mutex_);
  auto it = loaders_.find(backend);
  if (it == loaders_.end()) {
    return nullptr;
  }
  return it->second;
}

Status LoaderRegistry::load(const ResourceSpec& spec, LoadResult* result) {
  auto loader = find_loader(spec.backend);
  if (loader == nullptr) {
    return {StatusCode::LOAD_FAILURE,
            absl::StrCat("no loader registered for backend ", spec.backend)};
  }

  // the backend loader runs without the registry lock
  Status status = loader->load(spec, result);
  if (!status.ok()) {
    return status;
  }
  if (result->handle == nullptr) {
    return {StatusCode::LOAD_FAILURE,
            absl::StrCat(
                "loader for ", spec.backend, " returned an empty handle")};
  }

  absl::MutexLock lock(&mutex_);
  owners_[result->handle.get()] = std::move(loader);
  return status;
}

Status LoaderRegistry::unload(const ResourceHandle& handle) {
  std::shared_ptr<ResourceLoader> loader;
  {
    absl::MutexLock lock(&mutex_);
    auto it = owners_.find(handle.get());
    if (it == owners_.end()) {
      return {StatusCode::UNLOAD_FAILURE,
              "handle was not produced by this registry"};
    }
    loader = std::move(it->second);
    owners_.erase(it);
  }
  return loader->unload(handle);
}

}  // namespace modelhost
