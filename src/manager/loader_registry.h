#pragma once

#include <absl/synchronization/mutex.h>

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/macros.h"
#include "resource_loader.h"

namespace modelhost {

// a loader that dispatches on ResourceSpec::backend to the loader registered
// for that backend, one per model family. it remembers which loader produced
// each handle so unload reaches the same loader.
class LoaderRegistry final : public ResourceLoader {
 public:
  LoaderRegistry() = default;

  // disable copy and move
  LoaderRegistry(const LoaderRegistry&) = delete;
  LoaderRegistry& operator=(const LoaderRegistry&) = delete;
  LoaderRegistry(LoaderRegistry&&) = delete;
  LoaderRegistry& operator=(LoaderRegistry&&) = delete;

  // returns false if the backend already has a loader
  bool register_loader(const std::string& backend,
                       std::shared_ptr<ResourceLoader> loader);

  bool has_backend(const std::string& backend) const;

  std::vector<std::string> backends() const;

  // LOAD_FAILURE if no loader is registered for spec.backend
  Status load(const ResourceSpec& spec, LoadResult* result) override;

  // UNLOAD_FAILURE if the handle was not produced by this registry
  Status unload(const ResourceHandle& handle) override;

 private:
  std::shared_ptr<ResourceLoader> find_loader(const std::string& backend) const;

  mutable absl::Mutex mutex_;

  std::unordered_map<std::string, std::shared_ptr<ResourceLoader>> loaders_
      GUARDED_BY(mutex_);

  // live handle -> loader that produced it
  std::unordered_map<const Resource*, std::shared_ptr<ResourceLoader>> owners_
      GUARDED_BY(mutex_);
};

}  // namespace modelhost
