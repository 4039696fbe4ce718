#pragma once

#include <cstdint>
#include <memory>

#include "common/status.h"
#include "resource_spec.h"

namespace modelhost {

// a loaded, device resident resource. the manager never looks inside; only
// the loader that produced it knows its concrete type.
class Resource {
 public:
  virtual ~Resource() = default;
};

// callers may keep a handle after the manager dropped its own reference; the
// resource stays valid until its loader frees it.
using ResourceHandle = std::shared_ptr<Resource>;

struct LoadResult {
  ResourceHandle handle;

  // device memory measured after the load, may differ from declared_bytes
  int64_t actual_bytes = 0;
};

// produces and frees resources for specs. implementations must be thread safe:
// loads for different tasks run concurrently. load and unload are expected to
// be slow and are never called with manager locks held.
class ResourceLoader {
 public:
  virtual ~ResourceLoader() = default;

  // on success fill result with a non-null handle
  virtual Status load(const ResourceSpec& spec, LoadResult* result) = 0;

  virtual Status unload(const ResourceHandle& handle) = 0;
};

}  // namespace modelhost
