#include "device_buffer_loader.h"

#include <absl/strings/str_cat.h>
#include <c10/cuda/CUDACachingAllocator.h>
#include <glog/logging.h>
#include <torch/torch.h>

#include <algorithm>

namespace modelhost {

DeviceBufferLoader::DeviceBufferLoader(const CudaDevice* device)
    : device_(device) {
  CHECK(device_ != nullptr);
}

Status DeviceBufferLoader::load(const ResourceSpec& spec, LoadResult* result) {
  if (spec.declared_bytes < 0) {
    return {StatusCode::LOAD_FAILURE,
            absl::StrCat("negative size for ", spec.model_id)};
  }

  absl::MutexLock lock(&alloc_mutex_);
  const int64_t before = device_->allocated_memory();
  torch::Tensor buffer;
  try {
    const auto options =
        torch::dtype(torch::kUInt8).device(device_->device());
    buffer = torch::empty({spec.declared_bytes}, options);
  } catch (const c10::Error& e) {
    return {StatusCode::LOAD_FAILURE,
            absl::StrCat("failed to allocate ",
                         spec.declared_bytes,
                         " bytes for ",
                         spec.model_id,
                         ": ",
                         e.what_without_backtrace())};
  }
  const int64_t after = device_->allocated_memory();

  // the allocator rounds up to its block size
  result->actual_bytes = std::max<int64_t>(after - before, buffer.nbytes());
  result->handle = std::make_shared<DeviceBuffer>(spec.model_id, buffer);
  VLOG(1) << "Allocated " << result->actual_bytes << " bytes for "
          << spec.model_id << " on " << device_->name();
  return {};
}

Status DeviceBufferLoader::unload(const ResourceHandle& handle) {
  auto* buffer = dynamic_cast<DeviceBuffer*>(handle.get());
  if (buffer == nullptr) {
    return {StatusCode::UNLOAD_FAILURE, "not a device buffer"};
  }

  absl::MutexLock lock(&alloc_mutex_);
  buffer->release();
  try {
    // hand the cached blocks back to the driver
    c10::cuda::CUDACachingAllocator::emptyCache();
  } catch (const c10::Error& e) {
    return {StatusCode::UNLOAD_FAILURE,
            absl::StrCat("failed to free memory of ",
                         buffer->model_id(),
                         ": ",
                         e.what_without_backtrace())};
  }
  VLOG(1) << "Released device buffer of " << buffer->model_id();
  return {};
}

}  // namespace modelhost
