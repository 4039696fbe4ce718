#pragma once

#include <absl/synchronization/mutex.h>
#include <torch/torch.h>

#include <string>

#include "common/macros.h"
#include "manager/resource_loader.h"
#include "memory/cuda_device.h"

namespace modelhost {

// a block of device memory standing in for the weights of a model
class DeviceBuffer final : public Resource {
 public:
  DeviceBuffer(std::string model_id, torch::Tensor buffer)
      : model_id_(std::move(model_id)), buffer_(std::move(buffer)) {}

  const std::string& model_id() const { return model_id_; }

  // undefined once released
  const torch::Tensor& buffer() const { return buffer_; }

  void release() { buffer_.reset(); }

 private:
  std::string model_id_;
  torch::Tensor buffer_;
};

// reserves declared_bytes of device memory per spec as an uint8 tensor and
// reports the allocation delta measured by the caching allocator.
class DeviceBufferLoader final : public ResourceLoader {
 public:
  // device must outlive the loader
  explicit DeviceBufferLoader(const CudaDevice* device);

  Status load(const ResourceSpec& spec, LoadResult* result) override;

  Status unload(const ResourceHandle& handle) override;

 private:
  const CudaDevice* device_;

  // allocations are serialized so the measured delta belongs to one load
  absl::Mutex alloc_mutex_;
};

}  // namespace modelhost
