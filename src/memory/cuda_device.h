#pragma once
#include <torch/torch.h>

#include "device.h"

namespace modelhost {

// Device backed by the CUDA runtime. Only support CUDA device for now.
class CudaDevice final : public Device {
 public:
  explicit CudaDevice(const torch::Device& device);

  // returns the total memory in bytes of the device, queried once.
  int64_t total_memory() const override;

  // returns the free memory in bytes reported by the driver, 0 if the query
  // fails. leaves the current device of the calling thread unchanged.
  int64_t available_memory() const override;

  std::string name() const override;

  // returns the bytes currently held by the caching allocator for tensors.
  int64_t allocated_memory() const;

  const torch::Device& device() const { return device_; }

 private:
  torch::Device device_;

  int64_t total_memory_ = 0;
};

}  // namespace modelhost
