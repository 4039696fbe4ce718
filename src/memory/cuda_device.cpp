#include "cuda_device.h"

#include <c10/cuda/CUDACachingAllocator.h>
#include <c10/cuda/CUDAFunctions.h>
#include <c10/cuda/CUDAGuard.h>
#include <cuda_runtime_api.h>
#include <glog/logging.h>
#include <torch/torch.h>

namespace modelhost {

CudaDevice::CudaDevice(const torch::Device& device) : device_(device) {
  CHECK(device_.is_cuda()) << "Only support CUDA device for now.";
  if (!device_.has_index()) {
    device_.set_index(c10::cuda::current_device());
  }
  // the capacity never changes, a device we cannot query is unusable
  cudaDeviceProp prop{};
  const auto err = cudaGetDeviceProperties(&prop, device_.index());
  CHECK(err == cudaSuccess) << "Failed to get properties for " << device_
                            << ", error: " << cudaGetErrorString(err);
  total_memory_ = static_cast<int64_t>(prop.totalGlobalMem);
}

int64_t CudaDevice::total_memory() const { return total_memory_; }

int64_t CudaDevice::available_memory() const {
  // cudaMemGetInfo reports on the current device, restored on scope exit
  const c10::cuda::CUDAGuard guard(device_.index());
  size_t free = 0;
  size_t total = 0;
  const auto err = cudaMemGetInfo(&free, &total);
  if (err != cudaSuccess) {
    LOG(ERROR) << "Failed to get memory info for " << device_
               << ", error: " << cudaGetErrorString(err);
    // clear the sticky error so later runtime calls are not blamed for it
    static_cast<void>(cudaGetLastError());
    return 0;
  }
  return static_cast<int64_t>(free);
}

std::string CudaDevice::name() const { return device_.str(); }

int64_t CudaDevice::allocated_memory() const {
  using namespace c10::cuda;
  const auto stats = CUDACachingAllocator::getDeviceStats(device_.index());
  // StatType::AGGREGATE
  return stats.allocated_bytes[0].current;
}

}  // namespace modelhost
