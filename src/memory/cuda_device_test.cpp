#include "cuda_device.h"

#include <c10/cuda/CUDAFunctions.h>
#include <gtest/gtest.h>
#include <torch/torch.h>

namespace modelhost {

TEST(CudaDeviceTest, MemoryQueries) {
  if (!torch::cuda::is_available()) {
    GTEST_SKIP() << "CUDA not available";
  }
  const CudaDevice device(torch::Device(torch::kCUDA, 0));
  EXPECT_EQ(device.name(), "cuda:0");
  EXPECT_GT(device.total_memory(), 0);

  const int64_t available = device.available_memory();
  EXPECT_GT(available, 0);
  EXPECT_LE(available, device.total_memory());
  EXPECT_GE(device.allocated_memory(), 0);
}

TEST(CudaDeviceTest, AvailableMemoryKeepsCurrentDevice) {
  if (torch::cuda::device_count() < 2) {
    GTEST_SKIP() << "needs two CUDA devices";
  }
  c10::cuda::set_device(0);
  const CudaDevice device(torch::Device(torch::kCUDA, 1));
  EXPECT_GT(device.available_memory(), 0);
  EXPECT_EQ(c10::cuda::current_device(), 0);
}

}  // namespace modelhost
