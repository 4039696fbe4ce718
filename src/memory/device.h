#pragma once

#include <cstdint>
#include <string>

namespace modelhost {

// the device whose memory bounds the resource cache.
class Device {
 public:
  virtual ~Device() = default;

  // total memory in bytes of the device
  virtual int64_t total_memory() const = 0;

  // memory in bytes that is currently free on the device
  virtual int64_t available_memory() const = 0;

  // human readable device name for logs and status reports
  virtual std::string name() const = 0;
};

// a device with a fixed capacity that never changes. nothing is allocated,
// available memory is always the full capacity.
class FixedCapacityDevice final : public Device {
 public:
  explicit FixedCapacityDevice(int64_t capacity_bytes)
      : capacity_bytes_(capacity_bytes) {}

  int64_t total_memory() const override { return capacity_bytes_; }

  int64_t available_memory() const override { return capacity_bytes_; }

  std::string name() const override { return "fixed"; }

 private:
  int64_t capacity_bytes_ = 0;
};

}  // namespace modelhost
