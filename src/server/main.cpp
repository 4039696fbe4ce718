#include <absl/strings/str_format.h>
#include <absl/time/clock.h>
#include <folly/init/Init.h>
#include <gflags/gflags.h>
#include <glog/logging.h>
#include <torch/torch.h>

#include <algorithm>
#include <atomic>
#include <csignal>
#include <memory>
#include <nlohmann/json.hpp>

#include "common/metrics.h"
#include "http_server.h"
#include "loaders/device_buffer_loader.h"
#include "manager/loader_registry.h"
#include "manager/model_config.h"
#include "manager/resource_manager.h"
#include "memory/cuda_device.h"
#include "memory/device.h"
#include "models_service.h"
using namespace modelhost;

DEFINE_string(config_path, "config/models.json", "Path to the models config.");

DEFINE_int32(http_port, 9999, "Port for http server.");

DEFINE_int32(http_threads, 4, "Number of threads serving http requests.");

DEFINE_int32(http_blocking_threads,
             2,
             "Number of threads running model load, unload and select "
             "requests, so slow loads do not stall status and health checks.");

DEFINE_string(device, "cuda", "Device to load models on, e.g. cuda, cuda:0.");

DEFINE_int64(device_memory_bytes,
             0,
             "Device capacity in bytes, 0 to query the device.");

DEFINE_int32(warmup_threads, 1, "Number of models loaded in parallel at warmup.");

DEFINE_double(offload_threshold,
              -1.0,
              "Fraction of device memory the selected models may declare, "
              "negative to use the config.");

DEFINE_string(warmup_on_startup,
              "",
              "Load all selected models at startup (true/false), empty to use "
              "the config.");

// NOLINTNEXTLINE
static std::atomic<uint32_t> signal_received{0};
void shutdown_handler(int signal) { signal_received.store(signal); }

int main(int argc, char** argv) {
  // glog and glfag will be initialized in folly::init
  folly::Init init(&argc, &argv);
  google::InstallFailureSignalHandler();

  SpecTable spec_table;
  InferenceOptions inference;
  const Status config_status =
      load_model_config(FLAGS_config_path, &spec_table, &inference);
  if (!config_status.ok()) {
    LOG(FATAL) << "Failed to load models config " << FLAGS_config_path << ": "
               << config_status;
  }
  if (FLAGS_offload_threshold >= 0) {
    CHECK_LE(FLAGS_offload_threshold, 1.0) << "offload_threshold must be <= 1";
    inference.offload_threshold = FLAGS_offload_threshold;
  }
  if (FLAGS_warmup_on_startup == "true") {
    inference.warmup_on_startup = true;
  } else if (FLAGS_warmup_on_startup == "false") {
    inference.warmup_on_startup = false;
  } else {
    CHECK(FLAGS_warmup_on_startup.empty())
        << "Invalid warmup_on_startup: " << FLAGS_warmup_on_startup;
  }

  // the loader always allocates on the cuda device, the capacity may be capped
  auto cuda_device = std::make_unique<CudaDevice>(torch::Device(FLAGS_device));
  std::unique_ptr<Device> fixed_device;
  const Device* device = cuda_device.get();
  if (FLAGS_device_memory_bytes > 0) {
    fixed_device =
        std::make_unique<FixedCapacityDevice>(FLAGS_device_memory_bytes);
    device = fixed_device.get();
  }
  LOG(INFO) << absl::StrFormat(
      "Using %s with %.2fGB capacity",
      cuda_device->name(),
      static_cast<double>(device->total_memory()) / GiB);

  LoaderRegistry loaders;
  auto buffer_loader = std::make_shared<DeviceBufferLoader>(cuda_device.get());
  for (const auto& task : spec_table.tasks()) {
    for (const auto& option : task.options) {
      if (!loaders.has_backend(option.spec.backend)) {
        loaders.register_loader(option.spec.backend, buffer_loader);
      }
    }
  }

  ResourceManager::Options options;
  options.offload_threshold(inference.offload_threshold)
      .warmup_enabled(inference.warmup_on_startup)
      .warmup_threads(std::max(FLAGS_warmup_threads, 1));
  ResourceManager manager(options, &spec_table, &loaders, device);

  const BudgetReport report = manager.validate_budget();
  if (report.valid) {
    LOG(INFO) << absl::StrFormat(
        "Memory budget valid: %.2fGB required, %.2fGB allowed",
        static_cast<double>(report.total_required_bytes) / GiB,
        static_cast<double>(report.max_allowed_bytes) / GiB);
  } else {
    LOG(WARNING) << absl::StrFormat(
        "Memory budget exceeded: %.2fGB required, %.2fGB allowed",
        static_cast<double>(report.total_required_bytes) / GiB,
        static_cast<double>(report.max_allowed_bytes) / GiB);
  }

  manager.warmup();

  ModelsService models_service(&manager, inference);

  HttpServer http_server;
  http_server.register_uri("/gflags",
                           [](HttpServer::Transport& transport) -> bool {
                             auto gflags = nlohmann::json::array();
                             std::vector<google::CommandLineFlagInfo> flags;
                             google::GetAllFlags(&flags);
                             for (const auto& flag : flags) {
                               nlohmann::json gflag;
                               gflag["name"] = flag.name;
                               gflag["type"] = flag.type;
                               gflag["description"] = flag.description;
                               gflag["value"] = flag.current_value;
                               gflag["default"] = flag.default_value;
                               gflags.push_back(gflag);
                             }
                             return transport.send_string(
                                 gflags.dump(/*indent=*/2), "application/json");
                           });
  http_server.register_uri(
      "/metrics", [](HttpServer::Transport& transport) -> bool {
        return transport.send_string(Metrics::Instance().GetString());
      });
  http_server.register_uri("/health",
                           [](HttpServer::Transport& transport) -> bool {
                             return transport.send_string("OK\n");
                           });
  models_service.register_routes(&http_server);

  if (!http_server.start(
          FLAGS_http_port, FLAGS_http_threads, FLAGS_http_blocking_threads)) {
    LOG(ERROR) << "Failed to start http server on port " << FLAGS_http_port;
    return -1;
  }

  // install graceful shutdown handler
  (void)signal(SIGINT, shutdown_handler);
  (void)signal(SIGTERM, shutdown_handler);
  while (signal_received.load() == 0) {
    absl::SleepFor(absl::Milliseconds(100));
  }
  LOG(WARNING) << "Received signal " << signal_received.load()
               << ", stopping server...";

  http_server.stop();
  manager.shutdown();
  return 0;
}
