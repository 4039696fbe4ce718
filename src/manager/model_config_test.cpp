#include "model_config.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <limits>

namespace modelhost {
namespace {

using nlohmann::json;

json sample_config() {
  return json::parse(R"({
    "models": {
      "video_summarization": {
        "selected": "test-model-1",
        "options": {
          "test-model-1": {
            "model_id": "test/model-1",
            "framework": "sglang",
            "vram_gb": 10,
            "quantization": "4bit",
            "speed": "fast",
            "description": "Test model 1"
          },
          "test-model-2": {
            "model_id": "test/model-2",
            "framework": "pytorch",
            "vram_gb": 5,
            "speed": "very_fast",
            "description": "Test model 2"
          }
        }
      },
      "object_detection": {
        "selected": "yolo-test",
        "options": {
          "yolo-test": {
            "model_id": "ultralytics/yolo-test",
            "framework": "pytorch",
            "vram_gb": 2,
            "speed": "real_time",
            "fps": 60,
            "description": "Test YOLO model"
          }
        }
      }
    },
    "inference": {
      "max_memory_per_model": "auto",
      "offload_threshold": 0.85,
      "warmup_on_startup": false,
      "default_batch_size": 1,
      "max_batch_size": 8
    }
  })");
}

StatusCode parse_code(const json& config) {
  SpecTable table;
  InferenceOptions options;
  return parse_model_config(config, &table, &options).code();
}

}  // namespace

TEST(ModelConfigTest, ParseSample) {
  SpecTable table;
  InferenceOptions options;
  ASSERT_TRUE(parse_model_config(sample_config(), &table, &options).ok());

  EXPECT_EQ(table.size(), 2);
  ResourceSpec spec;
  std::string option;
  ASSERT_TRUE(table.selected_spec("video_summarization", &spec, &option).ok());
  EXPECT_EQ(option, "test-model-1");
  EXPECT_EQ(spec.model_id, "test/model-1");
  EXPECT_EQ(spec.backend, "sglang");
  EXPECT_EQ(spec.declared_bytes, 10 * GiB);
  EXPECT_EQ(spec.speed_class, "fast");
  EXPECT_EQ(spec.description, "Test model 1");
  EXPECT_EQ(spec.quantization.value_or(""), "4bit");
  EXPECT_FALSE(spec.throughput_hint.has_value());

  ASSERT_TRUE(table.selected_spec("object_detection", &spec).ok());
  EXPECT_EQ(spec.declared_bytes, 2 * GiB);
  ASSERT_TRUE(spec.throughput_hint.has_value());
  EXPECT_DOUBLE_EQ(spec.throughput_hint.value(), 60);
  EXPECT_FALSE(spec.quantization.has_value());

  EXPECT_EQ(options.max_memory_per_model, "auto");
  EXPECT_DOUBLE_EQ(options.offload_threshold, 0.85);
  EXPECT_FALSE(options.warmup_on_startup);
  EXPECT_EQ(options.default_batch_size, 1);
  EXPECT_EQ(options.max_batch_size, 8);
}

TEST(ModelConfigTest, Defaults) {
  auto config = json::parse(R"({
    "models": {
      "tracking": {
        "selected": "tiny",
        "options": {
          "tiny": {"model_id": "test/tiny", "framework": "pytorch"}
        }
      }
    },
    "inference": {"warmup_on_startup": true}
  })");
  SpecTable table;
  InferenceOptions options;
  ASSERT_TRUE(parse_model_config(config, &table, &options).ok());

  ResourceSpec spec;
  ASSERT_TRUE(table.selected_spec("tracking", &spec).ok());
  EXPECT_EQ(spec.declared_bytes, 0);
  EXPECT_EQ(spec.speed_class, "medium");
  EXPECT_EQ(spec.description, "");
  EXPECT_TRUE(options.warmup_on_startup);
  EXPECT_DOUBLE_EQ(options.offload_threshold, 0.85);

  // the inference section is optional
  config.erase("inference");
  EXPECT_EQ(parse_code(config), StatusCode::OK);
}

TEST(ModelConfigTest, FractionalGigabytes) {
  auto config = sample_config();
  config["models"]["object_detection"]["options"]["yolo-test"]["vram_gb"] =
      0.5;
  SpecTable table;
  InferenceOptions options;
  ASSERT_TRUE(parse_model_config(config, &table, &options).ok());
  ResourceSpec spec;
  ASSERT_TRUE(table.selected_spec("object_detection", &spec).ok());
  EXPECT_EQ(spec.declared_bytes, GiB / 2);
}

TEST(ModelConfigTest, RejectMalformed) {
  EXPECT_EQ(parse_code(json::array()), StatusCode::CONFIG_INVALID);
  EXPECT_EQ(parse_code(json::object()), StatusCode::CONFIG_INVALID);

  // selected option is not one of the options
  auto config = sample_config();
  config["models"]["video_summarization"]["selected"] = "missing";
  EXPECT_EQ(parse_code(config), StatusCode::CONFIG_INVALID);

  // missing selection
  config = sample_config();
  config["models"]["video_summarization"].erase("selected");
  EXPECT_EQ(parse_code(config), StatusCode::CONFIG_INVALID);

  // empty options
  config = sample_config();
  config["models"]["object_detection"]["options"] = json::object();
  EXPECT_EQ(parse_code(config), StatusCode::CONFIG_INVALID);

  // missing model id
  config = sample_config();
  config["models"]["object_detection"]["options"]["yolo-test"].erase(
      "model_id");
  EXPECT_EQ(parse_code(config), StatusCode::CONFIG_INVALID);

  // wrong types
  config = sample_config();
  config["models"]["object_detection"]["options"]["yolo-test"]["vram_gb"] =
      "two";
  EXPECT_EQ(parse_code(config), StatusCode::CONFIG_INVALID);

  config = sample_config();
  config["models"]["object_detection"]["options"]["yolo-test"]["framework"] =
      1;
  EXPECT_EQ(parse_code(config), StatusCode::CONFIG_INVALID);

  // negative memory requirement
  config = sample_config();
  config["models"]["object_detection"]["options"]["yolo-test"]["vram_gb"] = -1;
  EXPECT_EQ(parse_code(config), StatusCode::CONFIG_INVALID);

  // threshold out of range
  config = sample_config();
  config["inference"]["offload_threshold"] = 1.5;
  EXPECT_EQ(parse_code(config), StatusCode::CONFIG_INVALID);

  config = sample_config();
  config["inference"]["warmup_on_startup"] = "yes";
  EXPECT_EQ(parse_code(config), StatusCode::CONFIG_INVALID);

  config = sample_config();
  config["inference"]["default_batch_size"] = 16;
  EXPECT_EQ(parse_code(config), StatusCode::CONFIG_INVALID);
}

TEST(ModelConfigTest, RejectOutOfRangeMemory) {
  auto vram_gb = [](json& config) -> json& {
    return config["models"]["object_detection"]["options"]["yolo-test"]
                 ["vram_gb"];
  };

  // does not fit in int64_t bytes
  auto config = sample_config();
  vram_gb(config) = 1e10;
  EXPECT_EQ(parse_code(config), StatusCode::CONFIG_INVALID);

  // fits, but a handful of them overflow a sum
  config = sample_config();
  vram_gb(config) = 8e9;
  EXPECT_EQ(parse_code(config), StatusCode::CONFIG_INVALID);

  config = sample_config();
  vram_gb(config) = std::numeric_limits<double>::infinity();
  EXPECT_EQ(parse_code(config), StatusCode::CONFIG_INVALID);

  config = sample_config();
  vram_gb(config) = std::numeric_limits<double>::quiet_NaN();
  EXPECT_EQ(parse_code(config), StatusCode::CONFIG_INVALID);

  // a large but sane device still parses
  config = sample_config();
  vram_gb(config) = 1024;
  EXPECT_EQ(parse_code(config), StatusCode::OK);
}

TEST(ModelConfigTest, LoadFile) {
  const auto dir = std::filesystem::temp_directory_path();
  const auto path = (dir / "modelhost_model_config_test.json").string();
  {
    std::ofstream ofs(path);
    ofs << sample_config().dump(2);
  }
  SpecTable table;
  InferenceOptions options;
  EXPECT_TRUE(load_model_config(path, &table, &options).ok());
  EXPECT_EQ(table.size(), 2);

  {
    std::ofstream ofs(path);
    ofs << "{ not json";
  }
  SpecTable bad_table;
  EXPECT_EQ(load_model_config(path, &bad_table, &options).code(),
            StatusCode::CONFIG_INVALID);
  std::filesystem::remove(path);

  SpecTable missing_table;
  EXPECT_EQ(load_model_config(path, &missing_table, &options).code(),
            StatusCode::CONFIG_INVALID);
}

TEST(ModelConfigTest, ToJson) {
  SpecTable table;
  InferenceOptions options;
  ASSERT_TRUE(parse_model_config(sample_config(), &table, &options).ok());
  ASSERT_TRUE(table.select("video_summarization", "test-model-2").ok());

  const json rendered = to_json(table.tasks(), options);
  EXPECT_EQ(rendered["models"]["video_summarization"]["selected"],
            "test-model-2");
  const auto& yolo =
      rendered["models"]["object_detection"]["options"]["yolo-test"];
  EXPECT_EQ(yolo["model_id"], "ultralytics/yolo-test");
  EXPECT_EQ(yolo["framework"], "pytorch");
  EXPECT_DOUBLE_EQ(yolo["vram_gb"].get<double>(), 2.0);
  EXPECT_DOUBLE_EQ(yolo["fps"].get<double>(), 60.0);
  EXPECT_TRUE(yolo["quantization"].is_null());
  EXPECT_DOUBLE_EQ(rendered["inference"]["offload_threshold"].get<double>(),
                   0.85);

  // the rendering parses back into an equivalent table
  SpecTable reparsed;
  InferenceOptions reparsed_options;
  ASSERT_TRUE(parse_model_config(rendered, &reparsed, &reparsed_options).ok());
  EXPECT_EQ(reparsed.size(), 2);
}

}  // namespace modelhost
