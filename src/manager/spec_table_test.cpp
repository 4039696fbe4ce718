#include "spec_table.h"

#include <gtest/gtest.h>

namespace modelhost {
namespace {

TaskConfig make_task(const std::string& task_id) {
  TaskConfig task;
  task.task_id = task_id;
  task.selected_option = "small";
  ResourceSpec small;
  small.model_id = "test/small";
  small.backend = "pytorch";
  small.declared_bytes = 2 * GiB;
  ResourceSpec large;
  large.model_id = "test/large";
  large.backend = "sglang";
  large.declared_bytes = 10 * GiB;
  large.quantization = "4bit";
  task.options.push_back({"small", small});
  task.options.push_back({"large", large});
  return task;
}

}  // namespace

TEST(SpecTableTest, AddAndLookup) {
  SpecTable table;
  ASSERT_TRUE(table.add_task(make_task("detection")).ok());
  ASSERT_TRUE(table.add_task(make_task("summarization")).ok());

  EXPECT_EQ(table.size(), 2);
  EXPECT_TRUE(table.contains("detection"));
  EXPECT_FALSE(table.contains("tracking"));
  EXPECT_EQ(table.task_ids(),
            std::vector<std::string>({"detection", "summarization"}));

  ResourceSpec spec;
  std::string option;
  ASSERT_TRUE(table.selected_spec("detection", &spec, &option).ok());
  EXPECT_EQ(option, "small");
  EXPECT_EQ(spec.model_id, "test/small");
  EXPECT_EQ(spec.declared_bytes, 2 * GiB);

  EXPECT_EQ(table.selected_spec("tracking", &spec).code(),
            StatusCode::INVALID_TASK);
}

TEST(SpecTableTest, RejectInvalidTasks) {
  SpecTable table;
  ASSERT_TRUE(table.add_task(make_task("detection")).ok());

  // duplicated task id
  EXPECT_EQ(table.add_task(make_task("detection")).code(),
            StatusCode::CONFIG_INVALID);

  // empty task id
  EXPECT_EQ(table.add_task(make_task("")).code(), StatusCode::CONFIG_INVALID);

  // selection not in options
  auto task = make_task("tracking");
  task.selected_option = "medium";
  EXPECT_EQ(table.add_task(task).code(), StatusCode::CONFIG_INVALID);

  // no options
  task = make_task("tracking");
  task.options.clear();
  EXPECT_EQ(table.add_task(task).code(), StatusCode::CONFIG_INVALID);

  // duplicated option names
  task = make_task("tracking");
  task.options.push_back(task.options.front());
  EXPECT_EQ(table.add_task(task).code(), StatusCode::CONFIG_INVALID);

  // negative memory requirement
  task = make_task("tracking");
  task.options[1].spec.declared_bytes = -1;
  EXPECT_EQ(table.add_task(task).code(), StatusCode::CONFIG_INVALID);

  // memory requirement too large to account
  task = make_task("tracking");
  task.options[1].spec.declared_bytes = kMaxResourceBytes;
  EXPECT_EQ(table.add_task(task).code(), StatusCode::CONFIG_INVALID);

  EXPECT_EQ(table.size(), 1);
}

TEST(SpecTableTest, Select) {
  SpecTable table;
  ASSERT_TRUE(table.add_task(make_task("detection")).ok());

  EXPECT_TRUE(table.check_option("detection", "large").ok());
  EXPECT_EQ(table.check_option("detection", "medium").code(),
            StatusCode::INVALID_OPTION);
  EXPECT_EQ(table.check_option("tracking", "large").code(),
            StatusCode::INVALID_TASK);

  ASSERT_TRUE(table.select("detection", "large").ok());
  ResourceSpec spec;
  ASSERT_TRUE(table.selected_spec("detection", &spec).ok());
  EXPECT_EQ(spec.model_id, "test/large");
  EXPECT_EQ(spec.quantization.value_or(""), "4bit");

  // invalid option keeps the previous selection
  EXPECT_EQ(table.select("detection", "medium").code(),
            StatusCode::INVALID_OPTION);
  EXPECT_EQ(table.tasks()[0].selected_option, "large");
  EXPECT_EQ(table.select("tracking", "large").code(),
            StatusCode::INVALID_TASK);
}

}  // namespace modelhost
