#include "resource_cache.h"

#include <absl/time/clock.h>
#include <gtest/gtest.h>

namespace modelhost {
namespace {

CachedResource make_entry(const std::string& task_id, int64_t bytes) {
  CachedResource entry;
  entry.task_id = task_id;
  entry.option_name = "default";
  entry.spec.model_id = "test/" + task_id;
  entry.handle = std::make_shared<Resource>();
  entry.actual_bytes = bytes;
  entry.loaded_at = absl::Now();
  return entry;
}

std::vector<std::string> task_ids(const ResourceCache& cache) {
  std::vector<std::string> ids;
  for (const auto& entry : cache.entries()) {
    ids.push_back(entry.task_id);
  }
  return ids;
}

}  // namespace

TEST(ResourceCacheTest, Empty) {
  ResourceCache cache;
  EXPECT_TRUE(cache.empty());
  EXPECT_EQ(cache.size(), 0);
  EXPECT_EQ(cache.total_bytes(), 0);
  EXPECT_EQ(cache.lru(), nullptr);
  EXPECT_EQ(cache.touch("a"), nullptr);
  EXPECT_EQ(cache.find("a"), nullptr);
  EXPECT_FALSE(cache.pop_lru().has_value());
  EXPECT_FALSE(cache.remove("a").has_value());
}

TEST(ResourceCacheTest, RecencyOrder) {
  ResourceCache cache;
  cache.insert(make_entry("a", 1));
  cache.insert(make_entry("b", 2));
  cache.insert(make_entry("c", 4));
  EXPECT_EQ(cache.size(), 3);
  EXPECT_EQ(cache.total_bytes(), 7);
  EXPECT_EQ(task_ids(cache), std::vector<std::string>({"a", "b", "c"}));
  EXPECT_EQ(cache.lru()->task_id, "a");

  // touching moves the entry to the most recently used position
  const CachedResource* a = cache.touch("a");
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a->actual_bytes, 1);
  EXPECT_EQ(task_ids(cache), std::vector<std::string>({"b", "c", "a"}));

  // find does not change the order
  ASSERT_NE(cache.find("b"), nullptr);
  EXPECT_EQ(cache.lru()->task_id, "b");

  // touching the most recent entry is a no-op on the order
  cache.touch("a");
  EXPECT_EQ(task_ids(cache), std::vector<std::string>({"b", "c", "a"}));
}

TEST(ResourceCacheTest, PopLru) {
  ResourceCache cache;
  cache.insert(make_entry("a", 1));
  cache.insert(make_entry("b", 2));
  cache.insert(make_entry("c", 4));
  cache.touch("a");

  auto evicted = cache.pop_lru();
  ASSERT_TRUE(evicted.has_value());
  EXPECT_EQ(evicted->task_id, "b");
  EXPECT_EQ(evicted->actual_bytes, 2);
  EXPECT_NE(evicted->handle, nullptr);
  EXPECT_EQ(cache.total_bytes(), 5);
  EXPECT_FALSE(cache.contains("b"));

  evicted = cache.pop_lru();
  ASSERT_TRUE(evicted.has_value());
  EXPECT_EQ(evicted->task_id, "c");
  evicted = cache.pop_lru();
  ASSERT_TRUE(evicted.has_value());
  EXPECT_EQ(evicted->task_id, "a");
  EXPECT_FALSE(cache.pop_lru().has_value());
  EXPECT_TRUE(cache.empty());
  EXPECT_EQ(cache.total_bytes(), 0);
}

TEST(ResourceCacheTest, Remove) {
  ResourceCache cache;
  cache.insert(make_entry("a", 1));
  cache.insert(make_entry("b", 2));
  cache.insert(make_entry("c", 4));

  auto removed = cache.remove("b");
  ASSERT_TRUE(removed.has_value());
  EXPECT_EQ(removed->task_id, "b");
  EXPECT_EQ(cache.total_bytes(), 5);
  EXPECT_EQ(task_ids(cache), std::vector<std::string>({"a", "c"}));
  EXPECT_FALSE(cache.remove("b").has_value());

  // a removed task can be inserted again, as most recently used
  cache.insert(make_entry("b", 8));
  EXPECT_EQ(task_ids(cache), std::vector<std::string>({"a", "c", "b"}));
  EXPECT_EQ(cache.total_bytes(), 13);
}

}  // namespace modelhost
