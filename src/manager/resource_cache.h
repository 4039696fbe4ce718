#pragma once

#include <absl/time/time.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "resource_loader.h"
#include "resource_spec.h"

namespace modelhost {

// runtime record of a task whose resource is resident
struct CachedResource {
  std::string task_id;

  // the option and spec the resource was loaded from
  std::string option_name;
  ResourceSpec spec;

  ResourceHandle handle;

  // measured by the loader after the load
  int64_t actual_bytes = 0;

  absl::Time loaded_at;
};

// loaded resources keyed by task id, ordered by recency with an intrusive
// doubly linked list. touch, insert, remove and pop_lru are O(1).
// not thread safe, the owner serializes access.
class ResourceCache final {
 public:
  ResourceCache();

  ~ResourceCache() = default;

  // disable copy, move and assign
  ResourceCache(const ResourceCache&) = delete;
  ResourceCache(ResourceCache&&) = delete;
  ResourceCache& operator=(const ResourceCache&) = delete;
  ResourceCache& operator=(ResourceCache&&) = delete;

  // move the entry to the most recently used position.
  // returns nullptr if the task is not cached.
  const CachedResource* touch(const std::string& task_id);

  // look up without changing the recency order
  const CachedResource* find(const std::string& task_id) const;

  bool contains(const std::string& task_id) const {
    return nodes_.count(task_id) != 0;
  }

  // insert as most recently used, the task must not be cached yet
  void insert(CachedResource resource);

  // remove the entry of the task, returns nullopt if the task is not cached
  std::optional<CachedResource> remove(const std::string& task_id);

  // remove the least recently used entry, returns nullopt if empty
  std::optional<CachedResource> pop_lru();

  // the least recently used entry, nullptr if empty
  const CachedResource* lru() const;

  // copies of all entries, least recently used first
  std::vector<CachedResource> entries() const;

  size_t size() const { return nodes_.size(); }

  bool empty() const { return nodes_.empty(); }

  // sum of actual_bytes of all entries
  int64_t total_bytes() const { return total_bytes_; }

 private:
  struct Node {
    CachedResource resource;

    // the previous and next nodes, used to maintain the LRU list
    Node* prev = nullptr;
    Node* next = nullptr;
  };

  // unlink the node and release its accounting
  CachedResource release_node(Node* node);

  // delete the node from the LRU list
  static void remove_node_from_lru(Node* node);

  // add a new node to the back of the LRU list
  void add_node_to_lru_back(Node* node);

  // move the node to the back of the LRU list
  void move_node_to_lru_back(Node* node);

  // task id -> node, owns the nodes
  std::unordered_map<std::string, std::unique_ptr<Node>> nodes_;

  // sentinels of the LRU list. the node after lru_front_ is the least
  // recently used, the node before lru_back_ the most recently used.
  Node lru_front_;
  Node lru_back_;

  int64_t total_bytes_ = 0;
};

}  // namespace modelhost
