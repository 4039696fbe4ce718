#include "resource_cache.h"

#include <glog/logging.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace modelhost {

ResourceCache::ResourceCache() {
  lru_front_.next = &lru_back_;
  lru_back_.prev = &lru_front_;
}

const CachedResource* ResourceCache::touch(const std::string& task_id) {
  auto it = nodes_.find(task_id);
  if (it == nodes_.end()) {
    return nullptr;
  }
  Node* node = it->second.get();
  move_node_to_lru_back(node);
  return &node->resource;
}

const CachedResource* ResourceCache::find(const std::string& task_id) const {
  auto it = nodes_.find(task_id);
  if (it == nodes_.end()) {
    return nullptr;
  }
  return &it->second->resource;
}

void ResourceCache::insert(CachedResource resource) {
  CHECK(nodes_.count(resource.task_id) == 0)
      << "task " << resource.task_id << " is already cached";
  auto node = std::make_unique<Node>();
  total_bytes_ += resource.actual_bytes;
  node->resource = std::move(resource);
  add_node_to_lru_back(node.get());
  const std::string task_id = node->resource.task_id;
  nodes_.emplace(task_id, std::move(node));
}

std::optional<CachedResource> ResourceCache::remove(
    const std::string& task_id) {
  auto it = nodes_.find(task_id);
  if (it == nodes_.end()) {
    return std::nullopt;
  }
  return release_node(it->second.get());
}

std::optional<CachedResource> ResourceCache::pop_lru() {
  if (lru_front_.next == &lru_back_) {
    return std::nullopt;
  }
  return release_node(lru_front_.next);
}

const CachedResource* ResourceCache::lru() const {
  if (lru_front_.next == &lru_back_) {
    return nullptr;
  }
  return &lru_front_.next->resource;
}

std::vector<CachedResource> ResourceCache::entries() const {
  std::vector<CachedResource> result;
  result.reserve(nodes_.size());
  for (const Node* node = lru_front_.next; node != &lru_back_;
       node = node->next) {
    result.push_back(node->resource);
  }
  return result;
}

CachedResource ResourceCache::release_node(Node* node) {
  remove_node_from_lru(node);
  CachedResource resource = std::move(node->resource);
  total_bytes_ -= resource.actual_bytes;
  // node is owned by nodes_, erasing it frees the node
  nodes_.erase(resource.task_id);
  return resource;
}

void ResourceCache::remove_node_from_lru(Node* node) {
  node->prev->next = node->next;
  node->next->prev = node->prev;
  node->prev = nullptr;
  node->next = nullptr;
}

void ResourceCache::add_node_to_lru_back(Node* node) {
  node->prev = lru_back_.prev;
  node->next = &lru_back_;
  lru_back_.prev->next = node;
  lru_back_.prev = node;
}

void ResourceCache::move_node_to_lru_back(Node* node) {
  remove_node_from_lru(node);
  add_node_to_lru_back(node);
}

}  // namespace modelhost
