#include "memory_store.hpp"

#include "internal/store/api/paths.hpp"
#include "internal/util/errors.hpp"

namespace rackwise::store::memory {

MemoryStore::MemoryStore() = default;

std::string MemoryStore::ChildPrefix(const std::string& path) {
  return path == "/" ? path : path + "/";
}

bool MemoryStore::HasChildrenLocked(const std::string& path) const {
  const auto prefix = ChildPrefix(path);
  auto       it     = nodes_.lower_bound(prefix);
  return it != nodes_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
}

Result MemoryStore::Create(const std::string& path, const std::optional<std::string>& data) {
  ValidatePath(path);
  if (path == "/") return Result::Err(ErrorCode::AlreadyExists, path);

  std::scoped_lock lock(mutex_);
  if (nodes_.contains(path)) return Result::Err(ErrorCode::AlreadyExists, path);

  for (auto parent = ParentPath(path); parent != "/"; parent = ParentPath(parent)) {
    nodes_.try_emplace(parent, std::nullopt);
  }
  nodes_[path] = data;
  return Result::Ok();
}

std::optional<std::string> MemoryStore::Get(const std::string& path) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);
  auto             it = nodes_.find(path);
  if (it == nodes_.end()) return std::nullopt;
  return it->second.value_or(std::string{});
}

Result MemoryStore::SetData(const std::string& path, const std::string& data) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);
  auto             it = nodes_.find(path);
  if (it == nodes_.end()) return Result::Err(ErrorCode::NotFound, path);
  it->second = data;
  return Result::Ok();
}

DeleteResult MemoryStore::Delete(const std::string& path) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);
  auto             it = nodes_.find(path);
  if (it == nodes_.end()) return DeleteResult::kDidNotExist;
  if (HasChildrenLocked(path)) {
    throw util::InvalidState("cannot delete store node with children: " + path);
  }
  nodes_.erase(it);
  return DeleteResult::kDeleted;
}

std::vector<std::string> MemoryStore::ListChildren(const std::string& path) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);

  std::vector<std::string> children;
  const auto               prefix = ChildPrefix(path);
  for (auto it = nodes_.lower_bound(prefix); it != nodes_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) break;
    auto rest = it->first.substr(prefix.size());
    if (rest.find('/') != std::string::npos) continue;
    children.push_back(std::move(rest));
  }
  return children;
}

bool MemoryStore::Exists(const std::string& path) {
  ValidatePath(path);
  if (path == "/") return true;
  std::scoped_lock lock(mutex_);
  return nodes_.contains(path);
}

} // namespace rackwise::store::memory
