#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "internal/store/api/coordination_store.hpp"

namespace rackwise::store::memory {

/*
  Process-local coordination store.

  Ordered map of path -> optional payload behind one mutex. Used as the
  default backend and by tests.
*/
class MemoryStore final : public store::CoordinationStore {
 public:
  MemoryStore();

  Result                     Create(const std::string& path, const std::optional<std::string>& data = std::nullopt) override;
  std::optional<std::string> Get(const std::string& path) override;
  Result                     SetData(const std::string& path, const std::string& data) override;
  DeleteResult               Delete(const std::string& path) override;
  std::vector<std::string>   ListChildren(const std::string& path) override;
  bool                       Exists(const std::string& path) override;

 private:
  static std::string ChildPrefix(const std::string& path);

  bool HasChildrenLocked(const std::string& path) const;

  std::mutex                                          mutex_;
  std::map<std::string, std::optional<std::string>> nodes_;
};

} // namespace rackwise::store::memory
