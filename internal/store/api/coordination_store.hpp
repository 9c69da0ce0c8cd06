#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/store/api/result.hpp"

namespace rackwise::store {

/*
  Coordination store abstraction.

  A hierarchical key-value tree in the style of ZooKeeper:

  - Paths are absolute, '/'-separated, without a trailing slash
  - Every node may carry a byte payload (or none at all)
  - Create() makes missing parents on the way down
  - Delete() refuses nodes that still have children

  The store is the single source of truth for topology state and may be
  shared by several scheduler processes. It gives no record-level locking;
  callers rely on idempotent writes keyed by stable ids.

  Expected outcomes (missing node, node already present) are reported through
  the return value. Anything else (I/O, corruption, lost connection) is
  thrown as util::BackendFailure.
*/

class CoordinationStore {
 public:
  virtual ~CoordinationStore() = default;

  // OK or AlreadyExists.
  virtual Result Create(const std::string& path, const std::optional<std::string>& data = std::nullopt) = 0;

  // nullopt when the node does not exist. A node without payload reads as "".
  virtual std::optional<std::string> Get(const std::string& path) = 0;

  // OK or NotFound. Never creates the node.
  virtual Result SetData(const std::string& path, const std::string& data) = 0;

  virtual DeleteResult Delete(const std::string& path) = 0;

  // Child names (not full paths), lexicographically ordered. Empty when the
  // parent does not exist.
  virtual std::vector<std::string> ListChildren(const std::string& path) = 0;

  virtual bool Exists(const std::string& path) = 0;
};

} // namespace rackwise::store
