#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/store/api/coordination_store.hpp"

namespace rackwise::store {

/*
  Builds the coordination store named by the configuration.

  Memory is used when no backend is set. SQLite is only available when the
  build enabled it (RACKWISE_STORE_SQLITE).
*/
class StoreFactory {
 public:
  static std::shared_ptr<CoordinationStore> Build(const rackwise::runtime::config::CoordinationConfig& cfg);
};

} // namespace rackwise::store
