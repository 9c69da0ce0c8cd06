#include "store_factory.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/store/memory/memory_store.hpp"
#if RACKWISE_STORE_SQLITE
#include "internal/store/sqlite/sqlite_db.hpp"
#include "internal/store/sqlite/sqlite_store.hpp"
#endif

namespace rackwise::store {

std::shared_ptr<CoordinationStore> StoreFactory::Build(const rackwise::runtime::config::CoordinationConfig& cfg) {
  if (cfg.has_sqlite()) {
#if RACKWISE_STORE_SQLITE
    if (cfg.sqlite().path().empty()) {
      throw std::invalid_argument("coordination.sqlite.path is required");
    }
    RACKWISE_LOG_INFO("using sqlite coordination store", {observability::StringField("path", cfg.sqlite().path())});
    auto db = std::make_shared<sqlite::SqliteDB>(cfg.sqlite().path(), std::chrono::milliseconds(cfg.sqlite().busy_timeout_ms()));
    return std::make_shared<sqlite::SqliteStore>(std::move(db));
#else
    throw std::runtime_error("sqlite coordination store requested but not enabled at build time");
#endif
  }

  RACKWISE_LOG_INFO("using in-memory coordination store");
  return std::make_shared<memory::MemoryStore>();
}

} // namespace rackwise::store
