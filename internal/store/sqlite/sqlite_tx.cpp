#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace rackwise::store::sqlite {

SqliteTransaction::SqliteTransaction(SqliteDB& db) : db_(db) {
  db_.Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (done_) return;
  try {
    db_.Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    RACKWISE_LOG_WARN("sqlite rollback failed", {observability::StringField("path", db_.Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_.Exec("COMMIT;");
  done_ = true;
}

} // namespace rackwise::store::sqlite
