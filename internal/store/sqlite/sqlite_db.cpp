#include "sqlite_db.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace rackwise::store::sqlite {

namespace {

std::string Describe(sqlite3* db, const std::string& path, const char* what) {
  return std::string(what) + " (" + path + "): " + (db ? sqlite3_errmsg(db) : "out of memory");
}

} // namespace

SqliteDB::SqliteDB(std::string path, std::chrono::milliseconds busy_timeout) : path_(std::move(path)) {
  if (path_.empty()) {
    throw std::invalid_argument("SqliteDB: path is required");
  }

  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const auto msg = Describe(db_, path_, "sqlite open");
    sqlite3_close(db_);
    db_ = nullptr;
    throw util::BackendFailure(msg);
  }

  try {
    Configure(busy_timeout);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = "sqlite exec (" + path_ + "): " + (err ? err : sqlite3_errstr(rc));
    sqlite3_free(err);
    throw util::BackendFailure(msg);
  }
}

int SqliteDB::UserVersion() {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &raw, nullptr) != SQLITE_OK) {
    throw util::BackendFailure(Describe(db_, path_, "sqlite user_version"));
  }
  std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> st(raw, &sqlite3_finalize);

  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw util::BackendFailure(Describe(db_, path_, "sqlite user_version"));
  }
  return sqlite3_column_int(st.get(), 0);
}

void SqliteDB::SetUserVersion(int version) {
  Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

void SqliteDB::Configure(std::chrono::milliseconds busy_timeout) {
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  if (sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count())) != SQLITE_OK) {
    throw util::BackendFailure(Describe(db_, path_, "sqlite busy_timeout"));
  }

  RACKWISE_LOG_DEBUG("sqlite database opened", {observability::StringField("path", path_),
                                                 observability::IntField("busy_timeout_ms", busy_timeout.count())});
}

} // namespace rackwise::store::sqlite
