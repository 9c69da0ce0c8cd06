#include "sqlite_store.hpp"

#include <sqlite3.h>

#include <string>

#include "internal/store/api/paths.hpp"
#include "internal/util/errors.hpp"
#include "sqlite_tx.hpp"

namespace rackwise::store::sqlite {

namespace {

constexpr int kSchemaVersion = 1;

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StatementPtr Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw util::BackendFailure(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return StatementPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::optional<std::string>& data) {
  if (!data) {
    sqlite3_bind_null(st, idx);
    return;
  }
  sqlite3_bind_blob(st, idx, data->data(), static_cast<int>(data->size()), SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* blob = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  if (!blob || size <= 0) return {};
  return std::string(static_cast<const char*>(blob), static_cast<size_t>(size));
}

// Anything that is not a row or a clean finish is a backend fault.
void ThrowIfFailed(sqlite3* db, int rc, const char* what) {
  if (rc == SQLITE_ROW || rc == SQLITE_DONE || rc == SQLITE_OK) return;
  throw util::BackendFailure(std::string(what) + ": " + sqlite3_errmsg(db));
}

} // namespace

SqliteStore::SqliteStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  EnsureSchema();
}

void SqliteStore::EnsureSchema() {
  const int version = db_->UserVersion();
  if (version > kSchemaVersion) {
    throw util::BackendFailure("sqlite store " + db_->Path() + " has schema version " + std::to_string(version) +
                               ", newer than supported version " + std::to_string(kSchemaVersion));
  }
  if (version == kSchemaVersion) return;

  SqliteTransaction tx(*db_);
  db_->Exec("CREATE TABLE IF NOT EXISTS znodes (path TEXT PRIMARY KEY, parent TEXT NOT NULL, data BLOB);");
  db_->Exec("CREATE INDEX IF NOT EXISTS znodes_parent ON znodes(parent);");
  db_->SetUserVersion(kSchemaVersion);
  tx.Commit();
}

bool SqliteStore::ExistsLocked(const std::string& path) {
  auto st = Prepare(db_->Handle(), "SELECT 1 FROM znodes WHERE path=?;");
  BindText(st.get(), 1, path);
  const int rc = sqlite3_step(st.get());
  ThrowIfFailed(db_->Handle(), rc, "sqlite exists");
  return rc == SQLITE_ROW;
}

bool SqliteStore::HasChildrenLocked(const std::string& path) {
  auto st = Prepare(db_->Handle(), "SELECT 1 FROM znodes WHERE parent=? LIMIT 1;");
  BindText(st.get(), 1, path);
  const int rc = sqlite3_step(st.get());
  ThrowIfFailed(db_->Handle(), rc, "sqlite children");
  return rc == SQLITE_ROW;
}

int SqliteStore::InsertLocked(const std::string& path, const std::optional<std::string>& data, bool ignore_existing) {
  const char* sql = ignore_existing ? "INSERT OR IGNORE INTO znodes(path,parent,data) VALUES(?,?,?);"
                                    : "INSERT INTO znodes(path,parent,data) VALUES(?,?,?);";
  auto        st  = Prepare(db_->Handle(), sql);
  BindText(st.get(), 1, path);
  BindText(st.get(), 2, ParentPath(path));
  BindBlob(st.get(), 3, data);
  return sqlite3_step(st.get());
}

Result SqliteStore::Create(const std::string& path, const std::optional<std::string>& data) {
  ValidatePath(path);
  if (path == "/") return Result::Err(ErrorCode::AlreadyExists, path);

  std::scoped_lock lock(mutex_);
  if (ExistsLocked(path)) return Result::Err(ErrorCode::AlreadyExists, path);

  SqliteTransaction tx(*db_);
  for (auto parent = ParentPath(path); parent != "/"; parent = ParentPath(parent)) {
    ThrowIfFailed(db_->Handle(), InsertLocked(parent, std::nullopt, true), "sqlite create parent");
  }

  const int rc = InsertLocked(path, data, false);
  if (rc == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::AlreadyExists, path);
  }
  ThrowIfFailed(db_->Handle(), rc, "sqlite create");

  tx.Commit();
  return Result::Ok();
}

std::optional<std::string> SqliteStore::Get(const std::string& path) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);

  auto st = Prepare(db_->Handle(), "SELECT data FROM znodes WHERE path=?;");
  BindText(st.get(), 1, path);

  const int rc = sqlite3_step(st.get());
  ThrowIfFailed(db_->Handle(), rc, "sqlite get");
  if (rc != SQLITE_ROW) return std::nullopt;
  return ColBlob(st.get(), 0);
}

Result SqliteStore::SetData(const std::string& path, const std::string& data) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);

  auto st = Prepare(db_->Handle(), "UPDATE znodes SET data=? WHERE path=?;");
  BindBlob(st.get(), 1, data);
  BindText(st.get(), 2, path);

  ThrowIfFailed(db_->Handle(), sqlite3_step(st.get()), "sqlite set data");
  if (sqlite3_changes(db_->Handle()) == 0) return Result::Err(ErrorCode::NotFound, path);
  return Result::Ok();
}

DeleteResult SqliteStore::Delete(const std::string& path) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);

  if (HasChildrenLocked(path)) {
    throw util::InvalidState("cannot delete store node with children: " + path);
  }

  auto st = Prepare(db_->Handle(), "DELETE FROM znodes WHERE path=?;");
  BindText(st.get(), 1, path);
  ThrowIfFailed(db_->Handle(), sqlite3_step(st.get()), "sqlite delete");

  return sqlite3_changes(db_->Handle()) > 0 ? DeleteResult::kDeleted : DeleteResult::kDidNotExist;
}

std::vector<std::string> SqliteStore::ListChildren(const std::string& path) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);

  auto st = Prepare(db_->Handle(), "SELECT path FROM znodes WHERE parent=? ORDER BY path;");
  BindText(st.get(), 1, path);

  const auto               prefix_len = path == "/" ? 1 : path.size() + 1;
  std::vector<std::string> children;
  int                      rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    children.push_back(ColText(st.get(), 0).substr(prefix_len));
  }
  ThrowIfFailed(db_->Handle(), rc, "sqlite list children");
  return children;
}

bool SqliteStore::Exists(const std::string& path) {
  ValidatePath(path);
  if (path == "/") return true;
  std::scoped_lock lock(mutex_);
  return ExistsLocked(path);
}

} // namespace rackwise::store::sqlite
