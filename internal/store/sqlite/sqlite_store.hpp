#pragma once

#include <memory>
#include <mutex>

#include "internal/store/api/coordination_store.hpp"
#include "sqlite_db.hpp"

namespace rackwise::store::sqlite {

/*
  Durable coordination store on a single SQLite file.

  Schema:
    znodes(path TEXT PRIMARY KEY, parent TEXT NOT NULL, data BLOB)

  A NULL data column is a node without payload. All statements run under
  one mutex; creates that add parents run inside a SqliteTransaction.
*/
class SqliteStore final : public store::CoordinationStore {
 public:
  explicit SqliteStore(std::shared_ptr<SqliteDB> db);

  Result                     Create(const std::string& path, const std::optional<std::string>& data = std::nullopt) override;
  std::optional<std::string> Get(const std::string& path) override;
  Result                     SetData(const std::string& path, const std::string& data) override;
  DeleteResult               Delete(const std::string& path) override;
  std::vector<std::string>   ListChildren(const std::string& path) override;
  bool                       Exists(const std::string& path) override;

 private:
  void EnsureSchema();

  bool ExistsLocked(const std::string& path);
  bool HasChildrenLocked(const std::string& path);
  int  InsertLocked(const std::string& path, const std::optional<std::string>& data, bool ignore_existing);

  std::shared_ptr<SqliteDB> db_;
  std::mutex                mutex_;
};

} // namespace rackwise::store::sqlite
