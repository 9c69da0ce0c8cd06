#pragma once

#include <sqlite3.h>

#include <chrono>
#include <string>

namespace rackwise::store::sqlite {

/*
  Owning handle on one SQLite database file.

  Opens in WAL mode so several scheduler processes can read the topology
  while one of them writes; writers wait up to busy_timeout for the lock.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Runs one or more statements that return no rows.
  void Exec(const std::string& sql);

  // PRAGMA user_version, used to version the store schema.
  int  UserVersion();
  void SetUserVersion(int version);

 private:
  void Configure(std::chrono::milliseconds busy_timeout);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace rackwise::store::sqlite
