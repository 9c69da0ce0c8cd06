#pragma once

#include "sqlite_db.hpp"

namespace rackwise::store::sqlite {

/*
  Scoped BEGIN IMMEDIATE ... COMMIT.

  Takes the write lock up front so a multi-row create (parents plus the
  node itself) never interleaves with another process. Rolls back on
  destruction unless Commit() ran.
*/
class SqliteTransaction {
 public:
  explicit SqliteTransaction(SqliteDB& db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void Commit();

 private:
  SqliteDB& db_;
  bool      done_ = false;
};

} // namespace rackwise::store::sqlite
