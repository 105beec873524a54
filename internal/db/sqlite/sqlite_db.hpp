#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace geocache::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection serves the whole process. Transactions on a single
  connection cannot interleave, so SqliteTransaction holds TxMutex()
  for its whole lifetime: concurrent writers queue instead of failing.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure(bool wal_mode);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace geocache::db::sqlite
