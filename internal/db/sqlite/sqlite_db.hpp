#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace reactor::db::sqlite {

struct SqliteOptions {
  bool synchronous_full = false;
  int  busy_timeout_ms  = 5000;
};

/*
  One store file (events.db, subscriptions.db or swarm.db) and its
  single shared connection.

  Opening creates the file if needed and switches it to WAL so replay
  cursors keep reading while an append holds the write lock. Writers on
  the connection serialise through TxMutex(); SqliteTransaction takes it.

  Open and pragma failures throw std::runtime_error naming the file.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3*           Handle() const { return db_; }
  const std::string& Path() const { return path_; }
  std::mutex&        TxMutex() { return tx_mutex_; }

  // Runs one or more statements without results (DDL, pragmas, BEGIN/COMMIT).
  void Exec(const std::string& sql);

  // Caller owns the statement and must sqlite3_finalize it.
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  void ApplyPragmas(const SqliteOptions& options);
  [[noreturn]] void Fail(const std::string& what, const std::string& detail) const;

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace reactor::db::sqlite
