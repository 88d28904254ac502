#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace reactor::db::sqlite {

/*
  Write transaction on one store file.

  Takes the connection's TxMutex before BEGIN IMMEDIATE so threads of this
  process queue on the mutex instead of spinning on SQLITE_BUSY. The busy
  timeout still covers a second process holding the file.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
};

} // namespace reactor::db::sqlite
