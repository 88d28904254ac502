#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace reactor::db::sqlite {

using observability::StringField;

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!Open()) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    REACTOR_LOG_WARN("abandoned transaction did not roll back", {StringField("db", db_->Path()), StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  RequireOpen("commit");
  db_->Exec("COMMIT;");
  Finish(Phase::Committed);
}

void SqliteTransaction::Rollback() {
  RequireOpen("rollback");
  Finish(Phase::RolledBack);
  db_->Exec("ROLLBACK;");
}

} // namespace reactor::db::sqlite
