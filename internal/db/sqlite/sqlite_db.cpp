#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "sqlite_statement.hpp"

namespace reactor::db::sqlite {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)) {
  constexpr int kFlags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &db_, kFlags, nullptr) != SQLITE_OK) {
    const std::string detail = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    Fail("open", detail);
  }

  try {
    ApplyPragmas(options);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }

  REACTOR_LOG_DEBUG("sqlite store opened",
                    {StringField("path", path_), BoolField("synchronous_full", options.synchronous_full),
                     IntField("busy_timeout_ms", options.busy_timeout_ms)});
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) == SQLITE_OK) return;

  const std::string detail = err ? err : sqlite3_errmsg(db_);
  sqlite3_free(err);
  Fail("exec", detail);
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  return PrepareOrThrow(db_, sql);
}

void SqliteDB::ApplyPragmas(const SqliteOptions& options) {
  Exec("PRAGMA journal_mode=WAL;");
  Exec(options.synchronous_full ? "PRAGMA synchronous=FULL;" : "PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");
  Exec("PRAGMA temp_store=MEMORY;");

  if (sqlite3_busy_timeout(db_, options.busy_timeout_ms) != SQLITE_OK) {
    Fail("busy_timeout", sqlite3_errmsg(db_));
  }
}

void SqliteDB::Fail(const std::string& what, const std::string& detail) const {
  throw std::runtime_error("sqlite " + what + " " + path_ + ": " + detail);
}

} // namespace reactor::db::sqlite
