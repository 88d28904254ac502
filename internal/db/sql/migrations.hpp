#pragma once

#include <string>
#include <vector>

namespace reactor::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements the executor; RunMigrations decides what
  still has to be applied. Migrations are additive only: they create
  tables and indexes or add columns, never drop or rewrite rows.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // Columns currently present on the table, empty if it does not exist.
  virtual std::vector<std::string> ColumnNames(const std::string& table) = 0;

  // Highest recorded version, 0 for a fresh or legacy store.
  virtual int CurrentVersion() = 0;

  virtual void RecordVersion(int version, const std::string& description) = 0;
};

struct AddColumn {
  std::string table;
  std::string column;
  std::string definition; // e.g. "TEXT NOT NULL DEFAULT ''"
};

struct Migration {
  int                      version = 0;
  std::string              description;
  std::vector<AddColumn>   columns;    // applied first, skipped when already present
  std::vector<std::string> statements; // must be idempotent (IF NOT EXISTS)
};

/*
  Applies every migration newer than CurrentVersion(), in order.
  Column additions are checked against the live table so a store
  written by an older build, with or without a version table, is
  brought forward without touching existing rows.

  Returns the number of migrations applied.
*/
int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

} // namespace reactor::db::sql
