#include "migrations.hpp"

#include <algorithm>
#include <stdexcept>

namespace reactor::db::sql {

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  const int current = executor.CurrentVersion();
  int       last    = current;
  int       applied = 0;

  for (const auto& migration : ordered) {
    if (migration.version <= last && migration.version > current) {
      throw std::logic_error("migrations out of order at version " + std::to_string(migration.version));
    }
    if (migration.version <= current) continue;

    for (const auto& column : migration.columns) {
      auto existing = executor.ColumnNames(column.table);
      if (std::find(existing.begin(), existing.end(), column.column) != existing.end()) continue;
      executor.ExecuteSQL("ALTER TABLE " + column.table + " ADD COLUMN " + column.column + " " + column.definition + ";");
    }

    for (const auto& sql : migration.statements) {
      executor.ExecuteSQL(sql);
    }

    executor.RecordVersion(migration.version, migration.description);
    last = migration.version;
    ++applied;
  }

  return applied;
}

} // namespace reactor::db::sql
