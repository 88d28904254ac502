#include "sqlite_schema.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "sqlite_tx.hpp"

namespace reactor::db::sqlite {

namespace {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  std::vector<std::string> ColumnNames(const std::string& table) override {
    std::vector<std::string> columns;
    sqlite3_stmt*            st = db_.Prepare("PRAGMA table_info(" + table + ");");
    while (sqlite3_step(st) == SQLITE_ROW) {
      const unsigned char* name = sqlite3_column_text(st, 1);
      if (name) columns.emplace_back(reinterpret_cast<const char*>(name));
    }
    sqlite3_finalize(st);
    return columns;
  }

  int CurrentVersion() override {
    sqlite3_stmt* st      = db_.Prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
    int           version = 0;
    if (sqlite3_step(st) == SQLITE_ROW) version = sqlite3_column_int(st, 0);
    sqlite3_finalize(st);
    return version;
  }

  void RecordVersion(int version, const std::string& description) override {
    sqlite3_stmt* st = db_.Prepare("INSERT INTO schema_migrations(version, description, applied_at_ms) VALUES(?,?,?);");
    sqlite3_bind_int(st, 1, version);
    sqlite3_bind_text(st, 2, description.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(st, 3, static_cast<sqlite3_int64>(util::NowMillis()));
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
      throw std::runtime_error("record schema version " + std::to_string(version) + ": " + sqlite3_errmsg(db_.Handle()));
    }
  }

 private:
  SqliteDB& db_;
};

int Migrate(const std::shared_ptr<SqliteDB>& db, const std::vector<sql::Migration>& migrations) {
  SqliteTransaction tx(db);
  db->Exec("CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, description TEXT NOT NULL, applied_at_ms INTEGER NOT NULL);");

  SqliteMigrationExecutor executor(*db);
  const int               applied = sql::RunMigrations(executor, migrations);
  tx.Commit();

  if (applied > 0) {
    REACTOR_LOG_INFO("schema migrated", {observability::StringField("db", db->Path()), observability::IntField("applied", applied),
                                         observability::IntField("version", migrations.back().version)});
  }
  return applied;
}

} // namespace

int MigrateEventStore(const std::shared_ptr<SqliteDB>& db) {
  static const std::vector<sql::Migration> kMigrations = {
      {1,
       "events table",
       {},
       {"CREATE TABLE IF NOT EXISTS events (id INTEGER PRIMARY KEY AUTOINCREMENT, graph_id TEXT NOT NULL DEFAULT '', event_type TEXT NOT NULL, payload TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
        "CREATE INDEX IF NOT EXISTS idx_events_graph ON events(graph_id);",
        "CREATE INDEX IF NOT EXISTS idx_events_type ON events(event_type);",
        "CREATE INDEX IF NOT EXISTS idx_events_created ON events(created_at_ms);"}},
      {2,
       "routing columns",
       {{"events", "from_agent", "TEXT NOT NULL DEFAULT ''"},
        {"events", "to_agent", "TEXT NOT NULL DEFAULT ''"},
        {"events", "correlation_id", "TEXT NOT NULL DEFAULT ''"},
        {"events", "tags", "TEXT NOT NULL DEFAULT '[]'"}},
       {"CREATE INDEX IF NOT EXISTS idx_events_to_agent ON events(to_agent);",
        "CREATE INDEX IF NOT EXISTS idx_events_correlation ON events(correlation_id);"}},
  };
  return Migrate(db, kMigrations);
}

int MigrateSubscriptionStore(const std::shared_ptr<SqliteDB>& db) {
  static const std::vector<sql::Migration> kMigrations = {
      {1,
       "subscriptions table",
       {},
       {"CREATE TABLE IF NOT EXISTS subscriptions (id INTEGER PRIMARY KEY AUTOINCREMENT, agent_id TEXT NOT NULL, pattern_json TEXT NOT NULL, is_default INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
        "CREATE INDEX IF NOT EXISTS idx_subscriptions_agent ON subscriptions(agent_id);"}},
  };
  return Migrate(db, kMigrations);
}

int MigrateSwarmStore(const std::shared_ptr<SqliteDB>& db) {
  static const std::vector<sql::Migration> kMigrations = {
      {1,
       "agents table",
       {},
       {"CREATE TABLE IF NOT EXISTS agents (agent_id TEXT PRIMARY KEY, node_type TEXT NOT NULL, name TEXT NOT NULL, full_name TEXT NOT NULL, file_path TEXT NOT NULL, parent_id TEXT NOT NULL DEFAULT '', start_line INTEGER NOT NULL DEFAULT 0, end_line INTEGER NOT NULL DEFAULT 0, status TEXT NOT NULL DEFAULT 'active', created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
        "CREATE INDEX IF NOT EXISTS idx_agents_status ON agents(status);",
        "CREATE INDEX IF NOT EXISTS idx_agents_file ON agents(file_path);"}},
      {2,
       "byte ranges",
       {{"agents", "start_byte", "INTEGER NOT NULL DEFAULT 0"}, {"agents", "end_byte", "INTEGER NOT NULL DEFAULT 0"}},
       {}},
  };
  return Migrate(db, kMigrations);
}

} // namespace reactor::db::sqlite
