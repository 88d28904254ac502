#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "sqlite_statement.hpp"

namespace reactor::db::sqlite {

using reactor::db::ErrorCode;
using reactor::db::Result;

static SqliteTransaction& TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

static model::EventRecord ReadEventRow(sqlite3_stmt* st) {
    model::EventRecord r;
    r.id = ColU64(st, 0);
    r.graph_id = ColText(st, 1);
    r.event_type = ColText(st, 2);
    r.payload_json = ColText(st, 3);
    r.from_agent = ColText(st, 4);
    r.to_agent = ColText(st, 5);
    r.correlation_id = ColText(st, 6);
    r.tags_json = ColText(st, 7);
    r.created_at_ms = ColU64(st, 8);
    return r;
}

SqliteEventRepository::SqliteEventRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteEventRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

Result SqliteEventRepository::InsertEvent(Transaction& t, model::EventRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO events(graph_id,event_type,payload,from_agent,to_agent,correlation_id,tags,created_at_ms) "
        "VALUES(?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.graph_id);
    BindText(st, 2, r.event_type);
    BindText(st, 3, r.payload_json);
    BindText(st, 4, r.from_agent);
    BindText(st, 5, r.to_agent);
    BindText(st, 6, r.correlation_id);
    BindText(st, 7, r.tags_json);
    BindU64(st, 8, r.created_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE)
        r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));

    return Translate(db, rc);
}

std::vector<model::EventRecord>
SqliteEventRepository::ReadEvents(Transaction& t, const model::EventFilter& f) {
    auto* db = TX(t).Handle();

    std::string sql =
        "SELECT id,graph_id,event_type,payload,from_agent,to_agent,correlation_id,tags,created_at_ms "
        "FROM events WHERE id >= ?";
    if (f.upper_id != 0) sql += " AND id <= ?";
    if (f.graph_id) sql += " AND graph_id = ?";
    if (!f.event_types.empty()) {
        sql += " AND event_type IN (";
        for (size_t i = 0; i < f.event_types.size(); ++i)
            sql += i == 0 ? "?" : ",?";
        sql += ")";
    }
    if (f.since_ms) sql += " AND created_at_ms >= ?";
    if (f.until_ms) sql += " AND created_at_ms <= ?";
    sql += " ORDER BY id ASC LIMIT ?;";

    sqlite3_stmt* st = PrepareOrThrow(db, sql);

    int idx = 1;
    BindU64(st, idx++, f.from_id);
    if (f.upper_id != 0) BindU64(st, idx++, f.upper_id);
    if (f.graph_id) BindText(st, idx++, *f.graph_id);
    for (const auto& type : f.event_types)
        BindText(st, idx++, type);
    if (f.since_ms) BindU64(st, idx++, *f.since_ms);
    if (f.until_ms) BindU64(st, idx++, *f.until_ms);
    BindU64(st, idx++, f.limit);

    std::vector<model::EventRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW)
        out.push_back(ReadEventRow(st));
    ThrowIfStepFailed(db, st, rc);

    sqlite3_finalize(st);
    return out;
}

uint64_t SqliteEventRepository::MaxEventId(Transaction& t) {
    auto* db = TX(t).Handle();
    sqlite3_stmt* st = PrepareOrThrow(db, "SELECT COALESCE(MAX(id), 0) FROM events;");

    int rc = sqlite3_step(st);
    ThrowIfStepFailed(db, st, rc);
    uint64_t max_id = rc == SQLITE_ROW ? ColU64(st, 0) : 0;

    sqlite3_finalize(st);
    return max_id;
}

uint64_t SqliteEventRepository::CountEvents(Transaction& t, const std::optional<std::string>& graph_id) {
    auto* db = TX(t).Handle();
    sqlite3_stmt* st = PrepareOrThrow(
        db, graph_id ? "SELECT COUNT(*) FROM events WHERE graph_id = ?;" : "SELECT COUNT(*) FROM events;");
    if (graph_id) BindText(st, 1, *graph_id);

    int rc = sqlite3_step(st);
    ThrowIfStepFailed(db, st, rc);
    uint64_t count = rc == SQLITE_ROW ? ColU64(st, 0) : 0;

    sqlite3_finalize(st);
    return count;
}

std::vector<model::GraphSummaryRecord>
SqliteEventRepository::ListGraphs(Transaction& t, uint64_t limit, std::optional<uint64_t> since_ms) {
    auto* db = TX(t).Handle();

    std::string sql =
        "SELECT graph_id, MIN(created_at_ms), MAX(created_at_ms), COUNT(*) FROM events GROUP BY graph_id";
    if (since_ms) sql += " HAVING MAX(created_at_ms) >= ?";
    sql += " ORDER BY MAX(created_at_ms) DESC, graph_id ASC LIMIT ?;";

    sqlite3_stmt* st = PrepareOrThrow(db, sql);
    int idx = 1;
    if (since_ms) BindU64(st, idx++, *since_ms);
    BindU64(st, idx++, limit);

    std::vector<model::GraphSummaryRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        model::GraphSummaryRecord r;
        r.graph_id = ColText(st, 0);
        r.first_event_ms = ColU64(st, 1);
        r.last_event_ms = ColU64(st, 2);
        r.event_count = ColU64(st, 3);
        out.push_back(std::move(r));
    }
    ThrowIfStepFailed(db, st, rc);

    sqlite3_finalize(st);
    return out;
}

// ------------------------------------------------------------------
// Subscriptions
// ------------------------------------------------------------------

static model::SubscriptionRecord ReadSubscriptionRow(sqlite3_stmt* st) {
    model::SubscriptionRecord r;
    r.id = ColU64(st, 0);
    r.agent_id = ColText(st, 1);
    r.pattern_json = ColText(st, 2);
    r.is_default = sqlite3_column_int(st, 3) != 0;
    r.created_at_ms = ColU64(st, 4);
    r.updated_at_ms = ColU64(st, 5);
    return r;
}

SqliteSubscriptionRepository::SqliteSubscriptionRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteSubscriptionRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

Result SqliteSubscriptionRepository::InsertSubscription(Transaction& t, model::SubscriptionRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO subscriptions(agent_id,pattern_json,is_default,created_at_ms,updated_at_ms) "
        "VALUES(?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.agent_id);
    BindText(st, 2, r.pattern_json);
    BindI32(st, 3, r.is_default ? 1 : 0);
    BindU64(st, 4, r.created_at_ms);
    BindU64(st, 5, r.updated_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE)
        r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));

    return Translate(db, rc);
}

Result SqliteSubscriptionRepository::DeleteSubscription(Transaction& t, uint64_t id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM subscriptions WHERE id=?;", -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "subscription " + std::to_string(id));

    return Translate(db, rc);
}

Result SqliteSubscriptionRepository::DeleteAgentSubscriptions(
    Transaction& t, const std::string& agent_id, bool defaults_only, uint64_t& removed) {
    auto* db = TX(t).Handle();
    removed = 0;

    const char* sql = defaults_only
        ? "DELETE FROM subscriptions WHERE agent_id=? AND is_default=1;"
        : "DELETE FROM subscriptions WHERE agent_id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, agent_id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE)
        removed = static_cast<uint64_t>(sqlite3_changes(db));

    return Translate(db, rc);
}

std::optional<model::SubscriptionRecord>
SqliteSubscriptionRepository::GetSubscription(Transaction& t, uint64_t id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareOrThrow(
        db, "SELECT id,agent_id,pattern_json,is_default,created_at_ms,updated_at_ms FROM subscriptions WHERE id=?;");
    BindU64(st, 1, id);

    int rc = sqlite3_step(st);
    ThrowIfStepFailed(db, st, rc);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadSubscriptionRow(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::SubscriptionRecord>
SqliteSubscriptionRepository::ListSubscriptions(Transaction& t, const std::optional<std::string>& agent_id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareOrThrow(
        db, agent_id
                ? "SELECT id,agent_id,pattern_json,is_default,created_at_ms,updated_at_ms FROM subscriptions WHERE agent_id=? ORDER BY id ASC;"
                : "SELECT id,agent_id,pattern_json,is_default,created_at_ms,updated_at_ms FROM subscriptions ORDER BY id ASC;");
    if (agent_id) BindText(st, 1, *agent_id);

    std::vector<model::SubscriptionRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW)
        out.push_back(ReadSubscriptionRow(st));
    ThrowIfStepFailed(db, st, rc);

    sqlite3_finalize(st);
    return out;
}

// ------------------------------------------------------------------
// Agents
// ------------------------------------------------------------------

static constexpr const char* kAgentColumns =
    "agent_id,node_type,name,full_name,file_path,parent_id,start_line,end_line,start_byte,end_byte,status,created_at_ms,updated_at_ms";

static model::AgentRecord ReadAgentRow(sqlite3_stmt* st) {
    model::AgentRecord r;
    r.agent_id = ColText(st, 0);
    r.node_type = ColText(st, 1);
    r.name = ColText(st, 2);
    r.full_name = ColText(st, 3);
    r.file_path = ColText(st, 4);
    r.parent_id = ColText(st, 5);
    r.start_line = ColU32(st, 6);
    r.end_line = ColU32(st, 7);
    r.start_byte = ColU32(st, 8);
    r.end_byte = ColU32(st, 9);
    r.status = ColText(st, 10);
    r.created_at_ms = ColU64(st, 11);
    r.updated_at_ms = ColU64(st, 12);
    return r;
}

SqliteAgentRepository::SqliteAgentRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteAgentRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

Result SqliteAgentRepository::UpsertAgent(Transaction& t, const model::AgentRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO agents(agent_id,node_type,name,full_name,file_path,parent_id,start_line,end_line,start_byte,end_byte,status,created_at_ms,updated_at_ms) "
        "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?) "
        "ON CONFLICT(agent_id) DO UPDATE SET node_type=excluded.node_type, name=excluded.name, full_name=excluded.full_name, "
        "file_path=excluded.file_path, parent_id=excluded.parent_id, start_line=excluded.start_line, end_line=excluded.end_line, "
        "start_byte=excluded.start_byte, end_byte=excluded.end_byte, status=excluded.status, updated_at_ms=excluded.updated_at_ms;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.agent_id);
    BindText(st, 2, r.node_type);
    BindText(st, 3, r.name);
    BindText(st, 4, r.full_name);
    BindText(st, 5, r.file_path);
    BindText(st, 6, r.parent_id);
    BindU64(st, 7, r.start_line);
    BindU64(st, 8, r.end_line);
    BindU64(st, 9, r.start_byte);
    BindU64(st, 10, r.end_byte);
    BindText(st, 11, r.status);
    BindU64(st, 12, r.created_at_ms);
    BindU64(st, 13, r.updated_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

Result SqliteAgentRepository::UpdateAgentStatus(
    Transaction& t, const std::string& agent_id, const std::string& status, uint64_t updated_at_ms) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "UPDATE agents SET status=?, updated_at_ms=? WHERE agent_id=?;", -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, status);
    BindU64(st, 2, updated_at_ms);
    BindText(st, 3, agent_id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "agent " + agent_id);

    return Translate(db, rc);
}

std::optional<model::AgentRecord>
SqliteAgentRepository::GetAgent(Transaction& t, const std::string& agent_id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareOrThrow(db, std::string("SELECT ") + kAgentColumns + " FROM agents WHERE agent_id=?;");
    BindText(st, 1, agent_id);

    int rc = sqlite3_step(st);
    ThrowIfStepFailed(db, st, rc);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadAgentRow(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::AgentRecord>
SqliteAgentRepository::ListAgents(Transaction& t, const std::optional<std::string>& status) {
    auto* db = TX(t).Handle();

    std::string sql = std::string("SELECT ") + kAgentColumns + " FROM agents";
    if (status) sql += " WHERE status=?";
    sql += " ORDER BY agent_id ASC;";

    sqlite3_stmt* st = PrepareOrThrow(db, sql);
    if (status) BindText(st, 1, *status);

    std::vector<model::AgentRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW)
        out.push_back(ReadAgentRow(st));
    ThrowIfStepFailed(db, st, rc);

    sqlite3_finalize(st);
    return out;
}

} // namespace reactor::db::sqlite
