#pragma once

#include <memory>

#include "internal/db/api/agent_repository.hpp"
#include "internal/db/api/event_repository.hpp"
#include "internal/db/api/subscription_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace reactor::db::sqlite {

/*
  One sqlite file per store. Constructors expect the schema to be
  migrated already (see sqlite_schema.hpp).
*/

class SqliteEventRepository final : public db::EventRepository {
public:
  explicit SqliteEventRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertEvent(Transaction&, model::EventRecord&) override;
  std::vector<model::EventRecord> ReadEvents(Transaction&, const model::EventFilter&) override;
  uint64_t MaxEventId(Transaction&) override;
  uint64_t CountEvents(Transaction&, const std::optional<std::string>& graph_id) override;
  std::vector<model::GraphSummaryRecord> ListGraphs(Transaction&, uint64_t limit, std::optional<uint64_t> since_ms) override;

private:
  std::shared_ptr<SqliteDB> db_;
};

class SqliteSubscriptionRepository final : public db::SubscriptionRepository {
public:
  explicit SqliteSubscriptionRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertSubscription(Transaction&, model::SubscriptionRecord&) override;
  Result DeleteSubscription(Transaction&, uint64_t id) override;
  Result DeleteAgentSubscriptions(Transaction&, const std::string& agent_id, bool defaults_only, uint64_t& removed) override;
  std::optional<model::SubscriptionRecord> GetSubscription(Transaction&, uint64_t id) override;
  std::vector<model::SubscriptionRecord> ListSubscriptions(Transaction&, const std::optional<std::string>& agent_id) override;

private:
  std::shared_ptr<SqliteDB> db_;
};

class SqliteAgentRepository final : public db::AgentRepository {
public:
  explicit SqliteAgentRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertAgent(Transaction&, const model::AgentRecord&) override;
  Result UpdateAgentStatus(Transaction&, const std::string& agent_id, const std::string& status, uint64_t updated_at_ms) override;
  std::optional<model::AgentRecord> GetAgent(Transaction&, const std::string& agent_id) override;
  std::vector<model::AgentRecord> ListAgents(Transaction&, const std::optional<std::string>& status) override;

private:
  std::shared_ptr<SqliteDB> db_;
};

}
