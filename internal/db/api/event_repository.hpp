#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/event_record.hpp"

namespace reactor::db {

/*
  Append-only event store.

  CRITICAL GUARANTEES:

  - Ids are assigned by the store, start at 1 and strictly increase
  - Rows are never updated or deleted
  - A committed row is visible to every later transaction
*/

class EventRepository {
 public:
  virtual ~EventRepository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Assigns record.id on success.
  virtual Result InsertEvent(Transaction&, model::EventRecord& record) = 0;

  virtual std::vector<model::EventRecord> ReadEvents(Transaction&, const model::EventFilter& filter) = 0;

  // 0 when the log is empty.
  virtual uint64_t MaxEventId(Transaction&) = 0;

  virtual uint64_t CountEvents(Transaction&, const std::optional<std::string>& graph_id) = 0;

  // Newest activity first.
  virtual std::vector<model::GraphSummaryRecord> ListGraphs(Transaction&, uint64_t limit, std::optional<uint64_t> since_ms) = 0;
};

} // namespace reactor::db
