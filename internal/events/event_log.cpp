#include "event_log.hpp"

#include <algorithm>

#include "internal/events/event_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/subscriptions/subscription_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace reactor::events {

using observability::IntField;
using observability::StringField;
using observability::UIntField;

namespace {

void ThrowIfError(const db::Result& result, const std::string& prefix) {
  if (!result) {
    throw util::PersistenceError(prefix + ": " + result.Describe());
  }
}

} // namespace

// ------------------------------------------------------------------
// Replay
// ------------------------------------------------------------------

EventReplay::EventReplay(std::shared_ptr<db::EventRepository> repository, ReplayQuery query, uint64_t upper_id)
    : repository_(std::move(repository)), query_(std::move(query)), upper_id_(upper_id), next_from_(std::max<uint64_t>(query_.from_id, 1)) {
  if (query_.page_size == 0) query_.page_size = 256;
  exhausted_ = upper_id_ == 0 || next_from_ > upper_id_;
}

std::optional<reactor::v1::Event> EventReplay::Next() {
  if (buffer_.empty() && !exhausted_) Fill();
  if (buffer_.empty()) return std::nullopt;

  auto event = std::move(buffer_.front());
  buffer_.pop_front();
  return event;
}

void EventReplay::Fill() {
  db::model::EventFilter filter;
  filter.from_id     = next_from_;
  filter.upper_id    = upper_id_;
  filter.graph_id    = query_.graph_id;
  filter.event_types = query_.event_types;
  filter.since_ms    = query_.since_ms;
  filter.until_ms    = query_.until_ms;
  filter.limit       = query_.page_size;

  std::vector<db::model::EventRecord> page;
  try {
    auto tx = repository_->Begin();
    page    = repository_->ReadEvents(*tx, filter);
  } catch (const util::PersistenceError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::PersistenceError(std::string("replay events: ") + e.what());
  }

  if (page.size() < query_.page_size) exhausted_ = true;
  if (!page.empty()) {
    next_from_ = page.back().id + 1;
    if (next_from_ > upper_id_) exhausted_ = true;
  }

  for (const auto& record : page) buffer_.push_back(FromRecord(record));
}

// ------------------------------------------------------------------
// Log
// ------------------------------------------------------------------

EventLog::EventLog(std::shared_ptr<db::EventRepository> repository, std::shared_ptr<subscriptions::SubscriptionRegistry> registry,
                   std::shared_ptr<TriggerChannel> triggers, std::shared_ptr<observability::EventObserver> observer)
    : repository_(std::move(repository)), registry_(std::move(registry)), triggers_(std::move(triggers)), observer_(std::move(observer)) {
}

uint64_t EventLog::Append(reactor::v1::Event event) {
  observability::SpanScope span("EventLog.Append");

  if (event.payload_case() == reactor::v1::Event::PAYLOAD_NOT_SET) {
    throw util::InvalidArgument("append event: payload is not set");
  }
  const std::string type(EventTypeName(event));
  span.SetAttribute("event.type", type);

  std::lock_guard lock(append_mutex_);
  if (closed_) {
    throw util::InvalidState("append event: event log is closed");
  }

  event.clear_id();
  if (!event.has_created_at()) {
    *event.mutable_created_at() = util::NowTimestamp();
  }

  auto record = ToRecord(event);
  try {
    auto tx = repository_->Begin();
    ThrowIfError(repository_->InsertEvent(*tx, record), "append event");
    tx->Commit();
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordEventAppended(type, false);
    REACTOR_LOG_ERROR("event append failed", {StringField("event_type", type), StringField("error", e.what())});
    if (dynamic_cast<const util::PersistenceError*>(&e)) throw;
    throw util::PersistenceError(std::string("append event: ") + e.what());
  }

  event.set_id(record.id);
  span.SetAttribute("event.id", static_cast<std::int64_t>(record.id));
  observability::Metrics::Instance().RecordEventAppended(type, true);

  Route(event);
  return record.id;
}

void EventLog::Route(const reactor::v1::Event& event) {
  std::vector<std::string> agents;
  try {
    agents = registry_->GetMatchingAgents(event);
  } catch (const std::exception& e) {
    REACTOR_LOG_ERROR("subscription match failed; event persisted without delivery",
                      {UIntField("event_id", event.id()), StringField("event_type", EventTypeName(event)), StringField("error", e.what())});
  }

  for (const auto& agent_id : agents) {
    try {
      triggers_->Push(Trigger{agent_id, event.id(), event});
    } catch (const std::exception& e) {
      REACTOR_LOG_WARN("trigger delivery failed", {UIntField("event_id", event.id()), StringField("agent_id", agent_id), StringField("error", e.what())});
    }
  }

  if (observer_) {
    try {
      observer_->Publish(event);
    } catch (const std::exception& e) {
      REACTOR_LOG_WARN("observer publish failed", {UIntField("event_id", event.id()), StringField("error", e.what())});
    }
  }
}

EventReplay EventLog::Replay(ReplayQuery query) const {
  return EventReplay(repository_, std::move(query), LastEventId());
}

std::vector<GraphSummary> EventLog::GraphSummaries(uint64_t limit, std::optional<uint64_t> since_ms) const {
  auto tx = repository_->Begin();

  std::vector<GraphSummary> out;
  for (auto& record : repository_->ListGraphs(*tx, limit, since_ms)) {
    out.push_back(GraphSummary{std::move(record.graph_id), record.first_event_ms, record.last_event_ms, record.event_count});
  }
  return out;
}

uint64_t EventLog::CountEvents(const std::optional<std::string>& graph_id) const {
  auto tx = repository_->Begin();
  return repository_->CountEvents(*tx, graph_id);
}

uint64_t EventLog::LastEventId() const {
  try {
    auto tx = repository_->Begin();
    return repository_->MaxEventId(*tx);
  } catch (const std::exception& e) {
    throw util::PersistenceError(std::string("read last event id: ") + e.what());
  }
}

void EventLog::Close() {
  {
    std::lock_guard lock(append_mutex_);
    closed_ = true;
  }
  triggers_->Close();
}

bool EventLog::IsClosed() const {
  std::lock_guard lock(append_mutex_);
  return closed_;
}

} // namespace reactor::events
