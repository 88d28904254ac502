#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/event_repository.hpp"
#include "internal/events/trigger_channel.hpp"
#include "internal/observability/event_observer.hpp"
#include "reactor/v1.hpp"

namespace reactor::subscriptions {
class SubscriptionRegistry;
}

namespace reactor::events {

struct ReplayQuery {
  uint64_t                   from_id = 1;
  std::optional<std::string> graph_id;
  std::vector<std::string>   event_types; // empty = every type
  std::optional<uint64_t>    since_ms;
  std::optional<uint64_t>    until_ms;
  std::size_t                page_size = 256;
};

struct GraphSummary {
  std::string graph_id;
  uint64_t    first_event_ms = 0;
  uint64_t    last_event_ms  = 0;
  uint64_t    event_count    = 0;
};

/*
  Lazy cursor over persisted events in id order. Bounded by the
  highest id at creation time, so it is finite even while the log
  keeps growing; pages are read on demand.
*/
class EventReplay {
 public:
  EventReplay(std::shared_ptr<db::EventRepository> repository, ReplayQuery query, uint64_t upper_id);

  std::optional<reactor::v1::Event> Next();

  uint64_t UpperId() const {
    return upper_id_;
  }

 private:
  void Fill();

  std::shared_ptr<db::EventRepository> repository_;
  ReplayQuery                          query_;
  uint64_t                             upper_id_;
  uint64_t                             next_from_;
  std::deque<reactor::v1::Event>       buffer_;
  bool                                 exhausted_ = false;
};

/*
  Append-only event log and router.

  Append() is the single entry point for new events:
    1. persist (own transaction, committed before anything else)
    2. ask the registry which agents match
    3. push one trigger per matched agent, in registry order
    4. publish to the observer

  Steps 2-4 run under the same lock as step 1, so every agent sees
  its triggers in append order. A persistence failure throws
  util::PersistenceError and nothing is delivered or published.
  Routing failures after the commit are logged; the event stays.
*/
class EventLog {
 public:
  EventLog(std::shared_ptr<db::EventRepository> repository, std::shared_ptr<subscriptions::SubscriptionRegistry> registry,
           std::shared_ptr<TriggerChannel> triggers, std::shared_ptr<observability::EventObserver> observer = nullptr);

  uint64_t Append(reactor::v1::Event event);

  EventReplay Replay(ReplayQuery query = {}) const;

  std::vector<GraphSummary> GraphSummaries(uint64_t limit = 50, std::optional<uint64_t> since_ms = std::nullopt) const;
  uint64_t                  CountEvents(const std::optional<std::string>& graph_id = std::nullopt) const;
  uint64_t                  LastEventId() const;

  TriggerChannel& Triggers() {
    return *triggers_;
  }

  // Stops accepting appends and closes the trigger channel.
  void Close();
  bool IsClosed() const;

 private:
  void Route(const reactor::v1::Event& event);

  std::shared_ptr<db::EventRepository>                 repository_;
  std::shared_ptr<subscriptions::SubscriptionRegistry> registry_;
  std::shared_ptr<TriggerChannel>                      triggers_;
  std::shared_ptr<observability::EventObserver>        observer_;

  mutable std::mutex append_mutex_;
  bool               closed_ = false;
};

} // namespace reactor::events
