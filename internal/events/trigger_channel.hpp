#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

#include "reactor/v1.hpp"

namespace reactor::events {

// One matched (agent, event) pair.
struct Trigger {
  std::string        agent_id;
  uint64_t           event_id = 0;
  reactor::v1::Event event;
};

// Bookkeeping work the consumer runs in order with the triggers around it.
using ChannelTask = std::function<void()>;

using ChannelItem = std::variant<Trigger, ChannelTask>;

/*
  Single-consumer channel between the event log and the runner.

  Triggers are bounded: Push() blocks while capacity triggers are
  queued. Tasks bypass the bound so a consumer-side release can never
  wait behind the backpressure it is meant to relieve. Both share one
  FIFO, so a task posted after a push is seen after that trigger.

  Close() wakes everyone: blocked and later pushes and posts throw
  util::ChannelClosed, Pop() drains what is left and then returns
  nullopt.
*/
class TriggerChannel {
 public:
  explicit TriggerChannel(std::size_t capacity = 1024);

  void Push(Trigger trigger);
  void Post(ChannelTask task);

  // blocking wait
  std::optional<ChannelItem> Pop();

  // Consumer acknowledges a popped item once it has been handed off.
  void TaskDone();

  void Close();
  bool IsClosed() const;

  std::size_t QueuedTriggers() const;

  // Pushed or posted but not yet acknowledged with TaskDone().
  std::size_t Pending() const;

  std::size_t Capacity() const {
    return capacity_;
  }

 private:
  mutable std::mutex      mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<ChannelItem> queue_;
  std::size_t             capacity_;
  std::size_t             queued_triggers_ = 0;
  std::size_t             pending_         = 0;
  bool                    closed_          = false;
};

} // namespace reactor::events
