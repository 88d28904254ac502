#include "trigger_channel.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace reactor::events {

TriggerChannel::TriggerChannel(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {
}

void TriggerChannel::Push(Trigger trigger) {
  {
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [&] { return closed_ || queued_triggers_ < capacity_; });
    if (closed_) {
      throw util::ChannelClosed("trigger channel closed; dropping trigger for " + trigger.agent_id);
    }
    queue_.emplace_back(std::move(trigger));
    ++queued_triggers_;
    ++pending_;
  }
  not_empty_.notify_one();
}

void TriggerChannel::Post(ChannelTask task) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) {
      throw util::ChannelClosed("trigger channel closed; dropping task");
    }
    queue_.emplace_back(std::move(task));
    ++pending_;
  }
  not_empty_.notify_one();
}

std::optional<ChannelItem> TriggerChannel::Pop() {
  std::unique_lock lock(mutex_);

  not_empty_.wait(lock, [&] { return closed_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  ChannelItem item = std::move(queue_.front());
  queue_.pop_front();

  if (std::holds_alternative<Trigger>(item)) {
    --queued_triggers_;
    lock.unlock();
    not_full_.notify_one();
  }
  return item;
}

void TriggerChannel::TaskDone() {
  std::lock_guard lock(mutex_);
  if (pending_ > 0) --pending_;
}

void TriggerChannel::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

bool TriggerChannel::IsClosed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

std::size_t TriggerChannel::QueuedTriggers() const {
  std::lock_guard lock(mutex_);
  return queued_triggers_;
}

std::size_t TriggerChannel::Pending() const {
  std::lock_guard lock(mutex_);
  return pending_;
}

} // namespace reactor::events
