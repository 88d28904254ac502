#include "turn_queue.hpp"

namespace reactor::runner {

void TurnQueue::Enqueue(TurnTask task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
}

std::optional<TurnTask> TurnQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  TurnTask task = std::move(queue_.front());
  queue_.pop_front();
  return task;
}

std::vector<TurnTask> TurnQueue::Drain() {
  std::lock_guard lock(mutex_);

  std::vector<TurnTask> out(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
  queue_.clear();
  return out;
}

void TurnQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t TurnQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace reactor::runner
