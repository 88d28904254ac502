#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "turn_task.hpp"

namespace reactor::runner {

/*
  Unbounded FIFO between the dispatch loop and the worker pool.
  Admitted turns wait here for a free worker, never dropped.
*/
class TurnQueue {
 public:
  void Enqueue(TurnTask task);

  // blocking wait
  std::optional<TurnTask> Dequeue();

  // Removes every task no worker has taken yet.
  std::vector<TurnTask> Drain();

  void Shutdown();

  std::size_t Size() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<TurnTask>    queue_;
  bool                    shutdown_ = false;
};

} // namespace reactor::runner
