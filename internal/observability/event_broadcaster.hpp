#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "internal/observability/event_observer.hpp"
#include "reactor/v1.hpp"

namespace reactor::observability {

/*
  One subscriber's view of the broadcast. Bounded; when full the
  oldest event is dropped so a slow reader never stalls publishers.
*/
class EventStream {
 public:
  explicit EventStream(std::size_t capacity);

  // Waits up to timeout. nullopt on timeout, or once closed and drained.
  std::optional<reactor::v1::Event> Next(std::chrono::milliseconds timeout);

  bool          Closed() const;
  std::uint64_t Dropped() const;

 private:
  friend class EventBroadcaster;

  void Offer(const reactor::v1::Event& event);
  void Close();

  mutable std::mutex             mutex_;
  std::condition_variable        cv_;
  std::deque<reactor::v1::Event> queue_;
  std::size_t                    capacity_;
  std::uint64_t                  dropped_ = 0;
  bool                           closed_  = false;
};

/*
  Observer fan-out. Owned by the entry point, which opens it before
  the runtime starts and closes it after the runtime stops. Publish
  outside the open window is a no-op.
*/
class EventBroadcaster final : public EventObserver {
 public:
  explicit EventBroadcaster(std::size_t stream_capacity = 256);
  ~EventBroadcaster() override;

  void Open();
  void Close();
  bool IsOpen() const;

  std::shared_ptr<EventStream> Subscribe();
  void                         Unsubscribe(const std::shared_ptr<EventStream>& stream);

  std::size_t   SubscriberCount() const;
  std::uint64_t Published() const;

  void Publish(const reactor::v1::Event& event) override;

 private:
  mutable std::mutex                        mutex_;
  std::vector<std::shared_ptr<EventStream>> streams_;
  std::size_t                               stream_capacity_;
  std::uint64_t                             published_ = 0;
  bool                                      open_      = false;
};

} // namespace reactor::observability
