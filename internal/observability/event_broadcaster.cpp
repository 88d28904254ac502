#include "event_broadcaster.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace reactor::observability {

EventStream::EventStream(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {
}

std::optional<reactor::v1::Event> EventStream::Next(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  cv_.wait_for(lock, timeout, [&] { return closed_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  auto event = std::move(queue_.front());
  queue_.pop_front();
  return event;
}

bool EventStream::Closed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

std::uint64_t EventStream::Dropped() const {
  std::lock_guard lock(mutex_);
  return dropped_;
}

void EventStream::Offer(const reactor::v1::Event& event) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) return;
    if (queue_.size() >= capacity_) {
      queue_.pop_front();
      ++dropped_;
    }
    queue_.push_back(event);
  }
  cv_.notify_one();
}

void EventStream::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

EventBroadcaster::EventBroadcaster(std::size_t stream_capacity) : stream_capacity_(stream_capacity) {
}

EventBroadcaster::~EventBroadcaster() {
  Close();
}

void EventBroadcaster::Open() {
  std::lock_guard lock(mutex_);
  open_ = true;
}

void EventBroadcaster::Close() {
  std::vector<std::shared_ptr<EventStream>> streams;
  {
    std::lock_guard lock(mutex_);
    open_ = false;
    streams.swap(streams_);
  }
  for (auto& stream : streams) stream->Close();
}

bool EventBroadcaster::IsOpen() const {
  std::lock_guard lock(mutex_);
  return open_;
}

std::shared_ptr<EventStream> EventBroadcaster::Subscribe() {
  std::lock_guard lock(mutex_);
  if (!open_) {
    throw util::InvalidState("event broadcaster is not open");
  }
  auto stream = std::make_shared<EventStream>(stream_capacity_);
  streams_.push_back(stream);
  return stream;
}

void EventBroadcaster::Unsubscribe(const std::shared_ptr<EventStream>& stream) {
  {
    std::lock_guard lock(mutex_);
    streams_.erase(std::remove(streams_.begin(), streams_.end(), stream), streams_.end());
  }
  if (stream) stream->Close();
}

std::size_t EventBroadcaster::SubscriberCount() const {
  std::lock_guard lock(mutex_);
  return streams_.size();
}

std::uint64_t EventBroadcaster::Published() const {
  std::lock_guard lock(mutex_);
  return published_;
}

void EventBroadcaster::Publish(const reactor::v1::Event& event) {
  std::vector<std::shared_ptr<EventStream>> streams;
  {
    std::lock_guard lock(mutex_);
    if (!open_) return;
    ++published_;
    streams = streams_;
  }
  for (auto& stream : streams) stream->Offer(event);
}

} // namespace reactor::observability
