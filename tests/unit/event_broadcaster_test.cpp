#include "internal/observability/event_broadcaster.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using reactor::observability::EventBroadcaster;

reactor::v1::Event Numbered(uint64_t id) {
  reactor::v1::Event event;
  event.set_id(id);
  event.mutable_file_saved()->set_path("a.py");
  return event;
}

void TestPublishOutsideOpenWindowIsNoop() {
  EventBroadcaster broadcaster(4);
  broadcaster.Publish(Numbered(1));
  assert(broadcaster.Published() == 0);

  bool threw = false;
  try {
    broadcaster.Subscribe();
  } catch (const reactor::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestEverySubscriberSeesEveryEvent() {
  EventBroadcaster broadcaster(8);
  broadcaster.Open();

  auto a = broadcaster.Subscribe();
  auto b = broadcaster.Subscribe();
  assert(broadcaster.SubscriberCount() == 2);

  for (uint64_t i = 1; i <= 3; ++i) broadcaster.Publish(Numbered(i));

  for (auto& stream : {a, b}) {
    for (uint64_t i = 1; i <= 3; ++i) {
      auto event = stream->Next(100ms);
      assert(event && event->id() == i);
    }
    assert(!stream->Next(10ms).has_value());
  }
}

void TestFullStreamDropsOldest() {
  EventBroadcaster broadcaster(2);
  broadcaster.Open();
  auto stream = broadcaster.Subscribe();

  for (uint64_t i = 1; i <= 5; ++i) broadcaster.Publish(Numbered(i));

  assert(stream->Dropped() == 3);
  assert(stream->Next(10ms)->id() == 4);
  assert(stream->Next(10ms)->id() == 5);
}

void TestCloseEndsStreams() {
  EventBroadcaster broadcaster(4);
  broadcaster.Open();
  auto stream = broadcaster.Subscribe();
  broadcaster.Publish(Numbered(1));

  std::thread closer([&] {
    std::this_thread::sleep_for(20ms);
    broadcaster.Close();
  });

  assert(stream->Next(100ms)->id() == 1);
  assert(!stream->Next(2s).has_value());
  closer.join();

  assert(stream->Closed());
  assert(!broadcaster.IsOpen());
  assert(broadcaster.SubscriberCount() == 0);
}

void TestUnsubscribe() {
  EventBroadcaster broadcaster(4);
  broadcaster.Open();
  auto stream = broadcaster.Subscribe();
  broadcaster.Unsubscribe(stream);

  broadcaster.Publish(Numbered(1));
  assert(broadcaster.SubscriberCount() == 0);
  assert(stream->Closed());
  assert(!stream->Next(10ms).has_value());
}

} // namespace

int main() {
  TestPublishOutsideOpenWindowIsNoop();
  TestEverySubscriberSeesEveryEvent();
  TestFullStreamDropsOldest();
  TestCloseEndsStreams();
  TestUnsubscribe();

  std::cout << "agent_reactor_unit_event_broadcaster: pass\n";
  return 0;
}
