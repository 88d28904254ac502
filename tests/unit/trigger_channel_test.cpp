#include "internal/events/trigger_channel.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

using reactor::events::ChannelTask;
using reactor::events::Trigger;
using reactor::events::TriggerChannel;

Trigger MakeTrigger(const std::string& agent_id, uint64_t event_id) {
  Trigger trigger;
  trigger.agent_id = agent_id;
  trigger.event_id = event_id;
  trigger.event.set_id(event_id);
  return trigger;
}

void TestFifoAcrossTriggersAndTasks() {
  TriggerChannel channel(8);

  int ran = 0;
  channel.Push(MakeTrigger("a", 1));
  channel.Post([&] { ran = 1; });
  channel.Push(MakeTrigger("a", 2));
  assert(channel.Pending() == 3);
  assert(channel.QueuedTriggers() == 2);

  auto first = channel.Pop();
  assert(first && std::get<Trigger>(*first).event_id == 1);
  channel.TaskDone();

  auto second = channel.Pop();
  assert(second && std::holds_alternative<ChannelTask>(*second));
  std::get<ChannelTask>(*second)();
  assert(ran == 1);
  channel.TaskDone();

  auto third = channel.Pop();
  assert(third && std::get<Trigger>(*third).event_id == 2);
  channel.TaskDone();
  assert(channel.Pending() == 0);
}

void TestPushBlocksWhenFull() {
  TriggerChannel channel(1);
  channel.Push(MakeTrigger("a", 1));

  std::atomic<bool> pushed{false};
  std::thread       producer([&] {
    channel.Push(MakeTrigger("a", 2));
    pushed = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(!pushed);

  // tasks bypass the bound
  channel.Post([] {});

  auto item = channel.Pop();
  assert(item && std::get<Trigger>(*item).event_id == 1);

  producer.join();
  assert(pushed);
}

void TestCloseDrainsThenEnds() {
  TriggerChannel channel(4);
  channel.Push(MakeTrigger("a", 1));
  channel.Close();

  bool threw = false;
  try {
    channel.Push(MakeTrigger("a", 2));
  } catch (const reactor::util::ChannelClosed&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    channel.Post([] {});
  } catch (const reactor::util::ChannelClosed&) {
    threw = true;
  }
  assert(threw);

  assert(channel.Pop().has_value());
  assert(!channel.Pop().has_value());
}

void TestCloseWakesBlockedConsumer() {
  TriggerChannel channel(4);

  std::atomic<bool> ended{false};
  std::thread       consumer([&] {
    while (channel.Pop()) {
    }
    ended = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  channel.Close();
  consumer.join();
  assert(ended);
}

} // namespace

int main() {
  TestFifoAcrossTriggersAndTasks();
  TestPushBlocksWhenFull();
  TestCloseDrainsThenEnds();
  TestCloseWakesBlockedConsumer();

  std::cout << "agent_reactor_unit_trigger_channel: pass\n";
  return 0;
}
