#include "internal/subscriptions/subscription_registry.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/event_builders.hpp"

namespace {

using reactor::db::memory::MemoryRepository;
using reactor::subscriptions::SubscriptionRegistry;
using reactor::v1::SubscriptionPattern;

SubscriptionPattern TypePattern(const std::string& type) {
  SubscriptionPattern pattern;
  pattern.mutable_event_types()->add_values(type);
  return pattern;
}

void TestRegisterRejectsEmptyPattern() {
  SubscriptionRegistry registry(std::make_shared<MemoryRepository>());

  bool threw = false;
  try {
    registry.Register("a", SubscriptionPattern{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(registry.GetSubscriptions("a").empty());
}

void TestRegisterDefaultsIsIdempotent() {
  SubscriptionRegistry registry(std::make_shared<MemoryRepository>());

  auto first  = registry.RegisterDefaults("agent-x", "src/a.py");
  auto second = registry.RegisterDefaults("agent-x", "src/a.py");

  assert(first.size() == 2);
  assert(second.size() == 2);
  assert(first[0].id() == second[0].id());
  assert(first[1].id() == second[1].id());
  assert(registry.GetSubscriptions("agent-x").size() == 2);
  for (const auto& subscription : second) assert(subscription.is_default());
}

void TestRegisterDefaultsReplacesStaleFilePattern() {
  SubscriptionRegistry registry(std::make_shared<MemoryRepository>());

  registry.RegisterDefaults("agent-x", "src/a.py");
  auto custom = registry.Register("agent-x", TypePattern("FileSaved"));
  registry.RegisterDefaults("agent-x", "src/b.py");

  auto subscriptions = registry.GetSubscriptions("agent-x");
  assert(subscriptions.size() == 3);
  assert(subscriptions[0].id() == custom.id());

  auto on_a = registry.GetMatchingAgents(reactor::events::ContentChangedEvent("src/a.py"));
  auto on_b = registry.GetMatchingAgents(reactor::events::ContentChangedEvent("src/b.py"));
  assert(on_a.empty());
  assert(on_b.size() == 1 && on_b[0] == "agent-x");
}

void TestMatchingAgentsAreUniqueInSubscriptionOrder() {
  SubscriptionRegistry registry(std::make_shared<MemoryRepository>());

  registry.Register("b", TypePattern("ContentChanged"));
  registry.Register("a", TypePattern("ContentChanged"));
  registry.RegisterDefaults("b", "a.py");

  auto agents = registry.GetMatchingAgents(reactor::events::ContentChangedEvent("src/a.py"));
  assert(agents.size() == 2);
  assert(agents[0] == "b");
  assert(agents[1] == "a");
}

void TestDirectMessageDefault() {
  SubscriptionRegistry registry(std::make_shared<MemoryRepository>());
  registry.RegisterDefaults("y", "");

  assert(registry.GetSubscriptions("y").size() == 1);

  auto agents = registry.GetMatchingAgents(reactor::events::AgentMessageEvent("x", "y", "hello"));
  assert(agents.size() == 1 && agents[0] == "y");
  assert(registry.GetMatchingAgents(reactor::events::AgentMessageEvent("x", "z", "hello")).empty());
}

void TestUnregisterAndUnregisterAll() {
  SubscriptionRegistry registry(std::make_shared<MemoryRepository>());

  auto one = registry.Register("a", TypePattern("FileSaved"));
  registry.Register("a", TypePattern("ManualTrigger"));
  registry.Register("b", TypePattern("FileSaved"));

  assert(registry.Unregister(one.id()));
  assert(!registry.Unregister(one.id()));
  assert(!registry.GetSubscription(one.id()).has_value());

  assert(registry.UnregisterAll("a") == 1);
  assert(registry.GetSubscriptions("a").empty());

  auto agents = registry.GetMatchingAgents(reactor::events::FileSavedEvent("x.py"));
  assert(agents.size() == 1 && agents[0] == "b");
}

void TestPatternSurvivesStorage() {
  auto repository = std::make_shared<MemoryRepository>();

  SubscriptionPattern pattern;
  pattern.mutable_from_agents()->add_values("x");
  pattern.mutable_tags();
  pattern.set_path_glob("src/*.py");

  uint64_t id = 0;
  {
    SubscriptionRegistry registry(repository);
    id = registry.Register("a", pattern).id();
  }

  SubscriptionRegistry reopened(repository);
  auto                 loaded = reopened.GetSubscription(id);
  assert(loaded.has_value());
  assert(loaded->pattern().has_from_agents());
  assert(loaded->pattern().has_tags());
  assert(loaded->pattern().tags().values_size() == 0);
  assert(loaded->pattern().has_path_glob());
  assert(!loaded->pattern().has_to_agent());
  assert(!loaded->pattern().has_event_types());
}

} // namespace

int main() {
  TestRegisterRejectsEmptyPattern();
  TestRegisterDefaultsIsIdempotent();
  TestRegisterDefaultsReplacesStaleFilePattern();
  TestMatchingAgentsAreUniqueInSubscriptionOrder();
  TestDirectMessageDefault();
  TestUnregisterAndUnregisterAll();
  TestPatternSurvivesStorage();

  std::cout << "agent_reactor_unit_subscription_registry: pass\n";
  return 0;
}
