#include "internal/runner/swarm_tools.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/agents/swarm_registry.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/event_builders.hpp"
#include "internal/events/event_log.hpp"
#include "internal/subscriptions/subscription_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using reactor::agents::SwarmRegistry;
using reactor::db::memory::MemoryRepository;
using reactor::runner::SwarmTools;

reactor::v1::AgentIdentity Identity(const std::string& node_type, const std::string& file_path, const std::string& parent_id) {
  reactor::v1::AgentIdentity identity;
  identity.set_node_type(node_type);
  identity.set_file_path(file_path);
  identity.set_parent_id(parent_id);
  return identity;
}

struct Fixture {
  Fixture() {
    registry = std::make_shared<reactor::subscriptions::SubscriptionRegistry>(std::make_shared<MemoryRepository>());
    log      = std::make_shared<reactor::events::EventLog>(std::make_shared<MemoryRepository>(), registry,
                                                      std::make_shared<reactor::events::TriggerChannel>(64));
    swarm    = std::make_shared<SwarmRegistry>(std::make_shared<MemoryRepository>());

    Add("mod", Identity("module", "pkg/mod.py", ""));
    Add("cls", Identity("class", "pkg/mod.py", "mod"));
    Add("fn1", Identity("function", "pkg/mod.py", "cls"));
    Add("fn2", Identity("function", "pkg/mod.py", "cls"));
    Add("other", Identity("function", "lib/other_mod.py", ""));

    state.set_agent_id("fn1");
    *state.mutable_identity() = Identity("function", "pkg/mod.py", "cls");
  }

  void Add(const std::string& id, const reactor::v1::AgentIdentity& identity) {
    swarm->Upsert(reactor::agents::EntryFromIdentity(id, identity));
    registry->RegisterDefaults(id, identity.file_path());
  }

  SwarmTools Tools(const std::string& agent_id) {
    return SwarmTools(agent_id, "evt-9", "g", &state, log, registry, swarm);
  }

  std::shared_ptr<reactor::subscriptions::SubscriptionRegistry> registry;
  std::shared_ptr<reactor::events::EventLog>                    log;
  std::shared_ptr<SwarmRegistry>                                swarm;
  reactor::v1::AgentState                                       state;
};

void TestEmitCarriesTurnRouting() {
  Fixture f;
  auto    tools = f.Tools("fn1");

  auto id = tools.SendMessage("fn2", "hello", {"review"});

  auto replay = f.log->Replay();
  auto event  = replay.Next();
  assert(event && event->id() == id);
  assert(event->from_agent() == "fn1");
  assert(event->to_agent() == "fn2");
  assert(event->correlation_id() == "evt-9");
  assert(event->graph_id() == "g");
  assert(event->tags_size() == 1);
}

void TestEmitOverridesSenderButKeepsGraph() {
  Fixture f;
  auto    tools = f.Tools("fn1");

  auto event = reactor::events::ContentChangedEvent("pkg/mod.py");
  event.set_from_agent("someone-else");
  event.set_correlation_id("evt-1");
  event.set_graph_id("refactor");
  const auto id = tools.Emit(event);

  auto replay = f.log->Replay();
  auto stored = replay.Next();
  assert(stored && stored->id() == id);
  assert(stored->from_agent() == "fn1");
  assert(stored->correlation_id() == "evt-9");
  assert(stored->graph_id() == "refactor");
  assert(stored->has_content_changed());
}

void TestBroadcastTargets() {
  Fixture f;

  auto siblings = f.Tools("fn1").Broadcast("siblings", "hi");
  assert(siblings.size() == 1 && siblings[0] == "fn2");

  reactor::v1::AgentState cls_state;
  *cls_state.mutable_identity() = Identity("class", "pkg/mod.py", "mod");
  SwarmTools cls_tools("cls", "evt-9", "g", &cls_state, f.log, f.registry, f.swarm);

  auto children = cls_tools.Broadcast("children", "hi");
  std::sort(children.begin(), children.end());
  assert(children.size() == 2 && children[0] == "fn1" && children[1] == "fn2");

  auto by_file = f.Tools("fn1").Broadcast("file:mod.py", "hi");
  std::sort(by_file.begin(), by_file.end());
  assert(by_file.size() == 3);
  assert(std::find(by_file.begin(), by_file.end(), "other") == by_file.end());

  bool threw = false;
  try {
    f.Tools("fn1").Broadcast("everyone", "hi");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestSiblingsNeedAParent() {
  Fixture f;

  reactor::v1::AgentState orphan_state;
  SwarmTools              tools("mod", "evt-9", "g", &orphan_state, f.log, f.registry, f.swarm);

  bool threw = false;
  try {
    tools.Broadcast("siblings", "hi");
  } catch (const reactor::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestSubscribeAndUnsubscribeOwnOnly() {
  Fixture f;
  auto    tools = f.Tools("fn1");

  reactor::v1::SubscriptionPattern pattern;
  pattern.mutable_event_types()->add_values("FileSaved");

  auto subscription = tools.Subscribe(pattern);
  assert(f.state.custom_subscriptions_size() == 1);
  assert(f.state.custom_subscriptions(0).subscription_id() == subscription.id());

  auto others = f.registry->GetSubscriptions("fn2");
  bool threw  = false;
  try {
    tools.Unsubscribe(others[0].id());
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  assert(tools.Unsubscribe(subscription.id()));
  assert(f.state.custom_subscriptions_size() == 0);
  assert(!tools.Unsubscribe(subscription.id()));
}

void TestQueryAgentsByNodeType() {
  Fixture f;
  auto    tools = f.Tools("fn1");

  assert(tools.QueryAgents().size() == 5);
  assert(tools.QueryAgents("function").size() == 3);

  f.swarm->MarkOrphaned("other");
  assert(tools.QueryAgents("function").size() == 2);
}

} // namespace

int main() {
  TestEmitCarriesTurnRouting();
  TestEmitOverridesSenderButKeepsGraph();
  TestBroadcastTargets();
  TestSiblingsNeedAParent();
  TestSubscribeAndUnsubscribeOwnOnly();
  TestQueryAgentsByNodeType();

  std::cout << "agent_reactor_unit_swarm_tools: pass\n";
  return 0;
}
