#include "internal/agents/reconciler.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>

#include "internal/agents/agent_state_store.hpp"
#include "internal/agents/swarm_registry.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/event_log.hpp"
#include "internal/subscriptions/subscription_registry.hpp"

namespace {

using reactor::agents::AgentLayout;
using reactor::agents::AgentStateStore;
using reactor::agents::Reconciler;
using reactor::agents::SwarmRegistry;
using reactor::db::memory::MemoryRepository;
using reactor::v1::DiscoveredUnit;

DiscoveredUnit Unit(const std::string& id, const std::string& file_path, uint32_t start_line = 1) {
  DiscoveredUnit unit;
  unit.set_id(id);
  auto* identity = unit.mutable_identity();
  identity->set_node_type("function");
  identity->set_name(id);
  identity->set_full_name("pkg." + id);
  identity->set_file_path(file_path);
  identity->mutable_range()->set_start_line(start_line);
  identity->mutable_range()->set_end_line(start_line + 10);
  return unit;
}

struct Fixture {
  explicit Fixture(const std::string& name) : root(std::filesystem::temp_directory_path() / "agent_reactor_reconciler_tests" / name) {
    std::filesystem::remove_all(root);

    events        = std::make_shared<MemoryRepository>();
    registry      = std::make_shared<reactor::subscriptions::SubscriptionRegistry>(std::make_shared<MemoryRepository>());
    log           = std::make_shared<reactor::events::EventLog>(events, registry, std::make_shared<reactor::events::TriggerChannel>(64));
    states        = std::make_shared<AgentStateStore>(AgentLayout(root));
    swarm         = std::make_shared<SwarmRegistry>(std::make_shared<MemoryRepository>());
    reconciler    = std::make_shared<Reconciler>(swarm, states, registry, log, "swarm-1");
  }

  std::filesystem::path                                         root;
  std::shared_ptr<MemoryRepository>                             events;
  std::shared_ptr<reactor::subscriptions::SubscriptionRegistry> registry;
  std::shared_ptr<reactor::events::EventLog>                    log;
  std::shared_ptr<AgentStateStore>                              states;
  std::shared_ptr<SwarmRegistry>                                swarm;
  std::shared_ptr<Reconciler>                                   reconciler;
};

void TestNewUnitsAreCreated() {
  Fixture f("created");

  auto summary = f.reconciler->Reconcile({Unit("aa1", "src/a.py"), Unit("bb2", "src/b.py")});
  assert(summary.created == 2);
  assert(summary.total == 2);

  assert(std::filesystem::exists(f.root / "agents" / "aa" / "aa1" / "state.jsonl"));
  assert(f.states->Load("aa1")->identity().file_path() == "src/a.py");
  assert(f.registry->GetSubscriptions("aa1").size() == 2);

  auto entry = f.swarm->Get("bb2");
  assert(entry && entry->status() == reactor::v1::AGENT_STATUS_ACTIVE);
  assert(f.log->LastEventId() == 0);
}

void TestSecondRunWritesNothing() {
  Fixture f("idempotent");
  f.reconciler->Reconcile({Unit("aa1", "src/a.py")});

  const auto state_size = std::filesystem::file_size(f.states->Layout().StatePath("aa1"));
  const auto updated_at = f.swarm->Get("aa1")->updated_at().seconds();
  const auto sub_ids    = f.registry->GetSubscriptions("aa1");

  auto summary = f.reconciler->Reconcile({Unit("aa1", "src/a.py")});
  assert(summary.unchanged == 1);
  assert(summary.created == 0 && summary.updated == 0 && summary.orphaned == 0);

  assert(std::filesystem::file_size(f.states->Layout().StatePath("aa1")) == state_size);
  assert(f.swarm->Get("aa1")->updated_at().seconds() == updated_at);
  assert(f.registry->GetSubscriptions("aa1")[0].id() == sub_ids[0].id());
  assert(f.log->LastEventId() == 0);
}

void TestUnitWithoutRangeIsStableAcrossRuns() {
  Fixture f("no_range");

  DiscoveredUnit unit;
  unit.set_id("mod_x");
  unit.mutable_identity()->set_node_type("module");
  unit.mutable_identity()->set_file_path("src/a.py");
  f.reconciler->Reconcile({unit});

  const auto state_size = std::filesystem::file_size(f.states->Layout().StatePath("mod_x"));
  assert(!f.swarm->Get("mod_x")->identity().has_range());

  auto summary = f.reconciler->Reconcile({unit});
  assert(summary.unchanged == 1 && summary.updated == 0);
  assert(f.log->LastEventId() == 0);
  assert(std::filesystem::file_size(f.states->Layout().StatePath("mod_x")) == state_size);

  // an explicit all-zero range is the same identity
  unit.mutable_identity()->mutable_range();
  assert(f.reconciler->Reconcile({unit}).unchanged == 1);
  assert(f.log->LastEventId() == 0);
}

void TestMissingUnitIsOrphanedAndRestored() {
  Fixture f("orphan");
  f.reconciler->Reconcile({Unit("aa1", "src/a.py"), Unit("bb2", "src/b.py")});

  auto state = *f.states->Load("aa1");
  auto* entry = state.add_chat_history();
  entry->set_role("user");
  entry->set_content("remember me");
  f.states->Save(state);

  auto gone = f.reconciler->Reconcile({Unit("bb2", "src/b.py")});
  assert(gone.orphaned == 1);
  assert(f.swarm->Get("aa1")->status() == reactor::v1::AGENT_STATUS_ORPHANED);
  assert(f.registry->GetSubscriptions("aa1").empty());

  // an orphan stays orphaned while absent
  assert(f.reconciler->Reconcile({Unit("bb2", "src/b.py")}).orphaned == 0);

  auto back = f.reconciler->Reconcile({Unit("aa1", "src/a.py"), Unit("bb2", "src/b.py")});
  assert(back.restored == 1);
  assert(f.swarm->Get("aa1")->status() == reactor::v1::AGENT_STATUS_ACTIVE);
  assert(f.registry->GetSubscriptions("aa1").size() == 2);

  auto restored = f.states->Load("aa1");
  assert(restored->chat_history_size() == 1);
  assert(restored->chat_history(0).content() == "remember me");
}

void TestIdentityChangeUpdatesAndAnnounces() {
  Fixture f("updated");
  f.reconciler->Reconcile({Unit("aa1", "src/a.py"), Unit("bb2", "src/a.py")});

  auto summary = f.reconciler->Reconcile({Unit("aa1", "src/moved.py"), Unit("bb2", "src/moved.py", 40)});
  assert(summary.updated == 2);

  assert(f.swarm->Get("aa1")->identity().file_path() == "src/moved.py");
  assert(f.states->Load("bb2")->identity().range().start_line() == 40);

  // one ContentChanged per distinct changed file, appended through the log
  assert(f.log->LastEventId() == 1);
  auto replay = f.log->Replay();
  auto event  = replay.Next();
  assert(event && event->has_content_changed());
  assert(event->content_changed().path() == "src/moved.py");
  assert(event->graph_id() == "swarm-1");

  auto matched = f.registry->GetMatchingAgents(*event);
  assert(matched.size() == 2);
  assert(f.log->Triggers().QueuedTriggers() == 2);
}

void TestDuplicateUnitIsRejected() {
  Fixture f("duplicate");

  bool threw = false;
  try {
    f.reconciler->Reconcile({Unit("aa1", "a.py"), Unit("aa1", "b.py")});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestNewUnitsAreCreated();
  TestSecondRunWritesNothing();
  TestUnitWithoutRangeIsStableAcrossRuns();
  TestMissingUnitIsOrphanedAndRestored();
  TestIdentityChangeUpdatesAndAnnounces();
  TestDuplicateUnitIsRejected();

  std::cout << "agent_reactor_unit_reconciler: pass\n";
  return 0;
}
