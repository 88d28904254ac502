#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <atomic>

#include "internal/agents/discovery_source.hpp"
#include "internal/events/event_builders.hpp"
#include "internal/factory.hpp"
#include "internal/runner/agent_executor.hpp"
#include "internal/runner/swarm_tools.hpp"

namespace {

using namespace std::chrono_literals;
using reactor::runner::ExecutionContext;
using reactor::runner::TurnResult;

struct TurnRecord {
  std::string agent_id;
  uint64_t    trigger_id = 0;
  std::string from_agent;
  std::string correlation_id;
  uint32_t    depth = 0;
};

// x forwards every change to y, y always answers x.
class PingPongExecutor : public reactor::runner::AgentExecutor {
 public:
  TurnResult RunTurn(ExecutionContext& ctx) override {
    {
      std::lock_guard lock(mutex_);
      turns_.push_back(TurnRecord{ctx.agent_id, ctx.trigger.id(), ctx.trigger.from_agent(), ctx.correlation_id, ctx.depth});
    }

    TurnResult result;
    if (ctx.agent_id == "x") {
      ctx.tools->SendMessage("y", "a.py changed, please re-check");
      result.summary = "forwarded";
    } else {
      ctx.tools->SendMessage("x", "checked");
      result.summary = "answered";
    }
    return result;
  }

  std::vector<TurnRecord> Turns() const {
    std::lock_guard lock(mutex_);
    return turns_;
  }

 private:
  mutable std::mutex      mutex_;
  std::vector<TurnRecord> turns_;
};

class RecordingObserver : public reactor::observability::EventObserver {
 public:
  void Publish(const reactor::v1::Event& event) override {
    std::lock_guard lock(mutex_);
    if (event.has_trigger_decision()) decisions_.push_back(event.trigger_decision());
  }

  std::vector<reactor::v1::TriggerDecision> Decisions(reactor::v1::TriggerOutcome outcome) const {
    std::lock_guard                           lock(mutex_);
    std::vector<reactor::v1::TriggerDecision> out;
    for (const auto& d : decisions_) {
      if (d.outcome() == outcome) out.push_back(d);
    }
    return out;
  }

 private:
  mutable std::mutex                        mutex_;
  std::vector<reactor::v1::TriggerDecision> decisions_;
};

reactor::v1::DiscoveredUnit Unit(const std::string& id, const std::string& file_path) {
  reactor::v1::DiscoveredUnit unit;
  unit.set_id(id);
  unit.mutable_identity()->set_node_type("function");
  unit.mutable_identity()->set_name(id);
  unit.mutable_identity()->set_full_name("mod." + id);
  unit.mutable_identity()->set_file_path(file_path);
  return unit;
}

reactor::runtime::config::RuntimeConfig Config(const std::filesystem::path& root, uint32_t max_depth) {
  reactor::runtime::config::RuntimeConfig config;
  config.mutable_storage()->set_root(root.string());
  config.mutable_storage()->mutable_sqlite();
  config.mutable_runner()->set_max_concurrency(2);
  config.mutable_runner()->set_max_trigger_depth(max_depth);
  config.mutable_runner()->set_trigger_cooldown_ms(0);
  config.mutable_runner()->set_swarm_id("e2e");
  return config;
}

std::filesystem::path FreshRoot(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "agent_reactor_e2e" / name;
  std::filesystem::remove_all(root);
  return root;
}

void TestCascadeStopsAtDepthLimit() {
  const auto root     = FreshRoot("depth_one");
  auto       executor = std::make_shared<PingPongExecutor>();
  auto       observer = std::make_shared<RecordingObserver>();

  auto runtime = reactor::factory::Build(Config(root, 1), executor, observer);
  runtime.reconciler->Reconcile({Unit("x", "a.py"), Unit("y", "b.py")});
  runtime.runner->Start();

  const auto root_id = runtime.log->Append(reactor::events::ContentChangedEvent("a.py"));
  assert(runtime.runner->WaitForIdle(10s));

  const auto turns = executor->Turns();
  assert(turns.size() == 2);

  assert(turns[0].agent_id == "x");
  assert(turns[0].trigger_id == root_id);
  assert(turns[0].depth == 0);
  assert(turns[0].correlation_id == "evt-" + std::to_string(root_id));

  assert(turns[1].agent_id == "y");
  assert(turns[1].from_agent == "x");
  assert(turns[1].depth == 1);
  assert(turns[1].correlation_id == turns[0].correlation_id);

  const auto skipped = observer->Decisions(reactor::v1::TRIGGER_OUTCOME_SKIPPED_DEPTH);
  assert(skipped.size() == 1);
  assert(skipped[0].agent_id() == "x");
  assert(skipped[0].correlation_id() == turns[0].correlation_id);

  assert(observer->Decisions(reactor::v1::TRIGGER_OUTCOME_COMPLETED).size() == 2);

  const auto stats = runtime.runner->Stats();
  assert(stats.accepted == 2);
  assert(stats.completed == 2);
  assert(stats.skipped_depth == 1);

  // Both replies are in the log even though only one was acted on.
  std::map<std::string, int> messages_from;
  reactor::events::ReplayQuery query;
  query.event_types = {"AgentMessage"};
  auto replay       = runtime.log->Replay(query);
  while (auto event = replay.Next()) {
    assert(event->correlation_id() == turns[0].correlation_id);
    messages_from[event->from_agent()]++;
  }
  assert(messages_from["x"] == 1);
  assert(messages_from["y"] == 1);

  auto x_state = runtime.states->Load("x");
  assert(x_state && x_state->turn_count() == 1);
  assert(x_state->last_event_id() == root_id);
  auto y_state = runtime.states->Load("y");
  assert(y_state && y_state->turn_count() == 1);

  runtime.Shutdown();
  assert(runtime.log->IsClosed());
}

void TestStoresSurviveRestart() {
  const auto root = FreshRoot("restart");
  uint64_t   last = 0;

  {
    auto runtime = reactor::factory::Build(Config(root, 1), std::make_shared<PingPongExecutor>());
    runtime.reconciler->Reconcile({Unit("x", "a.py"), Unit("y", "b.py")});
    runtime.runner->Start();
    runtime.log->Append(reactor::events::ContentChangedEvent("a.py"));
    assert(runtime.runner->WaitForIdle(10s));
    last = runtime.log->LastEventId();
    runtime.Shutdown();
  }

  assert(std::filesystem::exists(root / "events.db"));
  assert(std::filesystem::exists(root / "subscriptions.db"));
  assert(std::filesystem::exists(root / "swarm.db"));

  auto runtime = reactor::factory::Build(Config(root, 1), std::make_shared<PingPongExecutor>());
  assert(runtime.log->LastEventId() == last);
  assert(runtime.swarm->List().size() == 2);

  // a second reconcile of the same units changes nothing
  const auto summary = runtime.reconciler->Reconcile({Unit("x", "a.py"), Unit("y", "b.py")});
  assert(summary.unchanged == 2);
  assert(summary.created == 0);
  assert(runtime.log->LastEventId() == last);

  assert(runtime.log->Append(reactor::events::ManualTriggerEvent("x", "after restart")) == last + 1);
  runtime.Shutdown();
}

class CountingExecutor : public reactor::runner::AgentExecutor {
 public:
  TurnResult RunTurn(ExecutionContext&) override {
    ++turns;
    return {};
  }

  std::atomic<int> turns{0};
};

// Every moved unit announces its new file while reconciling. With a
// one-slot trigger channel this only finishes if the runner is already
// draining it.
void TestStartupReconcileWithFullTriggerChannel() {
  const auto root   = FreshRoot("startup_reconcile");
  auto       config = Config(root, 1);
  config.mutable_runner()->set_trigger_queue_capacity(1);

  {
    auto runtime = reactor::factory::Build(config, std::make_shared<CountingExecutor>());
    reactor::agents::StaticDiscovery discovery({Unit("p", "p.py"), Unit("q", "q.py"), Unit("r", "r.py")});
    auto summary = runtime.Start(&discovery);
    assert(summary && summary->created == 3);
    runtime.Shutdown();
  }

  auto executor = std::make_shared<CountingExecutor>();
  auto runtime  = reactor::factory::Build(config, executor);
  reactor::agents::StaticDiscovery moved({Unit("p", "p2.py"), Unit("q", "q2.py"), Unit("r", "r2.py")});

  auto summary = runtime.Start(&moved);
  assert(summary && summary->updated == 3);
  assert(runtime.runner->WaitForIdle(10s));
  assert(executor->turns == 3);

  // without discovery nothing is reconciled and the stored swarm stays
  runtime.Shutdown();
  auto again = reactor::factory::Build(config, executor);
  assert(!again.Start(nullptr).has_value());
  assert(again.swarm->List(reactor::v1::AGENT_STATUS_ACTIVE).size() == 3);
  again.Shutdown();
}

} // namespace

int main() {
  TestCascadeStopsAtDepthLimit();
  TestStoresSurviveRestart();
  TestStartupReconcileWithFullTriggerChannel();

  std::cout << "agent_reactor_integration_cascade_end_to_end: pass\n";
  return 0;
}
