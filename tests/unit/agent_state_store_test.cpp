#include "internal/agents/agent_state_store.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace {

using reactor::agents::AgentLayout;
using reactor::agents::AgentStateStore;

std::filesystem::path FreshRoot(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "agent_reactor_state_store_tests" / name;
  std::filesystem::remove_all(root);
  return root;
}

template <typename Fn>
bool ThrowsInvalidArgument(Fn&& fn) {
  try {
    fn();
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void TestLayoutPaths() {
  AgentLayout layout("/srv/reactor");
  assert(layout.AgentDir("fn_parse") == std::filesystem::path("/srv/reactor/agents/fn/fn_parse"));
  assert(layout.StatePath("fn_parse") == std::filesystem::path("/srv/reactor/agents/fn/fn_parse/state.jsonl"));
  assert(layout.WorkspacePath("fn_parse") == std::filesystem::path("/srv/reactor/workspaces/fn_parse.db"));

  // one-character ids shard under themselves
  assert(layout.AgentDir("x") == std::filesystem::path("/srv/reactor/agents/x/x"));

  assert(ThrowsInvalidArgument([&] { (void)layout.AgentDir(""); }));
  assert(ThrowsInvalidArgument([&] { (void)layout.StatePath("../escape"); }));
  assert(ThrowsInvalidArgument([&] { (void)layout.WorkspacePath(".."); }));
}

void TestSaveAppendsAndLoadReturnsLatest() {
  const auto      root = FreshRoot("latest");
  AgentStateStore store{AgentLayout(root)};

  assert(!store.Exists("agent-a"));
  assert(!store.Load("agent-a").has_value());

  reactor::v1::AgentState state;
  state.set_agent_id("agent-a");
  state.mutable_identity()->set_file_path("src/a.py");
  store.Save(state);
  assert(state.has_last_updated());

  state.set_turn_count(3);
  state.set_last_error("boom");
  store.Save(state);

  assert(store.Exists("agent-a"));
  auto loaded = store.Load("agent-a");
  assert(loaded && loaded->turn_count() == 3 && loaded->last_error() == "boom");
  assert(loaded->identity().file_path() == "src/a.py");

  std::ifstream in(store.Layout().StatePath("agent-a"));
  int           lines = 0;
  for (std::string line; std::getline(in, line);) lines += line.empty() ? 0 : 1;
  assert(lines == 2);
}

void TestTornLastLineFallsBackToPreviousState() {
  const auto      root = FreshRoot("torn");
  AgentStateStore store{AgentLayout(root)};

  reactor::v1::AgentState state;
  state.set_agent_id("agent-b");
  state.set_turn_count(4);
  store.Save(state);

  {
    // a crash in the middle of the next append
    std::ofstream out(store.Layout().StatePath("agent-b"), std::ios::app);
    out << "{\"agentId\":\"agent-b\",\"turnC";
  }

  auto loaded = store.Load("agent-b");
  assert(loaded && loaded->turn_count() == 4);

  // the next save starts on a fresh line and becomes the latest state
  loaded->set_turn_count(5);
  store.Save(*loaded);
  auto after = store.Load("agent-b");
  assert(after && after->turn_count() == 5);

  std::ifstream in(store.Layout().StatePath("agent-b"));
  std::string   line;
  int           lines = 0;
  while (std::getline(in, line)) ++lines;
  assert(lines == 3);
}

void TestFileWithoutAnyValidLineIsAPersistenceError() {
  const auto      root = FreshRoot("corrupt");
  AgentStateStore store{AgentLayout(root)};

  std::filesystem::create_directories(store.Layout().AgentDir("agent-c"));
  {
    std::ofstream out(store.Layout().StatePath("agent-c"));
    out << "{not json\n";
  }

  bool threw = false;
  try {
    (void)store.Load("agent-c");
  } catch (const reactor::util::PersistenceError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestLayoutPaths();
  TestSaveAppendsAndLoadReturnsLatest();
  TestTornLastLineFallsBackToPreviousState();
  TestFileWithoutAnyValidLineIsAPersistenceError();

  std::cout << "agent_reactor_unit_agent_state_store: pass\n";
  return 0;
}
