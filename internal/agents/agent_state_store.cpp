#include "agent_state_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <filesystem>
#include <fstream>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace reactor::agents {

using observability::StringField;
using observability::UIntField;

AgentStateStore::AgentStateStore(AgentLayout layout) : layout_(std::move(layout)) {
}

namespace {

bool ParseStateLine(const std::string& line, reactor::v1::AgentState* state, std::string* error) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status                   = google::protobuf::util::JsonStringToMessage(line, state, options);
  if (!status.ok()) *error = std::string(status.message());
  return status.ok();
}

// True when the file is non-empty and its last byte is not '\n', i.e. the
// previous append was cut short.
bool EndsMidLine(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary | std::ios::ate);
  if (!in || in.tellg() <= 0) return false;
  in.seekg(-1, std::ios::end);
  char last = '\n';
  in.get(last);
  return last != '\n';
}

} // namespace

/*
  Walks back from the newest line to the newest one that parses. Lines
  after it (a torn append, garbage) are skipped with a warning. Only a
  file with no parseable line at all is a PersistenceError.
*/
std::optional<reactor::v1::AgentState> AgentStateStore::Load(const std::string& agent_id) const {
  const auto path = layout_.StatePath(agent_id);

  std::lock_guard lock(mutex_);
  std::ifstream   in(path);
  if (!in) return std::nullopt;

  std::vector<std::string> lines;
  for (std::string line; std::getline(in, line);) {
    if (!line.empty()) lines.push_back(std::move(line));
  }
  if (lines.empty()) return std::nullopt;

  std::string error;
  for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
    reactor::v1::AgentState state;
    if (ParseStateLine(*it, &state, &error)) return state;

    REACTOR_LOG_WARN("skipping unreadable agent state line",
                     {StringField("agent_id", agent_id), UIntField("line", static_cast<uint64_t>(lines.rend() - it)), StringField("error", error)});
  }
  throw util::PersistenceError("corrupt agent state " + path.string() + ": " + error);
}

void AgentStateStore::Save(reactor::v1::AgentState& state) {
  *state.mutable_last_updated() = util::NowTimestamp();

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(state, &json);
  if (!status.ok()) {
    throw util::PersistenceError("encode agent state: " + std::string(status.message()));
  }

  std::lock_guard lock(mutex_);
  const auto      path = layout_.EnsureAgentDir(state.agent_id()) / "state.jsonl";
  const bool      torn = EndsMidLine(path);

  std::ofstream out(path, std::ios::app);
  if (torn) out << '\n';
  out << json << '\n';
  out.flush();
  if (!out) {
    throw util::PersistenceError("write agent state " + path.string());
  }
}

bool AgentStateStore::Exists(const std::string& agent_id) const {
  std::lock_guard lock(mutex_);
  return std::filesystem::exists(layout_.StatePath(agent_id));
}

} // namespace reactor::agents
