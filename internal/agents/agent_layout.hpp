#pragma once

#include <filesystem>
#include <string>

namespace reactor::agents {

// Throws util::InvalidArgument for ids that are empty or not a single path component.
void ValidateAgentId(const std::string& agent_id);

/*
  On-disk layout under the storage root:

    agents/<first two chars of id>/<id>/state.jsonl
    workspaces/<id>.db
*/
class AgentLayout {
 public:
  explicit AgentLayout(std::filesystem::path root);

  const std::filesystem::path& Root() const {
    return root_;
  }

  std::filesystem::path AgentDir(const std::string& agent_id) const;
  std::filesystem::path StatePath(const std::string& agent_id) const;
  std::filesystem::path WorkspacePath(const std::string& agent_id) const;

  // Creates AgentDir and returns it.
  std::filesystem::path EnsureAgentDir(const std::string& agent_id) const;

 private:
  std::filesystem::path root_;
};

} // namespace reactor::agents
