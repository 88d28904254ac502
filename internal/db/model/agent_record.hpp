#pragma once

#include <cstdint>
#include <string>

namespace reactor::db::model {

inline constexpr const char* kAgentStatusActive   = "active";
inline constexpr const char* kAgentStatusOrphaned = "orphaned";

struct AgentRecord {
  std::string agent_id;
  std::string node_type;
  std::string name;
  std::string full_name;
  std::string file_path;
  std::string parent_id;
  uint32_t    start_line = 0;
  uint32_t    end_line   = 0;
  uint32_t    start_byte = 0;
  uint32_t    end_byte   = 0;
  std::string status     = kAgentStatusActive;
  uint64_t    created_at_ms = 0;
  uint64_t    updated_at_ms = 0;
};

} // namespace reactor::db::model
