#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace reactor::db::model {

/*
  Row of the events table. payload_json holds the event body;
  routing fields live in their own columns so they can be indexed.
*/
struct EventRecord {
  uint64_t    id = 0;
  std::string graph_id;
  std::string event_type;
  std::string payload_json;
  std::string from_agent;
  std::string to_agent;
  std::string correlation_id;
  std::string tags_json = "[]";
  uint64_t    created_at_ms = 0;
};

// Replay page selector. Rows with from_id <= id <= upper_id in id order;
// upper_id 0 leaves the range open.
struct EventFilter {
  uint64_t                   from_id  = 1;
  uint64_t                   upper_id = 0;
  std::optional<std::string> graph_id;
  std::vector<std::string>   event_types;
  std::optional<uint64_t>    since_ms;
  std::optional<uint64_t>    until_ms;
  uint64_t                   limit = 256;
};

struct GraphSummaryRecord {
  std::string graph_id;
  uint64_t    first_event_ms = 0;
  uint64_t    last_event_ms  = 0;
  uint64_t    event_count    = 0;
};

} // namespace reactor::db::model
