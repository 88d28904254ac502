#pragma once

#include <cstdint>
#include <string>

namespace reactor::db::model {

struct SubscriptionRecord {
  uint64_t    id = 0;
  std::string agent_id;
  std::string pattern_json;
  bool        is_default    = false;
  uint64_t    created_at_ms = 0;
  uint64_t    updated_at_ms = 0;
};

} // namespace reactor::db::model
