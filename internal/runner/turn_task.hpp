#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "internal/events/trigger_channel.hpp"

namespace reactor::runner {

/*
  An admitted trigger waiting for a worker.
*/
struct TurnTask {
  events::Trigger trigger;

  std::string correlation_id;
  uint32_t    depth   = 0;
  bool        chained = false;

  std::chrono::steady_clock::time_point accepted_at;
};

} // namespace reactor::runner
