#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "reactor/v1.hpp"

namespace reactor::events {

// Producer-side constructors. Ids and timestamps are set by EventLog::Append.

reactor::v1::Event ContentChangedEvent(const std::string& path, const std::string& diff = {});
reactor::v1::Event FileSavedEvent(const std::string& path);
reactor::v1::Event AgentMessageEvent(const std::string& from_agent, const std::string& to_agent, const std::string& content,
                                     const std::vector<std::string>& tags = {});
reactor::v1::Event ManualTriggerEvent(const std::string& to_agent, const std::string& reason);

// Turn lifecycle, emitted by the runner with from_agent set to the agent.
reactor::v1::Event AgentStartEvent(const std::string& agent_id, const std::string& node_type);
reactor::v1::Event AgentCompleteEvent(const std::string& agent_id, const std::string& summary, const std::string& response,
                                      const std::vector<std::string>& changed_artifacts);
reactor::v1::Event AgentErrorEvent(const std::string& agent_id, const std::string& error);

reactor::v1::Event TriggerDecisionEvent(const std::string& agent_id, uint64_t trigger_event_id, reactor::v1::TriggerOutcome outcome,
                                        uint32_t depth, const std::string& correlation_id, const std::string& detail = {});

} // namespace reactor::events
