#include "event_builders.hpp"

namespace reactor::events {

reactor::v1::Event ContentChangedEvent(const std::string& path, const std::string& diff) {
  reactor::v1::Event event;
  event.mutable_content_changed()->set_path(path);
  event.mutable_content_changed()->set_diff(diff);
  return event;
}

reactor::v1::Event FileSavedEvent(const std::string& path) {
  reactor::v1::Event event;
  event.mutable_file_saved()->set_path(path);
  return event;
}

reactor::v1::Event AgentMessageEvent(const std::string& from_agent, const std::string& to_agent, const std::string& content,
                                     const std::vector<std::string>& tags) {
  reactor::v1::Event event;
  event.set_from_agent(from_agent);
  event.set_to_agent(to_agent);
  event.mutable_agent_message()->set_content(content);
  for (const auto& tag : tags) event.add_tags(tag);
  return event;
}

reactor::v1::Event ManualTriggerEvent(const std::string& to_agent, const std::string& reason) {
  reactor::v1::Event event;
  event.set_to_agent(to_agent);
  event.mutable_manual_trigger()->set_reason(reason);
  return event;
}

reactor::v1::Event AgentStartEvent(const std::string& agent_id, const std::string& node_type) {
  reactor::v1::Event event;
  event.set_from_agent(agent_id);
  event.mutable_agent_start()->set_agent_id(agent_id);
  event.mutable_agent_start()->set_node_type(node_type);
  return event;
}

reactor::v1::Event AgentCompleteEvent(const std::string& agent_id, const std::string& summary, const std::string& response,
                                      const std::vector<std::string>& changed_artifacts) {
  reactor::v1::Event event;
  event.set_from_agent(agent_id);

  auto* complete = event.mutable_agent_complete();
  complete->set_agent_id(agent_id);
  complete->set_result_summary(summary);
  complete->set_response(response);
  for (const auto& artifact : changed_artifacts) complete->add_changed_artifacts(artifact);
  return event;
}

reactor::v1::Event AgentErrorEvent(const std::string& agent_id, const std::string& error) {
  reactor::v1::Event event;
  event.set_from_agent(agent_id);
  event.mutable_agent_error()->set_agent_id(agent_id);
  event.mutable_agent_error()->set_error(error);
  return event;
}

reactor::v1::Event TriggerDecisionEvent(const std::string& agent_id, uint64_t trigger_event_id, reactor::v1::TriggerOutcome outcome,
                                        uint32_t depth, const std::string& correlation_id, const std::string& detail) {
  reactor::v1::Event event;
  event.set_to_agent(agent_id);
  event.set_correlation_id(correlation_id);

  auto* decision = event.mutable_trigger_decision();
  decision->set_agent_id(agent_id);
  decision->set_trigger_event_id(trigger_event_id);
  decision->set_outcome(outcome);
  decision->set_depth(depth);
  decision->set_correlation_id(correlation_id);
  decision->set_detail(detail);
  return event;
}

} // namespace reactor::events
