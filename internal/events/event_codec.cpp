#include "event_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <array>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace reactor::events {

using reactor::v1::Event;

std::string_view EventTypeName(Event::PayloadCase payload_case) {
  switch (payload_case) {
    case Event::kContentChanged:
      return "ContentChanged";
    case Event::kFileSaved:
      return "FileSaved";
    case Event::kAgentMessage:
      return "AgentMessage";
    case Event::kManualTrigger:
      return "ManualTrigger";
    case Event::kAgentStart:
      return "AgentStart";
    case Event::kAgentComplete:
      return "AgentComplete";
    case Event::kAgentError:
      return "AgentError";
    case Event::kHumanInputRequest:
      return "HumanInputRequest";
    case Event::kHumanInputResponse:
      return "HumanInputResponse";
    case Event::kTriggerDecision:
      return "TriggerDecision";
    case Event::PAYLOAD_NOT_SET:
      break;
  }
  return "";
}

std::string_view EventTypeName(const Event& event) {
  return EventTypeName(event.payload_case());
}

bool IsKnownEventType(std::string_view name) {
  static constexpr std::array<Event::PayloadCase, 10> kCases = {
      Event::kContentChanged, Event::kFileSaved,     Event::kAgentMessage,      Event::kManualTrigger,      Event::kAgentStart,
      Event::kAgentComplete,  Event::kAgentError,    Event::kHumanInputRequest, Event::kHumanInputResponse, Event::kTriggerDecision};
  for (auto c : kCases) {
    if (EventTypeName(c) == name) return true;
  }
  return false;
}

std::optional<std::string> EventPath(const Event& event) {
  switch (event.payload_case()) {
    case Event::kContentChanged:
      return event.content_changed().path();
    case Event::kFileSaved:
      return event.file_saved().path();
    default:
      return std::nullopt;
  }
}

db::model::EventRecord ToRecord(const Event& event) {
  db::model::EventRecord record;
  record.id             = event.id();
  record.graph_id       = event.graph_id();
  record.event_type     = std::string(EventTypeName(event));
  record.from_agent     = event.from_agent();
  record.to_agent       = event.to_agent();
  record.correlation_id = event.correlation_id();
  record.created_at_ms  = util::MillisFromTimestamp(event.created_at());

  // body only; routing lives in columns
  Event body;
  body.CopyFrom(event);
  body.clear_id();
  body.clear_graph_id();
  body.clear_from_agent();
  body.clear_to_agent();
  body.clear_correlation_id();
  body.clear_tags();
  body.clear_created_at();

  auto status = google::protobuf::util::MessageToJsonString(body, &record.payload_json);
  if (!status.ok()) {
    throw util::PersistenceError("encode event payload: " + std::string(status.message()));
  }

  google::protobuf::ListValue tags;
  for (const auto& tag : event.tags()) tags.add_values()->set_string_value(tag);
  record.tags_json.clear();
  status = google::protobuf::util::MessageToJsonString(tags, &record.tags_json);
  if (!status.ok()) {
    throw util::PersistenceError("encode event tags: " + std::string(status.message()));
  }

  return record;
}

Event FromRecord(const db::model::EventRecord& record) {
  Event event;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(record.payload_json, &event, options);
  if (!status.ok()) {
    throw util::PersistenceError("decode event " + std::to_string(record.id) + ": " + std::string(status.message()));
  }

  event.set_id(record.id);
  event.set_graph_id(record.graph_id);
  event.set_from_agent(record.from_agent);
  event.set_to_agent(record.to_agent);
  event.set_correlation_id(record.correlation_id);
  *event.mutable_created_at() = util::TimestampFromMillis(record.created_at_ms);

  if (!record.tags_json.empty()) {
    google::protobuf::ListValue tags;
    status = google::protobuf::util::JsonStringToMessage(record.tags_json, &tags, options);
    if (!status.ok()) {
      throw util::PersistenceError("decode tags of event " + std::to_string(record.id) + ": " + std::string(status.message()));
    }
    for (const auto& value : tags.values()) {
      if (value.has_string_value()) event.add_tags(value.string_value());
    }
  }

  return event;
}

std::string Truncate(std::string_view text, std::size_t limit) {
  if (text.size() <= limit) return std::string(text);
  if (limit <= 3) return std::string(text.substr(0, limit));
  return std::string(text.substr(0, limit - 3)) + "...";
}

std::string Describe(const Event& event, std::size_t limit) {
  std::string text(EventTypeName(event));

  switch (event.payload_case()) {
    case Event::kContentChanged:
      text += " " + event.content_changed().path();
      break;
    case Event::kFileSaved:
      text += " " + event.file_saved().path();
      break;
    case Event::kAgentMessage:
      text += " from " + (event.from_agent().empty() ? std::string("?") : event.from_agent()) + ": " + event.agent_message().content();
      break;
    case Event::kManualTrigger:
      text += ": " + event.manual_trigger().reason();
      break;
    case Event::kAgentComplete:
      text += " " + event.agent_complete().agent_id() + ": " + event.agent_complete().result_summary();
      break;
    case Event::kAgentError:
      text += " " + event.agent_error().agent_id() + ": " + event.agent_error().error();
      break;
    case Event::kHumanInputResponse:
      text += ": " + event.human_input_response().response();
      break;
    default:
      break;
  }

  return Truncate(text, limit);
}

} // namespace reactor::events
