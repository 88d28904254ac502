#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/model/event_record.hpp"
#include "reactor/v1.hpp"

namespace reactor::events {

/*
  Event type names are the stable strings persisted in the
  event_type column and used by SubscriptionPattern.event_types.
*/
std::string_view EventTypeName(reactor::v1::Event::PayloadCase payload_case);
std::string_view EventTypeName(const reactor::v1::Event& event);
bool             IsKnownEventType(std::string_view name);

// Path carried by ContentChanged and FileSaved; nullopt for every other type.
std::optional<std::string> EventPath(const reactor::v1::Event& event);

// Row <-> message. FromRecord throws util::PersistenceError on a corrupt row.
db::model::EventRecord ToRecord(const reactor::v1::Event& event);
reactor::v1::Event     FromRecord(const db::model::EventRecord& record);

// One-line human readable description, cut to limit characters.
std::string Describe(const reactor::v1::Event& event, std::size_t limit);

std::string Truncate(std::string_view text, std::size_t limit);

} // namespace reactor::events
