#include "pattern_matcher.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include "internal/events/event_codec.hpp"

namespace reactor::subscriptions {

namespace {

struct SplitPath {
  bool                     absolute = false;
  std::vector<std::string> parts;
};

SplitPath Split(std::string_view raw) {
  SplitPath out;
  if (raw.empty()) return out;

  const std::string normal = std::filesystem::path(std::string(raw)).lexically_normal().generic_string();
  out.absolute             = !normal.empty() && normal.front() == '/';

  std::size_t start = 0;
  while (start <= normal.size()) {
    auto end = normal.find('/', start);
    if (end == std::string::npos) end = normal.size();
    auto part = normal.substr(start, end - start);
    if (!part.empty() && part != ".") out.parts.push_back(std::move(part));
    start = end + 1;
  }
  return out;
}

bool Contains(const reactor::v1::StringList& list, const std::string& value) {
  return std::find(list.values().begin(), list.values().end(), value) != list.values().end();
}

} // namespace

bool PathGlobMatches(std::string_view glob, std::string_view path) {
  const auto pattern = Split(glob);
  const auto target  = Split(path);

  if (pattern.parts.empty() || target.parts.empty()) return false;

  if (pattern.absolute) {
    if (!target.absolute || pattern.parts.size() != target.parts.size()) return false;
  } else if (pattern.parts.size() > target.parts.size()) {
    return false;
  }

  const auto offset = target.parts.size() - pattern.parts.size();
  for (std::size_t i = 0; i < pattern.parts.size(); ++i) {
    if (fnmatch(pattern.parts[i].c_str(), target.parts[offset + i].c_str(), 0) != 0) return false;
  }
  return true;
}

bool HasAnyField(const reactor::v1::SubscriptionPattern& pattern) {
  return pattern.has_event_types() || pattern.has_from_agents() || pattern.has_to_agent() || pattern.has_path_glob() || pattern.has_tags();
}

bool Matches(const reactor::v1::SubscriptionPattern& pattern, const reactor::v1::Event& event) {
  if (pattern.has_event_types() && !Contains(pattern.event_types(), std::string(events::EventTypeName(event)))) {
    return false;
  }

  if (pattern.has_from_agents() && (event.from_agent().empty() || !Contains(pattern.from_agents(), event.from_agent()))) {
    return false;
  }

  if (pattern.has_to_agent() && (event.to_agent().empty() || event.to_agent() != pattern.to_agent())) {
    return false;
  }

  if (pattern.has_path_glob()) {
    auto path = events::EventPath(event);
    if (!path || !PathGlobMatches(pattern.path_glob(), *path)) return false;
  }

  if (pattern.has_tags()) {
    const bool any = std::any_of(event.tags().begin(), event.tags().end(), [&](const std::string& tag) { return Contains(pattern.tags(), tag); });
    if (!any) return false;
  }

  return true;
}

} // namespace reactor::subscriptions
