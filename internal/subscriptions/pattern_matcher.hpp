#pragma once

#include <string_view>

#include "reactor/v1.hpp"

namespace reactor::subscriptions {

/*
  Pure AND over the fields present on the pattern:

    event_types  event type name is listed
    from_agents  event has a sender and it is listed
    to_agent     event has a recipient equal to it
    path_glob    event carries a path and the glob matches it
    tags         at least one event tag is listed

  A present but empty list matches nothing.
*/
bool Matches(const reactor::v1::SubscriptionPattern& pattern, const reactor::v1::Event& event);

// False for the all-absent pattern, which Register() rejects.
bool HasAnyField(const reactor::v1::SubscriptionPattern& pattern);

/*
  Relative globs match from the right, one path component per glob
  component ("a.py" matches "src/a.py", "src/*.py" matches
  "pkg/src/x.py"). An absolute glob must match the whole absolute
  path. Components use fnmatch(3); both sides are lexically
  normalised first.
*/
bool PathGlobMatches(std::string_view glob, std::string_view path);

} // namespace reactor::subscriptions
