#include "internal/subscriptions/pattern_matcher.hpp"

#include <cassert>
#include <iostream>

#include "internal/events/event_builders.hpp"

namespace {

using reactor::subscriptions::HasAnyField;
using reactor::subscriptions::Matches;
using reactor::subscriptions::PathGlobMatches;
using reactor::v1::SubscriptionPattern;

void TestGlobMatchesFromTheRight() {
  assert(PathGlobMatches("a.py", "src/a.py"));
  assert(PathGlobMatches("a.py", "a.py"));
  assert(PathGlobMatches("src/*.py", "pkg/src/x.py"));
  assert(!PathGlobMatches("src/*.py", "pkg/lib/x.py"));
  assert(!PathGlobMatches("b.py", "src/a.py"));
  assert(PathGlobMatches("./src/../src/a.py", "src/a.py"));
}

void TestAbsoluteGlobMustMatchWholePath() {
  assert(PathGlobMatches("/repo/src/*.py", "/repo/src/a.py"));
  assert(!PathGlobMatches("/src/*.py", "/repo/src/a.py"));
}

void TestAbsentFieldsNeverBlock() {
  SubscriptionPattern pattern;
  pattern.mutable_event_types()->add_values("AgentMessage");

  assert(HasAnyField(pattern));
  assert(Matches(pattern, reactor::events::AgentMessageEvent("x", "y", "hi")));
  assert(!Matches(pattern, reactor::events::ContentChangedEvent("a.py")));
}

void TestPresentFieldsAreAnded() {
  SubscriptionPattern pattern;
  pattern.mutable_event_types()->add_values("AgentMessage");
  pattern.set_to_agent("y");
  pattern.mutable_from_agents()->add_values("x");
  pattern.mutable_tags()->add_values("review");

  assert(Matches(pattern, reactor::events::AgentMessageEvent("x", "y", "hi", {"review", "urgent"})));
  assert(!Matches(pattern, reactor::events::AgentMessageEvent("x", "y", "hi", {"urgent"})));
  assert(!Matches(pattern, reactor::events::AgentMessageEvent("z", "y", "hi", {"review"})));
  assert(!Matches(pattern, reactor::events::AgentMessageEvent("x", "w", "hi", {"review"})));
}

void TestPresentEmptyListMatchesNothing() {
  SubscriptionPattern pattern;
  pattern.mutable_event_types();

  assert(HasAnyField(pattern));
  assert(!Matches(pattern, reactor::events::ContentChangedEvent("a.py")));
  assert(!Matches(pattern, reactor::events::AgentMessageEvent("x", "y", "hi")));
}

void TestAbsentRoutingNeverSatisfiesPresentField() {
  SubscriptionPattern pattern;
  pattern.set_to_agent("y");
  assert(!Matches(pattern, reactor::events::ContentChangedEvent("a.py")));

  SubscriptionPattern from;
  from.mutable_from_agents()->add_values("x");
  assert(!Matches(from, reactor::events::ManualTriggerEvent("y", "go")));
}

void TestPathGlobNeedsAPath() {
  SubscriptionPattern pattern;
  pattern.set_path_glob("*.py");

  assert(Matches(pattern, reactor::events::ContentChangedEvent("src/a.py")));
  assert(Matches(pattern, reactor::events::FileSavedEvent("a.py")));
  assert(!Matches(pattern, reactor::events::AgentMessageEvent("x", "y", "a.py")));
}

void TestAllAbsentPatternHasNoField() {
  SubscriptionPattern pattern;
  assert(!HasAnyField(pattern));
}

} // namespace

int main() {
  TestGlobMatchesFromTheRight();
  TestAbsoluteGlobMustMatchWholePath();
  TestAbsentFieldsNeverBlock();
  TestPresentFieldsAreAnded();
  TestPresentEmptyListMatchesNothing();
  TestAbsentRoutingNeverSatisfiesPresentField();
  TestPathGlobNeedsAPath();
  TestAllAbsentPatternHasNoField();

  std::cout << "agent_reactor_unit_pattern_matcher: pass\n";
  return 0;
}
