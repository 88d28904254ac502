#pragma once

namespace reactor::v1 {
class Event;
}

namespace reactor::observability {

/*
  Receives every appended event and every runner decision.
  Implementations must not block and must not throw back into
  the caller's hot path; callers still guard the call.
*/
class EventObserver {
 public:
  virtual ~EventObserver() = default;

  virtual void Publish(const reactor::v1::Event& event) = 0;
};

} // namespace reactor::observability
