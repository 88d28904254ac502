#pragma once

#include <stdexcept>

namespace reactor::util {

/*
  Exceptions thrown above the repository layer. Repositories report
  through db::Result and the services translate.

  Bad input from a caller (an empty agent id, a malformed pattern, an
  unknown config key) is InvalidArgument and is never retried.
*/
class InvalidArgument : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

// Operation on a component that is closed, stopped or not started yet.
class InvalidState : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A store read or write failed; the event, subscription or agent row
// involved was not changed.
class PersistenceError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Push or pop on a trigger channel after Close().
class ChannelClosed : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Thrown by an AgentExecutor when a turn cannot complete.
class TurnFailed : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

} // namespace reactor::util
