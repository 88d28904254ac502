#pragma once

#include <stdexcept>
#include <string>

namespace reactor::db {

/*
  Unit of work against one store (events, subscriptions or swarm).

  Every backend guarantees:
    - nothing written inside the transaction is visible before Commit()
    - Rollback(), or destruction without Commit(), drops every write
    - a store runs one transaction at a time; Begin() on a busy store
      blocks until the current transaction ends

  Commit() or Rollback() on a finished transaction throws std::logic_error.
*/
class Transaction {
public:
  enum class Phase { Open, Committed, RolledBack };

  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  Phase CurrentPhase() const { return phase_; }
  bool  Open() const { return phase_ == Phase::Open; }

protected:
  void RequireOpen(const char* op) const {
    if (phase_ != Phase::Open) throw std::logic_error(std::string(op) + " on a finished transaction");
  }
  void Finish(Phase phase) { phase_ = phase; }

private:
  Phase phase_ = Phase::Open;
};

} // namespace reactor::db
