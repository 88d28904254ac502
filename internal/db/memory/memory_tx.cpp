#include "memory_tx.hpp"

namespace reactor::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo)
    : repo_(repo), lock_(repo.tx_mutex_), working_(repo.committed_) {}

void MemoryTransaction::Commit() {
  RequireOpen("commit");
  repo_.committed_ = std::move(working_);
  Finish(Phase::Committed);
}

void MemoryTransaction::Rollback() {
  RequireOpen("rollback");
  Finish(Phase::RolledBack);
}

} // namespace reactor::db::memory
