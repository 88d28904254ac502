#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace reactor::db::memory {

// Exclusive lock on the store plus a private copy of its state.
// Commit() swaps the copy in; anything else throws it away.
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);

  void Commit() override;
  void Rollback() override;

  MemoryRepository::State&       Mutable() { return working_; }
  const MemoryRepository::State& View() const { return working_; }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> lock_;
  MemoryRepository::State      working_;
};

} // namespace reactor::db::memory
