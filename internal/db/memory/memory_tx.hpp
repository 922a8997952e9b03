#pragma once

#include <cstdint>
#include <memory>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace evolve::db::memory {

/*
  Transaction = snapshot + write set

  Read-only transactions hold the committed snapshot without copying.
  Read-write transactions copy it into a private working state.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, AccessMode mode);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }
  AccessMode Mode() const override {
    return mode_;
  }

  // throws util::InvalidState on read-only transactions
  MemoryRepository::State& Mutable();
  const MemoryRepository::State& View() const;

 private:
  MemoryRepository&                              repo_;
  AccessMode                                     mode_;
  std::shared_ptr<const MemoryRepository::State> snapshot_;
  std::unique_ptr<MemoryRepository::State>       working_;
  std::uint64_t                                  snapshot_version_ = 0;
  bool                                           committed_        = false;
  bool                                           rolled_back_      = false;
};

} // namespace evolve::db::memory
