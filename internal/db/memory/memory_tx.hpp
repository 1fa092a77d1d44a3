#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace valuegraph::db::memory {

/*
  Transaction = pinned snapshot (+ write set)

  Read-only transactions hold a reference to the committed state and read
  it in place. Write transactions copy it once and publish the copy on
  commit; the commit fails if another transaction committed after the
  snapshot was taken.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, bool read_only);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable();
  const MemoryRepository::State& View() const {
    return read_only_ ? *snapshot_ : working_;
  }

 private:
  MemoryRepository&                              repo_;
  std::shared_ptr<const MemoryRepository::State> snapshot_;
  MemoryRepository::State                        working_;
  uint64_t                                       snapshot_version_ = 0;
  bool                                           read_only_        = false;
  bool                                           committed_        = false;
  bool                                           rolled_back_      = false;
};

} // namespace valuegraph::db::memory
