#include "memory_tx.hpp"

#include <mutex>
#include <stdexcept>

namespace valuegraph::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, bool read_only) : repo_(repo), read_only_(read_only) {
  {
    std::scoped_lock lock(repo_.mutex_);
    snapshot_         = repo_.committed_;
    snapshot_version_ = repo_.committed_version_;
  }
  if (!read_only_) {
    working_ = *snapshot_; // private copy for the write set
    snapshot_.reset();
  }
}

MemoryTransaction::~MemoryTransaction() = default;

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (read_only_) {
    throw std::logic_error("write inside a read-only transaction");
  }
  if (committed_ || rolled_back_) {
    throw std::logic_error("write after the transaction finished");
  }
  return working_;
}

void MemoryTransaction::Commit() {
  if (committed_) return;
  if (rolled_back_) {
    throw std::logic_error("commit after rollback");
  }
  if (read_only_) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw std::runtime_error("transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::make_shared<const MemoryRepository::State>(std::move(working_));
  repo_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) return;

  // the write set is simply dropped
  if (!read_only_) working_ = MemoryRepository::State{};
  rolled_back_ = true;
}

} // namespace valuegraph::db::memory
