#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace rowcast::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::Commit() {
  if (finished_) {
    throw util::InvalidState("transaction already finished");
  }
  finished_ = true;
  if (!dirty_) {
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw util::InvalidState("transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
}

void MemoryTransaction::Rollback() {
  finished_ = true;
}

} // namespace rowcast::db::memory
