#include "memory_tx.hpp"

#include <stdexcept>

namespace batch::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, TxMode mode) : repo_(repo), mode_(mode) {
  if (mode_ == TxMode::kRead) {
    read_lock_ = std::unique_lock<std::mutex>(repo_.mutex_);
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (!working_) {
    throw std::logic_error("write through a read-only or finished transaction");
  }
  return *working_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  if (mode_ == TxMode::kRead && read_lock_.owns_lock()) {
    return repo_.committed_;
  }
  if (!working_) {
    throw std::logic_error("read through a finished transaction");
  }
  return *working_;
}

void MemoryTransaction::Commit() {
  if (mode_ == TxMode::kRead) {
    if (read_lock_.owns_lock()) read_lock_.unlock();
    return;
  }
  if (!working_) {
    throw std::logic_error("transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    throw std::runtime_error("write conflict: another transaction committed first");
  }
  repo_.committed_ = std::move(*working_);
  ++repo_.committed_version_;
  working_.reset();
}

// dropping the copy (or the read lock) is all a rollback needs
void MemoryTransaction::Rollback() {
  working_.reset();
  if (read_lock_.owns_lock()) read_lock_.unlock();
}

} // namespace batch::db::memory
