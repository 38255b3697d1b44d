#pragma once

#include <mutex>
#include <optional>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace batch::db::memory {

/*
  Read transactions hold the repository lock and read the committed state
  in place. Write transactions work on a private copy that replaces the
  committed state on Commit(); a commit fails if another write landed since
  the copy was taken.

  A thread must not open a second transaction while holding a read one.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, TxMode mode);
  ~MemoryTransaction() override = default;

  TxMode Mode() const override {
    return mode_;
  }

  void Commit() override;
  void Rollback() override;

  MemoryRepository::State&       Mutable();
  const MemoryRepository::State& View() const;

 private:
  MemoryRepository&                      repo_;
  TxMode                                 mode_;
  std::unique_lock<std::mutex>           read_lock_;
  std::optional<MemoryRepository::State> working_;
  uint64_t                               base_version_ = 0;
};

} // namespace batch::db::memory
