#pragma once

namespace batch::db {

enum class TxMode {
  // snapshot reads only; writes through a read transaction throw
  kRead,
  // takes the backend's write lock up front
  kWrite,
};

/*
  A unit of work against a Repository.

  - Writes are invisible to other transactions until Commit()
  - Reads see the transaction's own writes
  - Destroying an uncommitted transaction rolls it back

  The job store opens one transaction per batch of records, so a restart
  never observes half of a submit.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual TxMode Mode() const = 0;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;
};

} // namespace batch::db
