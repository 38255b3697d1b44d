#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace batch::db::sqlite {

// kWrite opens with BEGIN IMMEDIATE so the job store learns about a busy
// database at Begin() rather than at its first upsert. kRead uses a
// deferred transaction and never takes the write lock.
class SqliteTransaction final : public db::Transaction {
 public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  TxMode Mode() const override {
    return mode_;
  }

  void Commit() override;
  void Rollback() override;

 private:
  void Finish(const char* statement);

  std::shared_ptr<SqliteDB> db_;
  TxMode                    mode_;
  bool                      open_ = false;
};

} // namespace batch::db::sqlite
