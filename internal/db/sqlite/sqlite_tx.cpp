#include "sqlite_tx.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace batch::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode) : db_(std::move(db)), mode_(mode) {
  db_->Exec(mode_ == TxMode::kWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
  open_ = true;
}

SqliteTransaction::~SqliteTransaction() {
  if (!open_) return;
  try {
    Finish("ROLLBACK;");
  } catch (const std::exception& e) {
    BATCH_LOG_WARN("sqlite rollback failed", {observability::StringField("db", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Finish(const char* statement) {
  if (!open_) {
    throw std::logic_error("sqlite transaction already finished");
  }
  // a failed COMMIT leaves the transaction open so the destructor rolls it back
  db_->Exec(statement);
  open_ = false;
}

void SqliteTransaction::Commit() {
  Finish("COMMIT;");
}

void SqliteTransaction::Rollback() {
  Finish("ROLLBACK;");
}

} // namespace batch::db::sqlite
