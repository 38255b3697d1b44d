#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace batch::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin(TxMode mode) override;

  Result UpsertJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, const std::string&) override;
  std::vector<model::JobRecord> ListPendingJobs(Transaction&) override;
  Result DeleteJob(Transaction&, const std::string&) override;

  Result UpsertGroup(Transaction&, const model::GroupRecord&) override;
  std::optional<model::GroupRecord> GetGroup(Transaction&, const std::string&) override;
  std::vector<model::GroupRecord> ListUnfinishedGroups(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
