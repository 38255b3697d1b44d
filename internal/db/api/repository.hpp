#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/group_record.hpp"
#include "internal/db/model/job_record.hpp"

namespace batch::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Upserts carrying a version not newer than the stored row are dropped
    and still report Ok

  The engine's in-memory tables are the source of truth while running;
  the repository is what survives a restart.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin(TxMode mode = TxMode::kWrite) = 0;

  // ---------------------------------------------------------------------
  // Jobs
  // ---------------------------------------------------------------------

  virtual Result UpsertJob(Transaction&, const model::JobRecord&) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, const std::string& id) = 0;

  // state not in {Completed, Failed, Canceled}, ordered by created_at
  virtual std::vector<model::JobRecord> ListPendingJobs(Transaction&) = 0;

  virtual Result DeleteJob(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Groups
  // ---------------------------------------------------------------------

  virtual Result UpsertGroup(Transaction&, const model::GroupRecord&) = 0;

  virtual std::optional<model::GroupRecord> GetGroup(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::GroupRecord> ListUnfinishedGroups(Transaction&) = 0;
};

} // namespace batch::db
