#pragma once

#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace batch::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin(TxMode mode) override;

  Result UpsertJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, const std::string&) override;
  std::vector<model::JobRecord> ListPendingJobs(Transaction&) override;
  Result DeleteJob(Transaction&, const std::string&) override;

  Result UpsertGroup(Transaction&, const model::GroupRecord&) override;
  std::optional<model::GroupRecord> GetGroup(Transaction&, const std::string&) override;
  std::vector<model::GroupRecord> ListUnfinishedGroups(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::JobRecord> jobs;
    std::unordered_map<std::string, model::GroupRecord> groups;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
