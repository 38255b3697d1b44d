#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/job.hpp"
#include "internal/model/job_group.hpp"

namespace batch::store {

struct PendingSet {
  std::vector<model::Job>      jobs;   // Running already demoted to Queued
  std::vector<model::JobGroup> groups; // not yet finished
};

/*
  Durable home of job and group records.

  Translates between the domain model and flat repository rows and turns
  every repository failure into util::PersistenceError. Writes are
  serialized; the repository sees one transaction at a time.
*/
class JobStore {
 public:
  explicit JobStore(std::shared_ptr<db::Repository> repository);

  void Save(const model::Job& job);
  void Save(const model::JobGroup& group);

  // Writes all records in a single transaction.
  void SaveAll(const std::vector<model::Job>& jobs, const std::vector<model::JobGroup>& groups);

  PendingSet LoadAllPending();

  std::optional<model::Job>      Load(const std::string& job_id);
  std::optional<model::JobGroup> LoadGroup(const std::string& group_id);

  void Remove(const std::string& job_id);
  void RemoveAll(const std::vector<std::string>& job_ids);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::mutex                      mutex_;
};

// Exposed for the repository parity and store tests.
db::model::JobRecord   ToRecord(const model::Job& job);
model::Job             FromRecord(const db::model::JobRecord& record);
db::model::GroupRecord ToRecord(const model::JobGroup& group);
model::JobGroup        FromRecord(const db::model::GroupRecord& record);

} // namespace batch::store
