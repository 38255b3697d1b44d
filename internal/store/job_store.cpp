#include "internal/store/job_store.hpp"

#include <exception>

#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace batch::store {
namespace {

std::string ToJson(const google::protobuf::Message& message) {
  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(message, &out);
  if (!status.ok()) {
    throw util::PersistenceError("json encode failed: " + status.ToString());
  }
  return out;
}

template <typename Message>
Message FromJson(const std::string& json) {
  Message out;
  if (json.empty()) {
    return out;
  }
  auto status = google::protobuf::util::JsonStringToMessage(json, &out);
  if (!status.ok()) {
    throw util::PersistenceError("json decode failed: " + status.ToString());
  }
  return out;
}

std::string EncodeStrings(const std::vector<std::string>& values) {
  google::protobuf::ListValue list;
  for (const auto& value : values) {
    list.add_values()->set_string_value(value);
  }
  return ToJson(list);
}

std::vector<std::string> DecodeStrings(const std::string& json) {
  std::vector<std::string> out;
  for (const auto& value : FromJson<google::protobuf::ListValue>(json).values()) {
    out.push_back(value.string_value());
  }
  return out;
}

int EncodeError(const std::optional<model::JobError>& error, std::string& message) {
  if (!error) {
    message.clear();
    return 0;
  }
  message = error->message;
  return static_cast<int>(error->kind);
}

std::optional<model::JobError> DecodeError(int kind, const std::string& message) {
  if (kind == 0) return std::nullopt;
  return model::JobError{static_cast<model::ErrorKind>(kind), message};
}

void Check(const db::Result& result, const char* what) {
  if (!result) {
    throw util::PersistenceError(std::string(what) + ": " + db::ToString(result.code) + ": " + result.message);
  }
}

} // namespace

db::model::JobRecord ToRecord(const model::Job& job) {
  db::model::JobRecord r;
  r.id                = job.id;
  r.name              = job.name;
  r.task_name         = job.task_name;
  r.args_json         = ToJson(job.args);
  r.priority          = static_cast<int>(job.priority);
  r.dependencies_json = EncodeStrings(job.dependencies);

  r.max_attempts  = job.retry_policy.max_attempts;
  r.base_delay_ms = static_cast<uint64_t>(job.retry_policy.base_delay.count());
  r.multiplier    = job.retry_policy.multiplier;
  r.max_delay_ms  = static_cast<uint64_t>(job.retry_policy.max_delay.count());
  r.timeout_ms    = static_cast<uint64_t>(job.timeout.count());

  r.state         = static_cast<int>(job.state);
  r.attempt_count = job.attempt_count;

  if (job.result) r.result_json = ToJson(*job.result);
  r.error_kind      = EncodeError(job.error, r.error_message);
  r.last_error_kind = EncodeError(job.last_error, r.last_error_message);

  r.group_id      = job.group_id;
  r.tags_json     = EncodeStrings(job.tags);
  r.metadata_json = ToJson(job.metadata);

  r.progress         = job.progress;
  r.progress_message = job.progress_message;

  r.created_at_ms      = util::ToUnixMillis(job.created_at);
  r.queued_at_ms       = util::ToUnixMillis(job.queued_at);
  r.started_at_ms      = util::ToUnixMillis(job.started_at);
  r.finished_at_ms     = util::ToUnixMillis(job.finished_at);
  r.next_attempt_at_ms = util::ToUnixMillis(job.next_attempt_at);

  r.version = job.version;
  return r;
}

model::Job FromRecord(const db::model::JobRecord& r) {
  model::Job job;
  job.id           = r.id;
  job.name         = r.name;
  job.task_name    = r.task_name;
  job.args         = FromJson<google::protobuf::Struct>(r.args_json);
  job.priority     = static_cast<model::Priority>(r.priority);
  job.dependencies = DecodeStrings(r.dependencies_json);

  job.retry_policy.max_attempts = r.max_attempts;
  job.retry_policy.base_delay   = std::chrono::milliseconds(r.base_delay_ms);
  job.retry_policy.multiplier   = r.multiplier;
  job.retry_policy.max_delay    = std::chrono::milliseconds(r.max_delay_ms);
  job.timeout                   = std::chrono::milliseconds(r.timeout_ms);

  job.state         = static_cast<model::JobState>(r.state);
  job.attempt_count = r.attempt_count;

  if (r.result_json) job.result = FromJson<google::protobuf::Value>(*r.result_json);
  job.error      = DecodeError(r.error_kind, r.error_message);
  job.last_error = DecodeError(r.last_error_kind, r.last_error_message);

  job.group_id = r.group_id;
  job.tags     = DecodeStrings(r.tags_json);
  job.metadata = FromJson<google::protobuf::Struct>(r.metadata_json);

  job.progress         = r.progress;
  job.progress_message = r.progress_message;

  job.created_at      = util::FromUnixMillis(r.created_at_ms);
  job.queued_at       = util::OptionalFromUnixMillis(r.queued_at_ms);
  job.started_at      = util::OptionalFromUnixMillis(r.started_at_ms);
  job.finished_at     = util::OptionalFromUnixMillis(r.finished_at_ms);
  job.next_attempt_at = util::OptionalFromUnixMillis(r.next_attempt_at_ms);

  job.version = r.version;
  return job;
}

db::model::GroupRecord ToRecord(const model::JobGroup& group) {
  db::model::GroupRecord r;
  r.id                = group.id;
  r.name              = group.name;
  r.description       = group.description;
  r.metadata_json     = ToJson(group.metadata);
  r.sequential        = group.sequential;
  r.cancel_on_failure = group.cancel_on_failure;
  r.skip_on_failure   = group.skip_on_failure;
  r.canceled          = group.canceled;
  r.member_ids_json   = EncodeStrings(group.member_ids);
  r.state             = static_cast<int>(group.state);
  r.finished          = group.finished;
  r.created_at_ms     = util::ToUnixMillis(group.created_at);
  r.updated_at_ms     = util::ToUnixMillis(group.updated_at);
  r.version           = group.version;
  return r;
}

model::JobGroup FromRecord(const db::model::GroupRecord& r) {
  model::JobGroup group;
  group.id                = r.id;
  group.name              = r.name;
  group.description       = r.description;
  group.metadata          = FromJson<google::protobuf::Struct>(r.metadata_json);
  group.sequential        = r.sequential;
  group.cancel_on_failure = r.cancel_on_failure;
  group.skip_on_failure   = r.skip_on_failure;
  group.canceled          = r.canceled;
  group.member_ids        = DecodeStrings(r.member_ids_json);
  group.state             = static_cast<model::GroupState>(r.state);
  group.finished          = r.finished;
  group.created_at        = util::FromUnixMillis(r.created_at_ms);
  group.updated_at        = util::FromUnixMillis(r.updated_at_ms);
  group.version           = r.version;
  return group;
}

JobStore::JobStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void JobStore::Save(const model::Job& job) {
  SaveAll({job}, {});
}

void JobStore::Save(const model::JobGroup& group) {
  SaveAll({}, {group});
}

void JobStore::SaveAll(const std::vector<model::Job>& jobs, const std::vector<model::JobGroup>& groups) {
  if (jobs.empty() && groups.empty()) return;

  std::vector<db::model::JobRecord> job_records;
  job_records.reserve(jobs.size());
  for (const auto& job : jobs) job_records.push_back(ToRecord(job));

  std::vector<db::model::GroupRecord> group_records;
  group_records.reserve(groups.size());
  for (const auto& group : groups) group_records.push_back(ToRecord(group));

  std::lock_guard lock(mutex_);
  try {
    auto tx = repository_->Begin();
    for (const auto& record : job_records) Check(repository_->UpsertJob(*tx, record), "upsert job");
    for (const auto& record : group_records) Check(repository_->UpsertGroup(*tx, record), "upsert group");
    tx->Commit();
  } catch (const util::PersistenceError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::PersistenceError(std::string("save failed: ") + e.what());
  }
}

PendingSet JobStore::LoadAllPending() {
  PendingSet pending;

  std::lock_guard lock(mutex_);
  try {
    auto tx = repository_->Begin(db::TxMode::kRead);
    for (const auto& record : repository_->ListPendingJobs(*tx)) {
      auto job = FromRecord(record);
      if (job.state == model::JobState::kRunning) {
        job.state = model::JobState::kQueued;
      }
      pending.jobs.push_back(std::move(job));
    }
    for (const auto& record : repository_->ListUnfinishedGroups(*tx)) {
      pending.groups.push_back(FromRecord(record));
    }
    tx->Commit();
  } catch (const util::PersistenceError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::PersistenceError(std::string("load failed: ") + e.what());
  }

  BATCH_LOG_INFO("Loaded pending records", {observability::IntField("jobs", static_cast<int64_t>(pending.jobs.size())),
                                            observability::IntField("groups", static_cast<int64_t>(pending.groups.size()))});
  return pending;
}

std::optional<model::Job> JobStore::Load(const std::string& job_id) {
  std::lock_guard lock(mutex_);
  try {
    auto tx     = repository_->Begin(db::TxMode::kRead);
    auto record = repository_->GetJob(*tx, job_id);
    tx->Commit();
    if (!record) return std::nullopt;
    return FromRecord(*record);
  } catch (const util::PersistenceError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::PersistenceError(std::string("load job failed: ") + e.what());
  }
}

std::optional<model::JobGroup> JobStore::LoadGroup(const std::string& group_id) {
  std::lock_guard lock(mutex_);
  try {
    auto tx     = repository_->Begin(db::TxMode::kRead);
    auto record = repository_->GetGroup(*tx, group_id);
    tx->Commit();
    if (!record) return std::nullopt;
    return FromRecord(*record);
  } catch (const util::PersistenceError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::PersistenceError(std::string("load group failed: ") + e.what());
  }
}

void JobStore::Remove(const std::string& job_id) {
  RemoveAll({job_id});
}

void JobStore::RemoveAll(const std::vector<std::string>& job_ids) {
  if (job_ids.empty()) return;

  std::lock_guard lock(mutex_);
  try {
    auto tx = repository_->Begin();
    for (const auto& id : job_ids) Check(repository_->DeleteJob(*tx, id), "delete job");
    tx->Commit();
  } catch (const util::PersistenceError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::PersistenceError(std::string("remove failed: ") + e.what());
  }
}

} // namespace batch::store
