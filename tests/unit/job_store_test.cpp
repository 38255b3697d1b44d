#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/job_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using batch::model::Job;
using batch::model::JobGroup;
using batch::model::JobState;

Job MakeJob(const std::string& id, JobState state, uint64_t version = 1) {
  Job job;
  job.id                        = id;
  job.name                      = "job " + id;
  job.task_name                 = "echo";
  job.state                     = state;
  job.version                   = version;
  job.created_at                = batch::util::FromUnixMillis(1'700'000'000'000);
  job.retry_policy.max_attempts = 5;
  job.retry_policy.base_delay   = std::chrono::milliseconds(250);
  job.retry_policy.multiplier   = 1.5;
  job.retry_policy.max_delay    = std::chrono::milliseconds(4000);
  return job;
}

class BrokenTransaction final : public batch::db::Transaction {
 public:
  batch::db::TxMode Mode() const override {
    return batch::db::TxMode::kWrite;
  }
  void Commit() override {
  }
  void Rollback() override {
  }
};

// Every write fails the way a full disk would.
class BrokenRepository final : public batch::db::Repository {
 public:
  std::unique_ptr<batch::db::Transaction> Begin(batch::db::TxMode) override {
    return std::make_unique<BrokenTransaction>();
  }
  batch::db::Result UpsertJob(batch::db::Transaction&, const batch::db::model::JobRecord&) override {
    return batch::db::Result::Err(batch::db::ErrorCode::IOError, "disk full");
  }
  std::optional<batch::db::model::JobRecord> GetJob(batch::db::Transaction&, const std::string&) override {
    return std::nullopt;
  }
  std::vector<batch::db::model::JobRecord> ListPendingJobs(batch::db::Transaction&) override {
    return {};
  }
  batch::db::Result DeleteJob(batch::db::Transaction&, const std::string&) override {
    return batch::db::Result::Err(batch::db::ErrorCode::IOError, "disk full");
  }
  batch::db::Result UpsertGroup(batch::db::Transaction&, const batch::db::model::GroupRecord&) override {
    return batch::db::Result::Err(batch::db::ErrorCode::IOError, "disk full");
  }
  std::optional<batch::db::model::GroupRecord> GetGroup(batch::db::Transaction&, const std::string&) override {
    return std::nullopt;
  }
  std::vector<batch::db::model::GroupRecord> ListUnfinishedGroups(batch::db::Transaction&) override {
    return {};
  }
};

void TestSaveAndLoadPreservesFields() {
  batch::store::JobStore store(std::make_shared<batch::db::memory::MemoryRepository>());

  auto job     = MakeJob("a", JobState::kFailed);
  job.priority = batch::model::Priority::kCritical;
  job.dependencies = {"x", "y"};
  job.tags         = {"nightly", "etl"};
  job.timeout      = std::chrono::milliseconds(1500);
  job.attempt_count = 5;
  (*job.args.mutable_fields())["n"].set_number_value(42);
  (*job.metadata.mutable_fields())["owner"].set_string_value("ops");
  job.error      = batch::model::JobError{batch::model::ErrorKind::kTimeout, "too slow"};
  job.last_error = job.error;
  job.finished_at = batch::util::FromUnixMillis(1'700'000'005'000);
  store.Save(job);

  auto loaded = store.Load("a");
  assert(loaded);
  assert(loaded->name == "job a");
  assert(loaded->priority == batch::model::Priority::kCritical);
  assert((loaded->dependencies == std::vector<std::string>{"x", "y"}));
  assert((loaded->tags == std::vector<std::string>{"nightly", "etl"}));
  assert(loaded->timeout == std::chrono::milliseconds(1500));
  assert(loaded->retry_policy.max_attempts == 5);
  assert(loaded->retry_policy.base_delay == std::chrono::milliseconds(250));
  assert(loaded->retry_policy.multiplier == 1.5);
  assert(loaded->retry_policy.max_delay == std::chrono::milliseconds(4000));
  assert(loaded->args.fields().at("n").number_value() == 42);
  assert(loaded->metadata.fields().at("owner").string_value() == "ops");
  assert(loaded->error && loaded->error->kind == batch::model::ErrorKind::kTimeout);
  assert(loaded->error->message == "too slow");
  assert(!loaded->result);
  assert(!loaded->started_at);
  assert(loaded->finished_at && batch::util::ToUnixMillis(*loaded->finished_at) == 1'700'000'005'000);
  assert(batch::util::ToUnixMillis(loaded->created_at) == 1'700'000'000'000);

  assert(!store.Load("missing"));
}

void TestStaleVersionIsIgnored() {
  batch::store::JobStore store(std::make_shared<batch::db::memory::MemoryRepository>());

  auto newer          = MakeJob("a", JobState::kQueued, 5);
  newer.attempt_count = 2;
  store.Save(newer);

  auto older          = MakeJob("a", JobState::kCreated, 3);
  older.attempt_count = 0;
  store.Save(older);

  auto loaded = store.Load("a");
  assert(loaded->version == 5);
  assert(loaded->state == JobState::kQueued);
  assert(loaded->attempt_count == 2);
}

void TestLoadAllPendingDemotesRunning() {
  batch::store::JobStore store(std::make_shared<batch::db::memory::MemoryRepository>());

  store.SaveAll({MakeJob("queued", JobState::kQueued), MakeJob("running", JobState::kRunning), MakeJob("done", JobState::kCompleted),
                 MakeJob("canceled", JobState::kCanceled), MakeJob("paused", JobState::kPaused)},
                {});

  JobGroup open;
  open.id         = "g-open";
  open.member_ids = {"queued"};
  JobGroup closed = open;
  closed.id       = "g-closed";
  closed.finished = true;
  closed.state    = batch::model::GroupState::kCompleted;
  store.SaveAll({}, {open, closed});

  auto pending = store.LoadAllPending();
  assert(pending.jobs.size() == 3);
  for (const auto& job : pending.jobs) {
    assert(job.id != "done" && job.id != "canceled");
    if (job.id == "running") {
      assert(job.state == JobState::kQueued);
    }
    if (job.id == "paused") {
      assert(job.state == JobState::kPaused);
    }
  }
  assert(pending.groups.size() == 1);
  assert(pending.groups[0].id == "g-open");
  assert((pending.groups[0].member_ids == std::vector<std::string>{"queued"}));

  // finished records stay reachable individually
  assert(store.LoadGroup("g-closed"));
  assert(store.Load("done"));
}

void TestRemove() {
  batch::store::JobStore store(std::make_shared<batch::db::memory::MemoryRepository>());
  store.SaveAll({MakeJob("a", JobState::kCompleted), MakeJob("b", JobState::kCompleted), MakeJob("c", JobState::kCompleted)}, {});

  store.Remove("a");
  store.RemoveAll({"b", "never-existed"});

  assert(!store.Load("a"));
  assert(!store.Load("b"));
  assert(store.Load("c"));
}

void TestRepositoryFailuresBecomePersistenceErrors() {
  batch::store::JobStore store(std::make_shared<BrokenRepository>());

  bool threw = false;
  try {
    store.Save(MakeJob("a", JobState::kQueued));
  } catch (const batch::util::PersistenceError& e) {
    threw = std::string(e.what()).find("io error: disk full") != std::string::npos;
  }
  assert(threw);

  threw = false;
  try {
    store.Remove("a");
  } catch (const batch::util::PersistenceError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSaveAndLoadPreservesFields();
  TestStaleVersionIsIgnored();
  TestLoadAllPendingDemotesRunning();
  TestRemove();
  TestRepositoryFailuresBecomePersistenceErrors();

  std::cout << "batch_unit_job_store: pass\n";
  return 0;
}
