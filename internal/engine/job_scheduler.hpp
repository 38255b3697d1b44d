#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/model/job.hpp"
#include "internal/model/job_group.hpp"
#include "internal/store/job_store.hpp"
#include "internal/task/task_context.hpp"
#include "internal/task/task_registry.hpp"

namespace batch::engine {

struct SchedulerOptions {
  std::size_t               max_workers    = 1;
  std::size_t               max_queue_size = 1000; // 0 = unlimited
  std::chrono::milliseconds poll_interval{100};
};

struct JobFilter {
  std::optional<model::JobState> state;
  std::string                    group_id;
  std::string                    tag;
};

struct EngineStats {
  uint64_t submitted = 0;
  uint64_t completed = 0;
  uint64_t failed    = 0;
  uint64_t canceled  = 0;
  uint64_t retried   = 0;

  uint64_t queue_depth = 0; // Queued + Waiting + Paused
  uint64_t running     = 0;
  uint64_t workers     = 0;

  double avg_execution_ms  = 0.0;
  double min_execution_ms  = 0.0;
  double max_execution_ms  = 0.0;
  double avg_queue_wait_ms = 0.0;
  double uptime_seconds    = 0.0;
};

// Handed to a worker when a job starts an attempt.
struct Dispatch {
  model::Job             job;
  task::AttemptHandlePtr handle;
};

// Exactly one of value / error is set.
struct AttemptResult {
  std::optional<google::protobuf::Value> value;
  std::optional<model::JobError>         error;
};

using JobLoader   = std::function<std::optional<model::Job>(const std::string&)>;
using GroupLoader = std::function<std::optional<model::JobGroup>(const std::string&)>;

/*
  The single owner of job and group state.

  Every transition happens under one mutex: admission, eligibility,
  ordering, group sequencing, dependency propagation and retry handling.
  Records touched by an operation are snapshotted under the lock and handed
  to the store after it is released.

  Workers call Dequeue() / ReportOutcome(); everything else is the
  client-facing surface re-exported by JobEngine.
*/
class JobScheduler {
 public:
  JobScheduler(SchedulerOptions options, std::shared_ptr<task::TaskRegistry> registry, std::shared_ptr<store::JobStore> store);

  JobScheduler(const JobScheduler&)            = delete;
  JobScheduler& operator=(const JobScheduler&) = delete;

  // job must be fully formed (id, task, policy); state is forced to Created.
  void AddJob(model::Job job);
  void AddGroup(model::JobGroup group);

  model::JobState Submit(const std::string& job_id);
  model::JobState Pause(const std::string& job_id);
  model::JobState Resume(const std::string& job_id);
  model::JobState Cancel(const std::string& job_id);
  model::JobState SetPriority(const std::string& job_id, model::Priority priority);

  void               AddToGroup(const std::string& job_id, const std::string& group_id);
  model::GroupStatus CancelGroup(const std::string& group_id);

  // Returns the current state if the timeout elapses first.
  model::JobState    WaitForJob(const std::string& job_id, std::optional<std::chrono::milliseconds> timeout);
  model::GroupStatus WaitForGroup(const std::string& group_id, std::optional<std::chrono::milliseconds> timeout);

  model::Job              GetJob(const std::string& job_id) const;
  model::JobStatus        GetStatus(const std::string& job_id) const;
  model::JobGroup         GetGroup(const std::string& group_id) const;
  model::GroupStatus      GetGroupStatus(const std::string& group_id) const;
  std::vector<model::Job> ListJobs(const JobFilter& filter) const;
  EngineStats             Stats() const;

  // Drops terminal jobs that are neither group members nor dependencies of
  // a live job. Returns how many were removed.
  std::size_t ClearFinished(std::optional<model::JobState> state);

  // Rehydrates records loaded at startup. Dependencies and members missing
  // from the pending set are fetched through the loaders.
  void Restore(store::PendingSet pending, const JobLoader& load_job, const GroupLoader& load_group);

  // ---------------------------------------------------------------------
  // Worker-facing
  // ---------------------------------------------------------------------

  // Blocks until a job is eligible and a worker slot is free; nullopt once
  // shut down.
  std::optional<Dispatch> Dequeue();

  void ReportOutcome(const std::string& job_id, AttemptResult result);

  // A timed-out attempt whose body is still running keeps its worker slot,
  // and the job is not dispatched again, until ReleaseAbandoned.
  void HoldAbandoned(const std::string& job_id);
  void ReleaseAbandoned(const std::string& job_id);

  void Shutdown();

 private:
  struct Entry {
    model::Job job;
    uint64_t   sequence         = 0;
    bool       pause_requested  = false;
    bool       cancel_requested = false;
  };

  struct PersistBatch {
    std::vector<model::Job>      jobs;
    std::vector<model::JobGroup> groups;
  };

  struct BlockCheck {
    bool        blocked = false;
    bool        failed  = false;
    std::string reason;
  };

  Entry&                 Lookup(const std::string& job_id);
  const Entry&           Lookup(const std::string& job_id) const;
  model::JobGroup&       LookupGroup(const std::string& group_id);
  const model::JobGroup& LookupGroup(const std::string& group_id) const;

  model::Job         Snapshot(const Entry& entry) const;
  model::GroupStatus Summary(const model::JobGroup& group) const;
  std::size_t        PendingCount() const;

  BlockCheck CheckBlockers(const model::Job& job) const;
  bool       Precedes(const Entry& a, const Entry& b) const;

  void Transition(Entry& entry, model::JobState to);
  void Finish(Entry& entry, model::JobState terminal, std::optional<google::protobuf::Value> result, std::optional<model::JobError> error);
  void CancelEntry(Entry& entry, const model::JobError& reason);
  void CancelSiblings(const model::JobGroup& group, const std::string& failed_job_id);
  void Reevaluate();

  void MarkDirty(Entry& entry);
  void MarkGroupDirty(model::JobGroup& group);
  void RefreshGroup(model::JobGroup& group);

  PersistBatch TakeDirty();
  // Logs failures; rethrows only when asked.
  void Persist(const PersistBatch& batch, bool rethrow);

  SchedulerOptions                    options_;
  std::shared_ptr<task::TaskRegistry> registry_;
  std::shared_ptr<store::JobStore>    store_;

  mutable std::mutex      mutex_;
  std::condition_variable work_cv_;
  std::condition_variable state_cv_;

  std::unordered_map<std::string, Entry>                  jobs_;
  std::unordered_map<std::string, model::JobGroup>        groups_;
  std::unordered_map<std::string, task::AttemptHandlePtr> running_;
  std::unordered_set<std::string>                         abandoned_;

  std::unordered_set<std::string> dirty_jobs_;
  std::unordered_set<std::string> dirty_groups_;

  uint64_t next_sequence_ = 1;
  bool     shutdown_      = false;

  // stats
  uint64_t submitted_ = 0;
  uint64_t completed_ = 0;
  uint64_t failed_    = 0;
  uint64_t canceled_  = 0;
  uint64_t retried_   = 0;

  uint64_t execution_count_    = 0;
  double   execution_total_ms_ = 0.0;
  double   execution_min_ms_   = 0.0;
  double   execution_max_ms_   = 0.0;
  uint64_t wait_count_         = 0;
  double   wait_total_ms_      = 0.0;

  std::chrono::steady_clock::time_point started_at_;
};

} // namespace batch::engine
