#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/engine/job_scheduler.hpp"
#include "internal/engine/worker_pool.hpp"
#include "internal/model/job.hpp"
#include "internal/model/job_group.hpp"
#include "internal/store/job_store.hpp"
#include "internal/task/task_registry.hpp"

namespace batch::engine {

struct EngineOptions {
  uint32_t                  max_workers    = 0; // 0 = hardware concurrency
  uint32_t                  max_queue_size = 1000;
  std::chrono::milliseconds poll_interval{100};
  model::RetryPolicy        default_retry;
  std::chrono::milliseconds default_timeout{0};
  bool                      recover_on_start = true;
};

struct JobSpec {
  std::string              task_name;
  google::protobuf::Struct args;
  model::Priority          priority = model::Priority::kNormal;
  std::vector<std::string> dependencies;

  // engine defaults apply when unset
  std::optional<model::RetryPolicy>        retry_policy;
  std::optional<std::chrono::milliseconds> timeout;

  std::string              name;
  std::vector<std::string> tags;
  google::protobuf::Struct metadata;
};

struct GroupSpec {
  std::string              name;
  std::string              description;
  google::protobuf::Struct metadata;
  bool                     sequential        = false;
  bool                     cancel_on_failure = false;
  bool                     skip_on_failure   = false;
};

/*
  Public face of the engine.

  Wires the task registry, scheduler, worker pool and job store together
  and runs crash recovery on Start().
*/
class JobEngine {
 public:
  JobEngine(EngineOptions options, std::shared_ptr<task::TaskRegistry> registry, std::shared_ptr<store::JobStore> store);
  ~JobEngine();

  JobEngine(const JobEngine&)            = delete;
  JobEngine& operator=(const JobEngine&) = delete;

  void Start();
  void Stop();

  void                     RegisterTask(const std::string& name, task::TaskFunction fn, bool overwrite = false);
  std::vector<std::string> TaskNames() const;

  std::string     CreateJob(JobSpec spec);
  model::JobState Submit(const std::string& job_id);

  std::string CreateGroup(GroupSpec spec);
  void        AddJobToGroup(const std::string& job_id, const std::string& group_id);

  model::JobState    Pause(const std::string& job_id);
  model::JobState    Resume(const std::string& job_id);
  model::JobState    Cancel(const std::string& job_id);
  model::GroupStatus CancelGroup(const std::string& group_id);
  model::JobState    SetPriority(const std::string& job_id, model::Priority priority);

  model::JobState    WaitForJob(const std::string& job_id, std::optional<std::chrono::milliseconds> timeout = std::nullopt);
  model::GroupStatus WaitForGroup(const std::string& group_id, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  // InvalidState unless the job Completed.
  google::protobuf::Value        GetResult(const std::string& job_id) const;
  std::optional<model::JobError> GetError(const std::string& job_id) const;
  model::JobStatus               GetStatus(const std::string& job_id) const;
  model::Job                     GetJob(const std::string& job_id) const;
  model::JobGroup                GetGroup(const std::string& group_id) const;
  model::GroupStatus             GetGroupStatus(const std::string& group_id) const;

  std::vector<model::Job> ListJobs(const JobFilter& filter = {}) const;
  EngineStats             Stats() const;
  std::size_t             ClearFinished(std::optional<model::JobState> state = std::nullopt);

  std::size_t WorkerCount() const {
    return workers_;
  }

  // 0 -> hardware concurrency; always within [1, 32].
  static std::size_t ResolveWorkerCount(uint32_t requested);

 private:
  EngineOptions                       options_;
  std::size_t                         workers_;
  std::shared_ptr<task::TaskRegistry> registry_;
  std::shared_ptr<store::JobStore>    store_;
  std::shared_ptr<JobScheduler>       scheduler_;
  std::unique_ptr<WorkerPool>         pool_;

  std::mutex lifecycle_mutex_;
  bool       started_ = false;
  bool       stopped_ = false;
};

} // namespace batch::engine
