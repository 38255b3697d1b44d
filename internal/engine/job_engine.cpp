#include "internal/engine/job_engine.hpp"

#include <algorithm>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace batch::engine {

namespace {

constexpr std::size_t kMaxWorkers = 32;

} // namespace

std::size_t JobEngine::ResolveWorkerCount(uint32_t requested) {
  std::size_t count = requested;
  if (count == 0) {
    count = std::thread::hardware_concurrency();
  }
  return std::clamp<std::size_t>(count, 1, kMaxWorkers);
}

JobEngine::JobEngine(EngineOptions options, std::shared_ptr<task::TaskRegistry> registry, std::shared_ptr<store::JobStore> store)
    : options_(std::move(options)),
      workers_(ResolveWorkerCount(options_.max_workers)),
      registry_(std::move(registry)),
      store_(std::move(store)) {
  if (!registry_) {
    throw std::invalid_argument("job engine requires a task registry");
  }

  SchedulerOptions scheduler_options;
  scheduler_options.max_workers    = workers_;
  scheduler_options.max_queue_size = options_.max_queue_size;
  scheduler_options.poll_interval  = options_.poll_interval.count() > 0 ? options_.poll_interval : std::chrono::milliseconds(100);

  scheduler_ = std::make_shared<JobScheduler>(scheduler_options, registry_, store_);
  pool_      = std::make_unique<WorkerPool>(workers_, scheduler_, registry_);
}

JobEngine::~JobEngine() {
  Stop();
}

void JobEngine::Start() {
  std::lock_guard lock(lifecycle_mutex_);
  if (started_ || stopped_) {
    return;
  }

  if (options_.recover_on_start && store_) {
    auto pending = store_->LoadAllPending();
    scheduler_->Restore(
        std::move(pending), [this](const std::string& id) { return store_->Load(id); },
        [this](const std::string& id) { return store_->LoadGroup(id); });
  }

  pool_->Start();
  started_ = true;
  BATCH_LOG_INFO("Job engine started", {observability::IntField("workers", static_cast<int64_t>(workers_)),
                                        observability::IntField("max_queue_size", options_.max_queue_size)});
}

void JobEngine::Stop() {
  std::lock_guard lock(lifecycle_mutex_);
  if (stopped_) {
    return;
  }
  stopped_ = true;
  pool_->Stop();
  if (started_) {
    BATCH_LOG_INFO("Job engine stopped");
  }
}

void JobEngine::RegisterTask(const std::string& name, task::TaskFunction fn, bool overwrite) {
  registry_->Register(name, std::move(fn), overwrite);
}

std::vector<std::string> JobEngine::TaskNames() const {
  return registry_->Names();
}

std::string JobEngine::CreateJob(JobSpec spec) {
  if (spec.task_name.empty()) {
    throw std::invalid_argument("task_name is required");
  }

  model::Job job;
  job.id           = util::NewId();
  job.name         = spec.name.empty() ? "job_" + job.id.substr(0, 8) : std::move(spec.name);
  job.task_name    = std::move(spec.task_name);
  job.args         = std::move(spec.args);
  job.priority     = spec.priority;
  job.dependencies = std::move(spec.dependencies);
  job.retry_policy = spec.retry_policy.value_or(options_.default_retry);
  job.timeout      = spec.timeout.value_or(options_.default_timeout);
  job.tags         = std::move(spec.tags);
  job.metadata     = std::move(spec.metadata);
  job.created_at   = util::Now();

  auto id = job.id;
  scheduler_->AddJob(std::move(job));
  return id;
}

model::JobState JobEngine::Submit(const std::string& job_id) {
  return scheduler_->Submit(job_id);
}

std::string JobEngine::CreateGroup(GroupSpec spec) {
  model::JobGroup group;
  group.id                = util::NewId();
  group.name              = spec.name.empty() ? "group_" + group.id.substr(0, 8) : std::move(spec.name);
  group.description       = std::move(spec.description);
  group.metadata          = std::move(spec.metadata);
  group.sequential        = spec.sequential;
  group.cancel_on_failure = spec.cancel_on_failure;
  group.skip_on_failure   = spec.skip_on_failure;
  group.created_at        = util::Now();
  group.updated_at        = group.created_at;

  auto id = group.id;
  scheduler_->AddGroup(std::move(group));
  return id;
}

void JobEngine::AddJobToGroup(const std::string& job_id, const std::string& group_id) {
  scheduler_->AddToGroup(job_id, group_id);
}

model::JobState JobEngine::Pause(const std::string& job_id) {
  return scheduler_->Pause(job_id);
}

model::JobState JobEngine::Resume(const std::string& job_id) {
  return scheduler_->Resume(job_id);
}

model::JobState JobEngine::Cancel(const std::string& job_id) {
  return scheduler_->Cancel(job_id);
}

model::GroupStatus JobEngine::CancelGroup(const std::string& group_id) {
  return scheduler_->CancelGroup(group_id);
}

model::JobState JobEngine::SetPriority(const std::string& job_id, model::Priority priority) {
  return scheduler_->SetPriority(job_id, priority);
}

model::JobState JobEngine::WaitForJob(const std::string& job_id, std::optional<std::chrono::milliseconds> timeout) {
  return scheduler_->WaitForJob(job_id, timeout);
}

model::GroupStatus JobEngine::WaitForGroup(const std::string& group_id, std::optional<std::chrono::milliseconds> timeout) {
  return scheduler_->WaitForGroup(group_id, timeout);
}

google::protobuf::Value JobEngine::GetResult(const std::string& job_id) const {
  auto job = scheduler_->GetJob(job_id);
  if (job.state != model::JobState::kCompleted || !job.result) {
    throw util::InvalidState("job " + job_id + " has no result (" + std::string(model::ToString(job.state)) + ")");
  }
  return *job.result;
}

std::optional<model::JobError> JobEngine::GetError(const std::string& job_id) const {
  return scheduler_->GetJob(job_id).error;
}

model::JobStatus JobEngine::GetStatus(const std::string& job_id) const {
  return scheduler_->GetStatus(job_id);
}

model::Job JobEngine::GetJob(const std::string& job_id) const {
  return scheduler_->GetJob(job_id);
}

model::JobGroup JobEngine::GetGroup(const std::string& group_id) const {
  return scheduler_->GetGroup(group_id);
}

model::GroupStatus JobEngine::GetGroupStatus(const std::string& group_id) const {
  return scheduler_->GetGroupStatus(group_id);
}

std::vector<model::Job> JobEngine::ListJobs(const JobFilter& filter) const {
  return scheduler_->ListJobs(filter);
}

EngineStats JobEngine::Stats() const {
  return scheduler_->Stats();
}

std::size_t JobEngine::ClearFinished(std::optional<model::JobState> state) {
  return scheduler_->ClearFinished(state);
}

} // namespace batch::engine
