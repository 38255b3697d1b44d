#include "internal/engine/job_scheduler.hpp"

#include <algorithm>

#include "internal/engine/retry_coordinator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace batch::engine {

using model::JobState;
using observability::IntField;
using observability::StringField;

namespace {

double ElapsedMs(util::TimePoint from, util::TimePoint to) {
  return std::chrono::duration<double, std::milli>(to - from).count();
}

} // namespace

JobScheduler::JobScheduler(SchedulerOptions options, std::shared_ptr<task::TaskRegistry> registry, std::shared_ptr<store::JobStore> store)
    : options_(options), registry_(std::move(registry)), store_(std::move(store)), started_at_(std::chrono::steady_clock::now()) {
  if (options_.max_workers == 0) {
    options_.max_workers = 1;
  }
}

// ---------------------------------------------------------------------
// Lookup / snapshots
// ---------------------------------------------------------------------

JobScheduler::Entry& JobScheduler::Lookup(const std::string& job_id) {
  auto it = jobs_.find(job_id);
  if (it == jobs_.end()) {
    throw util::NotFound("job not found: " + job_id);
  }
  return it->second;
}

const JobScheduler::Entry& JobScheduler::Lookup(const std::string& job_id) const {
  auto it = jobs_.find(job_id);
  if (it == jobs_.end()) {
    throw util::NotFound("job not found: " + job_id);
  }
  return it->second;
}

model::JobGroup& JobScheduler::LookupGroup(const std::string& group_id) {
  auto it = groups_.find(group_id);
  if (it == groups_.end()) {
    throw util::NotFound("group not found: " + group_id);
  }
  return it->second;
}

const model::JobGroup& JobScheduler::LookupGroup(const std::string& group_id) const {
  auto it = groups_.find(group_id);
  if (it == groups_.end()) {
    throw util::NotFound("group not found: " + group_id);
  }
  return it->second;
}

model::Job JobScheduler::Snapshot(const Entry& entry) const {
  model::Job job = entry.job;
  if (job.state == JobState::kRunning) {
    auto it = running_.find(job.id);
    if (it != running_.end()) {
      std::lock_guard lock(it->second->mutex);
      job.progress         = it->second->progress;
      job.progress_message = it->second->progress_message;
    }
  }
  return job;
}

model::GroupStatus JobScheduler::Summary(const model::JobGroup& group) const {
  std::vector<JobState> states;
  states.reserve(group.member_ids.size());
  for (const auto& id : group.member_ids) {
    auto it = jobs_.find(id);
    if (it != jobs_.end()) {
      states.push_back(it->second.job.state);
    }
  }
  return model::Summarize(group, states);
}

std::size_t JobScheduler::PendingCount() const {
  return static_cast<std::size_t>(std::count_if(jobs_.begin(), jobs_.end(), [](const auto& kv) {
    const auto state = kv.second.job.state;
    return state == JobState::kQueued || state == JobState::kWaiting || state == JobState::kPaused;
  }));
}

// ---------------------------------------------------------------------
// Eligibility
// ---------------------------------------------------------------------

JobScheduler::BlockCheck JobScheduler::CheckBlockers(const model::Job& job) const {
  BlockCheck check;

  for (const auto& dep_id : job.dependencies) {
    auto it = jobs_.find(dep_id);
    if (it == jobs_.end()) {
      return {false, true, "dependency missing: " + dep_id};
    }
    const auto state = it->second.job.state;
    if (state == JobState::kFailed || state == JobState::kCanceled) {
      return {false, true, "dependency " + dep_id + " ended " + std::string(model::ToString(state))};
    }
    if (state != JobState::kCompleted) {
      check.blocked = true;
    }
  }

  if (job.group_id.empty()) {
    return check;
  }
  auto git = groups_.find(job.group_id);
  if (git == groups_.end() || !git->second.sequential) {
    return check;
  }

  const auto& group = git->second;
  for (const auto& member_id : group.member_ids) {
    if (member_id == job.id) {
      break;
    }
    auto it = jobs_.find(member_id);
    if (it == jobs_.end()) {
      continue;
    }
    const auto state = it->second.job.state;
    if (state == JobState::kCompleted) {
      continue;
    }
    if (state == JobState::kFailed || state == JobState::kCanceled) {
      if (group.skip_on_failure) {
        continue;
      }
      return {false, true, "group predecessor " + member_id + " ended " + std::string(model::ToString(state))};
    }
    check.blocked = true;
  }
  return check;
}

// priority desc, then created_at, then submission sequence
bool JobScheduler::Precedes(const Entry& a, const Entry& b) const {
  if (a.job.priority != b.job.priority) {
    return a.job.priority > b.job.priority;
  }
  if (a.job.created_at != b.job.created_at) {
    return a.job.created_at < b.job.created_at;
  }
  return a.sequence < b.sequence;
}

// ---------------------------------------------------------------------
// Transitions
// ---------------------------------------------------------------------

void JobScheduler::Transition(Entry& entry, JobState to) {
  auto& job = entry.job;
  if (!model::CanTransition(job.state, to)) {
    throw util::InvalidState("job " + job.id + ": cannot move from " + std::string(model::ToString(job.state)) + " to " +
                             std::string(model::ToString(to)));
  }
  job.state = to;
  MarkDirty(entry);
}

void JobScheduler::Finish(Entry& entry, JobState terminal, std::optional<google::protobuf::Value> result, std::optional<model::JobError> error) {
  Transition(entry, terminal);

  auto& job           = entry.job;
  job.finished_at     = util::Now();
  job.next_attempt_at = std::nullopt;
  entry.pause_requested  = false;
  entry.cancel_requested = false;

  switch (terminal) {
    case JobState::kCompleted:
      job.result   = std::move(result);
      job.progress = 100.0;
      ++completed_;
      BATCH_LOG_INFO("Job completed", {StringField("job_id", job.id), StringField("task", job.task_name), IntField("attempts", job.attempt_count)});
      break;
    case JobState::kFailed:
      job.error = std::move(error);
      ++failed_;
      BATCH_LOG_WARN("Job failed", {StringField("job_id", job.id), StringField("task", job.task_name),
                                    StringField("kind", job.error ? model::ToString(job.error->kind) : "unknown"),
                                    StringField("error", job.error ? job.error->message : "")});
      break;
    case JobState::kCanceled:
      job.error = std::move(error);
      ++canceled_;
      BATCH_LOG_INFO("Job canceled", {StringField("job_id", job.id), StringField("reason", job.error ? job.error->message : "")});
      break;
    default:
      break;
  }
  observability::Metrics::Instance().RecordJobOutcome(job.task_name, model::ToString(terminal));

  if (terminal == JobState::kFailed && !job.group_id.empty()) {
    auto git = groups_.find(job.group_id);
    if (git != groups_.end() && git->second.cancel_on_failure) {
      CancelSiblings(git->second, job.id);
    }
  }
}

void JobScheduler::CancelEntry(Entry& entry, const model::JobError& reason) {
  const auto state = entry.job.state;
  if (model::IsTerminal(state)) {
    return;
  }
  if (state == JobState::kRunning) {
    entry.cancel_requested = true;
    auto it                = running_.find(entry.job.id);
    if (it != running_.end()) {
      it->second->token.Cancel();
    }
    BATCH_LOG_INFO("Cancel requested for running job", {StringField("job_id", entry.job.id)});
    return;
  }
  Finish(entry, JobState::kCanceled, std::nullopt, reason);
}

void JobScheduler::CancelSiblings(const model::JobGroup& group, const std::string& failed_job_id) {
  const model::JobError reason{model::ErrorKind::kCanceled, "group member " + failed_job_id + " failed"};
  for (const auto& member_id : group.member_ids) {
    if (member_id == failed_job_id) {
      continue;
    }
    auto it = jobs_.find(member_id);
    if (it != jobs_.end()) {
      CancelEntry(it->second, reason);
    }
  }
}

// Runs until no job changes: failed blockers cancel, cleared blockers
// release Waiting jobs, new blockers park Queued ones.
void JobScheduler::Reevaluate() {
  bool changed = true;
  while (changed) {
    changed = false;
    for (auto& [id, entry] : jobs_) {
      const auto state = entry.job.state;
      if (state != JobState::kQueued && state != JobState::kWaiting && state != JobState::kPaused) {
        continue;
      }

      auto check = CheckBlockers(entry.job);
      if (check.failed) {
        Finish(entry, JobState::kCanceled, std::nullopt, model::JobError{model::ErrorKind::kDependencyFailed, check.reason});
        changed = true;
        continue;
      }
      if (state == JobState::kPaused) {
        continue;
      }

      const auto target = check.blocked ? JobState::kWaiting : JobState::kQueued;
      if (target != state) {
        Transition(entry, target);
        changed = true;
      }
    }
  }
}

// ---------------------------------------------------------------------
// Dirty tracking / persistence
// ---------------------------------------------------------------------

void JobScheduler::MarkDirty(Entry& entry) {
  ++entry.job.version;
  dirty_jobs_.insert(entry.job.id);
}

void JobScheduler::MarkGroupDirty(model::JobGroup& group) {
  ++group.version;
  group.updated_at = util::Now();
  dirty_groups_.insert(group.id);
}

void JobScheduler::RefreshGroup(model::JobGroup& group) {
  const auto status = Summary(group);
  if (status.state != group.state || status.finished != group.finished) {
    if (status.finished && !group.finished) {
      observability::Metrics::Instance().RecordGroupOutcome(model::ToString(status.state));
    }
    group.state    = status.state;
    group.finished = status.finished;
    MarkGroupDirty(group);
  }
}

JobScheduler::PersistBatch JobScheduler::TakeDirty() {
  PersistBatch batch;

  for (const auto& id : dirty_jobs_) {
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
      continue;
    }
    if (!it->second.job.group_id.empty()) {
      auto git = groups_.find(it->second.job.group_id);
      if (git != groups_.end()) {
        RefreshGroup(git->second);
      }
    }
    batch.jobs.push_back(Snapshot(it->second));
  }
  for (const auto& id : dirty_groups_) {
    auto it = groups_.find(id);
    if (it != groups_.end()) {
      batch.groups.push_back(it->second);
    }
  }

  if (!dirty_jobs_.empty()) {
    observability::Metrics::Instance().SetQueueDepth(PendingCount());
  }
  dirty_jobs_.clear();
  dirty_groups_.clear();
  return batch;
}

void JobScheduler::Persist(const PersistBatch& batch, bool rethrow) {
  if (!store_ || (batch.jobs.empty() && batch.groups.empty())) {
    return;
  }
  try {
    store_->SaveAll(batch.jobs, batch.groups);
  } catch (const util::PersistenceError& e) {
    BATCH_LOG_ERROR("Failed to persist job state", {StringField("error", e.what()), IntField("jobs", static_cast<int64_t>(batch.jobs.size())),
                                                    IntField("groups", static_cast<int64_t>(batch.groups.size()))});
    if (rethrow) {
      throw;
    }
  }
}

// ---------------------------------------------------------------------
// Creation
// ---------------------------------------------------------------------

void JobScheduler::AddJob(model::Job job) {
  PersistBatch batch;
  {
    std::lock_guard lock(mutex_);
    if (jobs_.contains(job.id)) {
      throw util::AlreadyExists("job already exists: " + job.id);
    }

    std::vector<std::string> deps;
    for (const auto& dep : job.dependencies) {
      if (!jobs_.contains(dep)) {
        throw util::NotFound("dependency not found: " + dep);
      }
      if (std::find(deps.begin(), deps.end(), dep) == deps.end()) {
        deps.push_back(dep);
      }
    }
    job.dependencies = std::move(deps);
    job.state        = JobState::kCreated;
    job.group_id.clear();
    if (job.retry_policy.max_attempts == 0) {
      job.retry_policy.max_attempts = 1;
    }

    Entry entry;
    entry.job = std::move(job);
    auto& ref = jobs_.emplace(entry.job.id, std::move(entry)).first->second;
    MarkDirty(ref);
    batch = TakeDirty();
  }
  Persist(batch, false);
}

void JobScheduler::AddGroup(model::JobGroup group) {
  PersistBatch batch;
  {
    std::lock_guard lock(mutex_);
    if (groups_.contains(group.id)) {
      throw util::AlreadyExists("group already exists: " + group.id);
    }
    group.member_ids.clear();
    group.canceled = false;
    group.state    = model::GroupState::kCreated;
    group.finished = false;

    auto& ref = groups_.emplace(group.id, std::move(group)).first->second;
    MarkGroupDirty(ref);
    batch = TakeDirty();
  }
  Persist(batch, false);
}

// ---------------------------------------------------------------------
// Client operations
// ---------------------------------------------------------------------

JobState JobScheduler::Submit(const std::string& job_id) {
  PersistBatch batch;
  JobState     state;
  {
    std::lock_guard lock(mutex_);
    auto&           entry = Lookup(job_id);
    auto&           job   = entry.job;

    if (model::IsTerminal(job.state)) {
      return job.state;
    }
    if (job.state != JobState::kCreated) {
      throw util::InvalidState("job " + job_id + " already submitted (" + std::string(model::ToString(job.state)) + ")");
    }

    if (!registry_->Contains(job.task_name)) {
      ++submitted_;
      Finish(entry, JobState::kFailed, std::nullopt, model::JobError{model::ErrorKind::kUnknownTask, "unknown task: " + job.task_name});
    } else {
      if (options_.max_queue_size > 0 && PendingCount() >= options_.max_queue_size) {
        throw util::QueueFullError("queue is full (" + std::to_string(options_.max_queue_size) + " pending jobs)");
      }
      ++submitted_;
      job.queued_at  = util::Now();
      entry.sequence = next_sequence_++;
      Transition(entry, JobState::kQueued);
      BATCH_LOG_INFO("Job submitted", {StringField("job_id", job.id), StringField("task", job.task_name),
                                       StringField("priority", model::ToString(job.priority))});
    }
    // dependents of a job that failed on submit are canceled here
    Reevaluate();

    state = job.state;
    batch = TakeDirty();
  }
  work_cv_.notify_all();
  state_cv_.notify_all();

  Persist(batch, true);
  return state;
}

JobState JobScheduler::Pause(const std::string& job_id) {
  PersistBatch batch;
  JobState     state;
  {
    std::lock_guard lock(mutex_);
    auto&           entry = Lookup(job_id);

    switch (entry.job.state) {
      case JobState::kQueued:
      case JobState::kWaiting:
        Transition(entry, JobState::kPaused);
        BATCH_LOG_INFO("Job paused", {StringField("job_id", job_id)});
        break;
      case JobState::kRunning:
        entry.pause_requested = true;
        break;
      case JobState::kCreated:
        throw util::InvalidState("job " + job_id + " has not been submitted");
      default:
        break;
    }
    state = entry.job.state;
    batch = TakeDirty();
  }
  state_cv_.notify_all();

  Persist(batch, false);
  return state;
}

JobState JobScheduler::Resume(const std::string& job_id) {
  PersistBatch batch;
  JobState     state;
  {
    std::lock_guard lock(mutex_);
    auto&           entry = Lookup(job_id);

    switch (entry.job.state) {
      case JobState::kPaused:
        entry.job.queued_at = util::Now();
        Transition(entry, JobState::kQueued);
        BATCH_LOG_INFO("Job resumed", {StringField("job_id", job_id)});
        Reevaluate();
        break;
      case JobState::kRunning:
        entry.pause_requested = false;
        break;
      case JobState::kCreated:
        throw util::InvalidState("job " + job_id + " has not been submitted");
      default:
        break;
    }
    state = entry.job.state;
    batch = TakeDirty();
  }
  work_cv_.notify_all();
  state_cv_.notify_all();

  Persist(batch, false);
  return state;
}

JobState JobScheduler::Cancel(const std::string& job_id) {
  PersistBatch batch;
  JobState     state;
  {
    std::lock_guard lock(mutex_);
    auto&           entry = Lookup(job_id);

    CancelEntry(entry, model::JobError{model::ErrorKind::kCanceled, "canceled by request"});
    Reevaluate();
    state = entry.job.state;
    batch = TakeDirty();
  }
  work_cv_.notify_all();
  state_cv_.notify_all();

  Persist(batch, false);
  return state;
}

JobState JobScheduler::SetPriority(const std::string& job_id, model::Priority priority) {
  PersistBatch batch;
  JobState     state;
  {
    std::lock_guard lock(mutex_);
    auto&           entry = Lookup(job_id);

    if (entry.job.state == JobState::kRunning) {
      throw util::InvalidState("cannot change priority of running job " + job_id);
    }
    if (!model::IsTerminal(entry.job.state) && entry.job.priority != priority) {
      entry.job.priority = priority;
      MarkDirty(entry);
    }
    state = entry.job.state;
    batch = TakeDirty();
  }
  work_cv_.notify_all();

  Persist(batch, false);
  return state;
}

void JobScheduler::AddToGroup(const std::string& job_id, const std::string& group_id) {
  PersistBatch batch;
  {
    std::lock_guard lock(mutex_);
    auto&           entry = Lookup(job_id);
    auto&           group = LookupGroup(group_id);

    if (entry.job.group_id == group_id) {
      return;
    }
    if (!entry.job.group_id.empty()) {
      throw util::AlreadyExists("job " + job_id + " already belongs to group " + entry.job.group_id);
    }
    group.member_ids.push_back(job_id);
    entry.job.group_id = group_id;
    MarkDirty(entry);
    MarkGroupDirty(group);

    // Jobs may join in any state; Reevaluate parks a queued late member of
    // a sequential group behind the earlier ones.
    const bool member_failed = std::any_of(group.member_ids.begin(), group.member_ids.end(), [&](const std::string& id) {
      auto it = jobs_.find(id);
      return id != job_id && it != jobs_.end() && it->second.job.state == JobState::kFailed;
    });
    if (group.canceled) {
      CancelEntry(entry, model::JobError{model::ErrorKind::kCanceled, "group canceled"});
    } else if (group.cancel_on_failure && member_failed) {
      CancelEntry(entry, model::JobError{model::ErrorKind::kCanceled, "group has a failed member"});
    } else if (group.cancel_on_failure && entry.job.state == JobState::kFailed) {
      CancelSiblings(group, job_id);
    }
    Reevaluate();
    batch = TakeDirty();
  }
  work_cv_.notify_all();
  state_cv_.notify_all();

  Persist(batch, false);
}

model::GroupStatus JobScheduler::CancelGroup(const std::string& group_id) {
  PersistBatch       batch;
  model::GroupStatus status;
  {
    std::lock_guard lock(mutex_);
    auto&           group = LookupGroup(group_id);

    if (!Summary(group).finished || group.member_ids.empty()) {
      group.canceled = true;
      MarkGroupDirty(group);

      const model::JobError reason{model::ErrorKind::kCanceled, "group canceled"};
      for (const auto& member_id : group.member_ids) {
        auto it = jobs_.find(member_id);
        if (it != jobs_.end()) {
          CancelEntry(it->second, reason);
        }
      }
      Reevaluate();
      RefreshGroup(group);
      BATCH_LOG_INFO("Group canceled", {StringField("group_id", group_id), IntField("members", static_cast<int64_t>(group.member_ids.size()))});
    }
    status = Summary(group);
    batch  = TakeDirty();
  }
  work_cv_.notify_all();
  state_cv_.notify_all();

  Persist(batch, false);
  return status;
}

JobState JobScheduler::WaitForJob(const std::string& job_id, std::optional<std::chrono::milliseconds> timeout) {
  std::unique_lock lock(mutex_);
  Lookup(job_id);

  auto done = [&] {
    auto it = jobs_.find(job_id);
    return shutdown_ || it == jobs_.end() || model::IsTerminal(it->second.job.state);
  };
  if (timeout) {
    state_cv_.wait_for(lock, *timeout, done);
  } else {
    state_cv_.wait(lock, done);
  }
  return Lookup(job_id).job.state;
}

model::GroupStatus JobScheduler::WaitForGroup(const std::string& group_id, std::optional<std::chrono::milliseconds> timeout) {
  std::unique_lock lock(mutex_);
  LookupGroup(group_id);

  auto done = [&] {
    auto it = groups_.find(group_id);
    return shutdown_ || it == groups_.end() || Summary(it->second).finished;
  };
  if (timeout) {
    state_cv_.wait_for(lock, *timeout, done);
  } else {
    state_cv_.wait(lock, done);
  }
  return Summary(LookupGroup(group_id));
}

// ---------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------

model::Job JobScheduler::GetJob(const std::string& job_id) const {
  std::lock_guard lock(mutex_);
  return Snapshot(Lookup(job_id));
}

model::JobStatus JobScheduler::GetStatus(const std::string& job_id) const {
  std::lock_guard lock(mutex_);
  return model::StatusOf(Snapshot(Lookup(job_id)));
}

model::JobGroup JobScheduler::GetGroup(const std::string& group_id) const {
  std::lock_guard lock(mutex_);
  return LookupGroup(group_id);
}

model::GroupStatus JobScheduler::GetGroupStatus(const std::string& group_id) const {
  std::lock_guard lock(mutex_);
  return Summary(LookupGroup(group_id));
}

std::vector<model::Job> JobScheduler::ListJobs(const JobFilter& filter) const {
  std::vector<const Entry*> matches;
  std::vector<model::Job>   out;

  std::lock_guard lock(mutex_);
  for (const auto& [id, entry] : jobs_) {
    const auto& job = entry.job;
    if (filter.state && job.state != *filter.state) continue;
    if (!filter.group_id.empty() && job.group_id != filter.group_id) continue;
    if (!filter.tag.empty() && std::find(job.tags.begin(), job.tags.end(), filter.tag) == job.tags.end()) continue;
    matches.push_back(&entry);
  }
  std::sort(matches.begin(), matches.end(), [](const Entry* a, const Entry* b) {
    if (a->job.created_at != b->job.created_at) return a->job.created_at < b->job.created_at;
    return a->job.id < b->job.id;
  });

  out.reserve(matches.size());
  for (const auto* entry : matches) {
    out.push_back(Snapshot(*entry));
  }
  return out;
}

EngineStats JobScheduler::Stats() const {
  std::lock_guard lock(mutex_);

  EngineStats stats;
  stats.submitted   = submitted_;
  stats.completed   = completed_;
  stats.failed      = failed_;
  stats.canceled    = canceled_;
  stats.retried     = retried_;
  stats.queue_depth = PendingCount();
  stats.running     = running_.size();
  stats.workers     = options_.max_workers;

  if (execution_count_ > 0) {
    stats.avg_execution_ms = execution_total_ms_ / static_cast<double>(execution_count_);
    stats.min_execution_ms = execution_min_ms_;
    stats.max_execution_ms = execution_max_ms_;
  }
  if (wait_count_ > 0) {
    stats.avg_queue_wait_ms = wait_total_ms_ / static_cast<double>(wait_count_);
  }
  stats.uptime_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_).count();
  return stats;
}

std::size_t JobScheduler::ClearFinished(std::optional<JobState> state) {
  std::vector<std::string> removed;
  {
    std::lock_guard lock(mutex_);

    std::unordered_set<std::string> referenced;
    for (const auto& [id, entry] : jobs_) {
      if (model::IsTerminal(entry.job.state)) continue;
      referenced.insert(entry.job.dependencies.begin(), entry.job.dependencies.end());
    }

    for (auto it = jobs_.begin(); it != jobs_.end();) {
      const auto& job = it->second.job;
      const bool  eligible =
          model::IsTerminal(job.state) && (!state || job.state == *state) && job.group_id.empty() && !referenced.contains(job.id);
      if (eligible) {
        removed.push_back(job.id);
        dirty_jobs_.erase(job.id);
        it = jobs_.erase(it);
      } else {
        ++it;
      }
    }
  }

  if (store_ && !removed.empty()) {
    try {
      store_->RemoveAll(removed);
    } catch (const util::PersistenceError& e) {
      BATCH_LOG_ERROR("Failed to remove cleared jobs", {StringField("error", e.what())});
    }
  }
  BATCH_LOG_INFO("Cleared finished jobs", {IntField("count", static_cast<int64_t>(removed.size()))});
  return removed.size();
}

// ---------------------------------------------------------------------
// Recovery
// ---------------------------------------------------------------------

void JobScheduler::Restore(store::PendingSet pending, const JobLoader& load_job, const GroupLoader& load_group) {
  PersistBatch batch;
  std::size_t  interrupted = 0;
  {
    std::lock_guard lock(mutex_);

    for (auto& group : pending.groups) {
      groups_.try_emplace(group.id, std::move(group));
    }

    std::vector<std::string> restored;
    for (auto& job : pending.jobs) {
      if (jobs_.contains(job.id)) continue;
      Entry entry;
      entry.job = std::move(job);
      if (entry.job.state != JobState::kCreated) {
        entry.sequence = next_sequence_++;
      }
      restored.push_back(entry.job.id);
      jobs_.emplace(entry.job.id, std::move(entry));
    }

    // Finished dependencies and group members are not part of the pending
    // set; pull them in individually so blockers resolve correctly.
    auto ensure_job = [&](const std::string& id) {
      if (jobs_.contains(id) || !load_job) return;
      if (auto loaded = load_job(id)) {
        Entry entry;
        entry.job = std::move(*loaded);
        jobs_.emplace(id, std::move(entry));
      }
    };

    for (const auto& id : restored) {
      const auto deps = jobs_.at(id).job.dependencies;
      for (const auto& dep : deps) ensure_job(dep);

      auto& job = jobs_.at(id).job;
      if (!job.group_id.empty() && !groups_.contains(job.group_id)) {
        std::optional<model::JobGroup> group;
        if (load_group) group = load_group(job.group_id);
        if (group) {
          groups_.emplace(group->id, std::move(*group));
        } else {
          BATCH_LOG_WARN("Restored job references unknown group", {StringField("job_id", id), StringField("group_id", job.group_id)});
          job.group_id.clear();
          MarkDirty(jobs_.at(id));
        }
      }
    }

    for (auto& [group_id, group] : groups_) {
      for (const auto& member_id : group.member_ids) ensure_job(member_id);
      auto& members = group.member_ids;
      auto  missing = std::remove_if(members.begin(), members.end(), [&](const std::string& id) { return !jobs_.contains(id); });
      if (missing != members.end()) {
        members.erase(missing, members.end());
        MarkGroupDirty(group);
      }
    }

    for (const auto& id : restored) {
      auto& entry = jobs_.at(id);
      auto& job   = entry.job;
      if (job.state == JobState::kQueued && job.attempt_count >= job.retry_policy.max_attempts) {
        Finish(entry, JobState::kFailed, std::nullopt, model::JobError{model::ErrorKind::kInterrupted, "attempt interrupted by restart"});
        ++interrupted;
      }
    }

    Reevaluate();
    for (auto& [group_id, group] : groups_) RefreshGroup(group);
    batch = TakeDirty();

    BATCH_LOG_INFO("Recovered jobs", {IntField("jobs", static_cast<int64_t>(restored.size())), IntField("groups", static_cast<int64_t>(groups_.size())),
                                      IntField("interrupted", static_cast<int64_t>(interrupted))});
  }
  work_cv_.notify_all();
  state_cv_.notify_all();

  Persist(batch, false);
}

// ---------------------------------------------------------------------
// Worker-facing
// ---------------------------------------------------------------------

std::optional<Dispatch> JobScheduler::Dequeue() {
  std::optional<Dispatch> dispatch;
  PersistBatch            batch;
  {
    std::unique_lock lock(mutex_);

    while (!dispatch) {
      if (shutdown_) {
        return std::nullopt;
      }

      const auto                     now = util::Now();
      std::optional<util::TimePoint> earliest_gate;

      if (running_.size() + abandoned_.size() < options_.max_workers) {
        Entry* best = nullptr;
        for (auto& [id, entry] : jobs_) {
          if (entry.job.state != JobState::kQueued) continue;
          if (abandoned_.contains(id)) continue;
          if (entry.job.next_attempt_at && *entry.job.next_attempt_at > now) {
            if (!earliest_gate || *entry.job.next_attempt_at < *earliest_gate) earliest_gate = entry.job.next_attempt_at;
            continue;
          }
          if (CheckBlockers(entry.job).blocked) continue;
          if (!best || Precedes(entry, *best)) best = &entry;
        }

        if (best) {
          auto& job = best->job;
          Transition(*best, JobState::kRunning);
          ++job.attempt_count;
          job.started_at      = now;
          job.next_attempt_at = std::nullopt;
          if (job.queued_at) {
            wait_total_ms_ += ElapsedMs(*job.queued_at, now);
            ++wait_count_;
          }

          auto handle              = std::make_shared<task::AttemptHandle>();
          handle->job_id           = job.id;
          handle->attempt          = job.attempt_count;
          handle->progress         = job.progress;
          handle->progress_message = job.progress_message;
          running_[job.id]         = handle;

          BATCH_LOG_DEBUG("Job started", {StringField("job_id", job.id), StringField("task", job.task_name), IntField("attempt", job.attempt_count)});
          dispatch = Dispatch{job, handle};
          batch    = TakeDirty();
          break;
        }
      }

      auto deadline = std::chrono::system_clock::now() + options_.poll_interval;
      if (earliest_gate && *earliest_gate < deadline) {
        deadline = *earliest_gate;
      }
      work_cv_.wait_until(lock, deadline);
    }
  }
  state_cv_.notify_all();

  Persist(batch, false);
  return dispatch;
}

void JobScheduler::ReportOutcome(const std::string& job_id, AttemptResult result) {
  PersistBatch batch;
  {
    std::lock_guard lock(mutex_);
    auto            it = jobs_.find(job_id);
    if (it == jobs_.end() || it->second.job.state != JobState::kRunning) {
      BATCH_LOG_WARN("Outcome reported for job that is not running", {StringField("job_id", job_id)});
      return;
    }
    auto& entry = it->second;
    auto& job   = entry.job;
    const auto now = util::Now();

    if (auto rit = running_.find(job_id); rit != running_.end()) {
      std::lock_guard handle_lock(rit->second->mutex);
      job.progress         = rit->second->progress;
      job.progress_message = rit->second->progress_message;
    }
    running_.erase(job_id);

    if (job.started_at) {
      const auto elapsed = ElapsedMs(*job.started_at, now);
      execution_min_ms_  = execution_count_ == 0 ? elapsed : std::min(execution_min_ms_, elapsed);
      execution_max_ms_  = execution_count_ == 0 ? elapsed : std::max(execution_max_ms_, elapsed);
      execution_total_ms_ += elapsed;
      ++execution_count_;
      observability::Metrics::Instance().ObserveJobDurationMs(job.task_name, elapsed);
    }

    if (result.value) {
      // A returned value wins over a late cancel request.
      Finish(entry, JobState::kCompleted, std::move(result.value), std::nullopt);
    } else {
      auto error = result.error.value_or(model::JobError{model::ErrorKind::kTaskExecution, "attempt produced no result"});
      job.last_error = error;

      if (entry.cancel_requested || error.kind == model::ErrorKind::kCanceled) {
        Finish(entry, JobState::kCanceled, std::nullopt, model::JobError{model::ErrorKind::kCanceled, error.message});
      } else if (auto decision = RetryCoordinator::Decide(job, error); decision.retry) {
        ++retried_;
        job.next_attempt_at = now + decision.delay;
        job.queued_at       = now;
        if (entry.pause_requested) {
          entry.pause_requested = false;
          Transition(entry, JobState::kPaused);
        } else {
          Transition(entry, JobState::kQueued);
        }
        observability::Metrics::Instance().RecordJobOutcome(job.task_name, "retried");
        BATCH_LOG_WARN("Job attempt failed, retrying", {StringField("job_id", job.id), IntField("attempt", job.attempt_count),
                                                        IntField("max_attempts", job.retry_policy.max_attempts),
                                                        IntField("delay_ms", decision.delay.count()), StringField("error", error.message)});
      } else {
        Finish(entry, JobState::kFailed, std::nullopt, error);
      }
    }

    Reevaluate();
    batch = TakeDirty();
  }
  work_cv_.notify_all();
  state_cv_.notify_all();

  Persist(batch, false);
}

void JobScheduler::HoldAbandoned(const std::string& job_id) {
  std::lock_guard lock(mutex_);
  abandoned_.insert(job_id);
}

void JobScheduler::ReleaseAbandoned(const std::string& job_id) {
  {
    std::lock_guard lock(mutex_);
    abandoned_.erase(job_id);
  }
  work_cv_.notify_all();
}

void JobScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  work_cv_.notify_all();
  state_cv_.notify_all();
}

} // namespace batch::engine
