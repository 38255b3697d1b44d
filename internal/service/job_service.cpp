#include "job_service.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/engine/job_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/util/time.hpp"

namespace batch::service {

using namespace batch::engine::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  batch::observability::SpanScope span(route);
  const auto                      started_at = std::chrono::steady_clock::now();

  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      batch::observability::Metrics::Instance().RecordRequest(route, true);
      batch::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      batch::observability::Metrics::Instance().RecordRequest(route, true);
      batch::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    BATCH_LOG_ERROR("RPC failed", {batch::observability::StringField("route", route), batch::observability::StringField("error", ex.what())});
    batch::observability::Metrics::Instance().RecordRequest(route, false);
    batch::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

model::Priority FromProto(JobPriority priority) {
  switch (priority) {
    case JOB_PRIORITY_UNSPECIFIED:
    case JOB_PRIORITY_NORMAL:
      return model::Priority::kNormal;
    case JOB_PRIORITY_LOW:
      return model::Priority::kLow;
    case JOB_PRIORITY_HIGH:
      return model::Priority::kHigh;
    case JOB_PRIORITY_CRITICAL:
      return model::Priority::kCritical;
    default:
      throw std::invalid_argument("invalid job priority: " + std::to_string(static_cast<int>(priority)));
  }
}

JobPriority ToProto(model::Priority priority) {
  return static_cast<JobPriority>(static_cast<int>(priority) + 1);
}

std::optional<model::JobState> FromProto(JobState state) {
  if (state == JOB_STATE_UNSPECIFIED) {
    return std::nullopt;
  }
  if (state < JOB_STATE_CREATED || state > JOB_STATE_CANCELED) {
    throw std::invalid_argument("invalid job state: " + std::to_string(static_cast<int>(state)));
  }
  return static_cast<model::JobState>(state);
}

JobState ToProto(model::JobState state) {
  return static_cast<JobState>(state);
}

GroupState ToProto(model::GroupState state) {
  return static_cast<GroupState>(state);
}

void FillError(const model::JobError& error, batch::engine::v1::JobError* out) {
  out->set_kind(static_cast<ErrorKind>(error.kind));
  out->set_message(error.message);
}

void FillJob(const model::Job& job, JobInfo* out) {
  out->set_id(job.id);
  out->set_name(job.name);
  out->set_task_name(job.task_name);
  *out->mutable_args() = job.args;
  out->set_priority(ToProto(job.priority));
  for (const auto& dep : job.dependencies) {
    out->add_dependencies(dep);
  }
  out->set_state(ToProto(job.state));

  auto* policy = out->mutable_retry_policy();
  policy->set_max_attempts(job.retry_policy.max_attempts);
  policy->set_base_delay_ms(static_cast<uint64_t>(job.retry_policy.base_delay.count()));
  policy->set_multiplier(job.retry_policy.multiplier);
  policy->set_max_delay_ms(static_cast<uint64_t>(job.retry_policy.max_delay.count()));

  out->set_timeout_ms(static_cast<uint64_t>(job.timeout.count()));
  out->set_attempt_count(job.attempt_count);

  if (job.result) {
    *out->mutable_result() = *job.result;
  }
  if (job.error) {
    FillError(*job.error, out->mutable_error());
  }
  if (job.last_error) {
    FillError(*job.last_error, out->mutable_last_error());
  }

  out->set_group_id(job.group_id);
  for (const auto& tag : job.tags) {
    out->add_tags(tag);
  }
  *out->mutable_metadata() = job.metadata;

  out->set_progress(job.progress);
  out->set_progress_message(job.progress_message);

  *out->mutable_created_at() = util::ToProto(job.created_at);
  if (job.queued_at) {
    *out->mutable_queued_at() = util::ToProto(*job.queued_at);
  }
  if (job.started_at) {
    *out->mutable_started_at() = util::ToProto(*job.started_at);
  }
  if (job.finished_at) {
    *out->mutable_finished_at() = util::ToProto(*job.finished_at);
  }
}

void FillGroup(const model::JobGroup& group, const model::GroupStatus& status, GroupInfo* out) {
  out->set_id(group.id);
  out->set_name(group.name);
  out->set_description(group.description);
  out->set_sequential(group.sequential);
  out->set_cancel_on_failure(group.cancel_on_failure);
  out->set_skip_on_failure(group.skip_on_failure);
  for (const auto& member : group.member_ids) {
    out->add_member_ids(member);
  }

  out->set_state(ToProto(status.state));
  out->set_finished(status.finished);
  out->set_total(status.total);
  out->set_completed(status.completed);
  out->set_failed(status.failed);
  out->set_canceled(status.canceled);
  out->set_active(status.active);
  out->set_progress(status.progress);
}

JobStateResponse StateResponse(const std::string& job_id, model::JobState state) {
  JobStateResponse resp;
  resp.set_job_id(job_id);
  resp.set_state(ToProto(state));
  return resp;
}

void RequireId(std::string_view field, const std::string& value) {
  if (value.empty()) {
    throw std::invalid_argument(std::string(field) + " is required");
  }
}

} // namespace

JobService::JobService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.engine) {
    throw std::invalid_argument("JobService requires an engine");
  }
}

CreateJobResponse JobService::CreateJob(const CreateJobRequest& req) {
  return ObserveRpc("CreateJob", [&] {
    engine::JobSpec spec;
    spec.task_name = req.task_name();
    spec.args      = req.args();
    spec.priority  = FromProto(req.priority());
    spec.dependencies.assign(req.dependencies().begin(), req.dependencies().end());
    if (req.has_retry_policy()) {
      const auto&        in = req.retry_policy();
      model::RetryPolicy policy;
      policy.max_attempts = in.max_attempts();
      policy.base_delay   = std::chrono::milliseconds(in.base_delay_ms());
      policy.multiplier   = in.multiplier();
      policy.max_delay    = std::chrono::milliseconds(in.max_delay_ms());
      spec.retry_policy   = policy;
    }
    if (req.timeout_ms() > 0) {
      spec.timeout = std::chrono::milliseconds(req.timeout_ms());
    }
    spec.name = req.name();
    spec.tags.assign(req.tags().begin(), req.tags().end());
    spec.metadata = req.metadata();

    const auto job_id = ctx_.engine->CreateJob(std::move(spec));
    if (!req.group_id().empty()) {
      ctx_.engine->AddJobToGroup(job_id, req.group_id());
    }

    CreateJobResponse resp;
    resp.set_job_id(job_id);
    resp.set_state(ToProto(req.submit() ? ctx_.engine->Submit(job_id) : ctx_.engine->GetStatus(job_id).state));
    return resp;
  });
}

JobStateResponse JobService::SubmitJob(const JobRequest& req) {
  return ObserveRpc("SubmitJob", [&] {
    RequireId("job_id", req.job_id());
    return StateResponse(req.job_id(), ctx_.engine->Submit(req.job_id()));
  });
}

JobStateResponse JobService::PauseJob(const JobRequest& req) {
  return ObserveRpc("PauseJob", [&] {
    RequireId("job_id", req.job_id());
    return StateResponse(req.job_id(), ctx_.engine->Pause(req.job_id()));
  });
}

JobStateResponse JobService::ResumeJob(const JobRequest& req) {
  return ObserveRpc("ResumeJob", [&] {
    RequireId("job_id", req.job_id());
    return StateResponse(req.job_id(), ctx_.engine->Resume(req.job_id()));
  });
}

JobStateResponse JobService::CancelJob(const JobRequest& req) {
  return ObserveRpc("CancelJob", [&] {
    RequireId("job_id", req.job_id());
    return StateResponse(req.job_id(), ctx_.engine->Cancel(req.job_id()));
  });
}

JobStateResponse JobService::SetJobPriority(const SetJobPriorityRequest& req) {
  return ObserveRpc("SetJobPriority", [&] {
    RequireId("job_id", req.job_id());
    return StateResponse(req.job_id(), ctx_.engine->SetPriority(req.job_id(), FromProto(req.priority())));
  });
}

GetJobResponse JobService::GetJob(const JobRequest& req) {
  return ObserveRpc("GetJob", [&] {
    RequireId("job_id", req.job_id());
    GetJobResponse resp;
    FillJob(ctx_.engine->GetJob(req.job_id()), resp.mutable_job());
    return resp;
  });
}

ListJobsResponse JobService::ListJobs(const ListJobsRequest& req) {
  return ObserveRpc("ListJobs", [&] {
    engine::JobFilter filter;
    filter.state    = FromProto(req.state());
    filter.group_id = req.group_id();
    filter.tag      = req.tag();

    ListJobsResponse resp;
    for (const auto& job : ctx_.engine->ListJobs(filter)) {
      FillJob(job, resp.add_jobs());
    }
    return resp;
  });
}

GetJobResponse JobService::WaitForJob(const WaitForJobRequest& req) {
  return ObserveRpc("WaitForJob", [&] {
    RequireId("job_id", req.job_id());
    std::optional<std::chrono::milliseconds> timeout;
    if (req.timeout_ms() > 0) {
      timeout = std::chrono::milliseconds(req.timeout_ms());
    }
    ctx_.engine->WaitForJob(req.job_id(), timeout);

    GetJobResponse resp;
    FillJob(ctx_.engine->GetJob(req.job_id()), resp.mutable_job());
    return resp;
  });
}

CreateGroupResponse JobService::CreateGroup(const CreateGroupRequest& req) {
  return ObserveRpc("CreateGroup", [&] {
    engine::GroupSpec spec;
    spec.name              = req.name();
    spec.description       = req.description();
    spec.metadata          = req.metadata();
    spec.sequential        = req.sequential();
    spec.cancel_on_failure = req.cancel_on_failure();
    spec.skip_on_failure   = req.skip_on_failure();

    CreateGroupResponse resp;
    resp.set_group_id(ctx_.engine->CreateGroup(std::move(spec)));
    return resp;
  });
}

GroupResponse JobService::AddJobToGroup(const AddJobToGroupRequest& req) {
  return ObserveRpc("AddJobToGroup", [&] {
    RequireId("job_id", req.job_id());
    RequireId("group_id", req.group_id());
    ctx_.engine->AddJobToGroup(req.job_id(), req.group_id());

    GroupResponse resp;
    FillGroup(ctx_.engine->GetGroup(req.group_id()), ctx_.engine->GetGroupStatus(req.group_id()), resp.mutable_group());
    return resp;
  });
}

GroupResponse JobService::CancelGroup(const GroupRequest& req) {
  return ObserveRpc("CancelGroup", [&] {
    RequireId("group_id", req.group_id());
    const auto status = ctx_.engine->CancelGroup(req.group_id());

    GroupResponse resp;
    FillGroup(ctx_.engine->GetGroup(req.group_id()), status, resp.mutable_group());
    return resp;
  });
}

GroupResponse JobService::GetGroup(const GroupRequest& req) {
  return ObserveRpc("GetGroup", [&] {
    RequireId("group_id", req.group_id());
    GroupResponse resp;
    FillGroup(ctx_.engine->GetGroup(req.group_id()), ctx_.engine->GetGroupStatus(req.group_id()), resp.mutable_group());
    return resp;
  });
}

GroupResponse JobService::WaitForGroup(const WaitForGroupRequest& req) {
  return ObserveRpc("WaitForGroup", [&] {
    RequireId("group_id", req.group_id());
    std::optional<std::chrono::milliseconds> timeout;
    if (req.timeout_ms() > 0) {
      timeout = std::chrono::milliseconds(req.timeout_ms());
    }
    const auto status = ctx_.engine->WaitForGroup(req.group_id(), timeout);

    GroupResponse resp;
    FillGroup(ctx_.engine->GetGroup(req.group_id()), status, resp.mutable_group());
    return resp;
  });
}

ListTasksResponse JobService::ListTasks(const ListTasksRequest&) {
  return ObserveRpc("ListTasks", [&] {
    ListTasksResponse resp;
    for (const auto& name : ctx_.engine->TaskNames()) {
      resp.add_names(name);
    }
    return resp;
  });
}

StatsResponse JobService::Stats(const StatsRequest&) {
  return ObserveRpc("Stats", [&] {
    const auto stats = ctx_.engine->Stats();

    StatsResponse resp;
    auto*         out = resp.mutable_stats();
    out->set_submitted(stats.submitted);
    out->set_completed(stats.completed);
    out->set_failed(stats.failed);
    out->set_canceled(stats.canceled);
    out->set_retried(stats.retried);
    out->set_queue_depth(stats.queue_depth);
    out->set_running(stats.running);
    out->set_workers(stats.workers);
    out->set_avg_execution_ms(stats.avg_execution_ms);
    out->set_min_execution_ms(stats.min_execution_ms);
    out->set_max_execution_ms(stats.max_execution_ms);
    out->set_avg_queue_wait_ms(stats.avg_queue_wait_ms);
    out->set_uptime_seconds(stats.uptime_seconds);
    return resp;
  });
}

ClearFinishedResponse JobService::ClearFinished(const ClearFinishedRequest& req) {
  return ObserveRpc("ClearFinished", [&] {
    const auto state = FromProto(req.state());
    if (state && !model::IsTerminal(*state)) {
      throw std::invalid_argument("clear_finished requires a terminal state");
    }

    ClearFinishedResponse resp;
    resp.set_cleared(ctx_.engine->ClearFinished(state));
    return resp;
  });
}

} // namespace batch::service
