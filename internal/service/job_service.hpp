#pragma once

#include "batch/engine/v1.hpp"
#include "service_context.hpp"

namespace batch::service {

/*
  Protocol-facing job operations.

  Translates batch.engine.v1 messages to engine calls and back. Every call
  is traced, counted and logged on failure; engine exceptions propagate to
  the transport adapter unchanged.
*/
class JobService {
 public:
  explicit JobService(ServiceContext ctx);

  batch::engine::v1::CreateJobResponse CreateJob(const batch::engine::v1::CreateJobRequest& req);
  batch::engine::v1::JobStateResponse  SubmitJob(const batch::engine::v1::JobRequest& req);
  batch::engine::v1::JobStateResponse  PauseJob(const batch::engine::v1::JobRequest& req);
  batch::engine::v1::JobStateResponse  ResumeJob(const batch::engine::v1::JobRequest& req);
  batch::engine::v1::JobStateResponse  CancelJob(const batch::engine::v1::JobRequest& req);
  batch::engine::v1::JobStateResponse  SetJobPriority(const batch::engine::v1::SetJobPriorityRequest& req);
  batch::engine::v1::GetJobResponse    GetJob(const batch::engine::v1::JobRequest& req);
  batch::engine::v1::ListJobsResponse  ListJobs(const batch::engine::v1::ListJobsRequest& req);
  batch::engine::v1::GetJobResponse    WaitForJob(const batch::engine::v1::WaitForJobRequest& req);

  batch::engine::v1::CreateGroupResponse CreateGroup(const batch::engine::v1::CreateGroupRequest& req);
  batch::engine::v1::GroupResponse       AddJobToGroup(const batch::engine::v1::AddJobToGroupRequest& req);
  batch::engine::v1::GroupResponse       CancelGroup(const batch::engine::v1::GroupRequest& req);
  batch::engine::v1::GroupResponse       GetGroup(const batch::engine::v1::GroupRequest& req);
  batch::engine::v1::GroupResponse       WaitForGroup(const batch::engine::v1::WaitForGroupRequest& req);

  batch::engine::v1::ListTasksResponse     ListTasks(const batch::engine::v1::ListTasksRequest& req);
  batch::engine::v1::StatsResponse         Stats(const batch::engine::v1::StatsRequest& req);
  batch::engine::v1::ClearFinishedResponse ClearFinished(const batch::engine::v1::ClearFinishedRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace batch::service
