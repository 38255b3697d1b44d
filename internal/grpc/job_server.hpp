#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "batch/engine/v1/job_service.grpc.pb.h"
#include "internal/service/job_service.hpp"

namespace batch::grpc {

class JobServer final : public batch::engine::v1::JobService::Service {
public:
  explicit JobServer(std::shared_ptr<batch::service::JobService> svc);

  ::grpc::Status CreateJob(::grpc::ServerContext*, const batch::engine::v1::CreateJobRequest*, batch::engine::v1::CreateJobResponse*) override;
  ::grpc::Status SubmitJob(::grpc::ServerContext*, const batch::engine::v1::JobRequest*, batch::engine::v1::JobStateResponse*) override;
  ::grpc::Status PauseJob(::grpc::ServerContext*, const batch::engine::v1::JobRequest*, batch::engine::v1::JobStateResponse*) override;
  ::grpc::Status ResumeJob(::grpc::ServerContext*, const batch::engine::v1::JobRequest*, batch::engine::v1::JobStateResponse*) override;
  ::grpc::Status CancelJob(::grpc::ServerContext*, const batch::engine::v1::JobRequest*, batch::engine::v1::JobStateResponse*) override;
  ::grpc::Status SetJobPriority(::grpc::ServerContext*, const batch::engine::v1::SetJobPriorityRequest*, batch::engine::v1::JobStateResponse*) override;
  ::grpc::Status GetJob(::grpc::ServerContext*, const batch::engine::v1::JobRequest*, batch::engine::v1::GetJobResponse*) override;
  ::grpc::Status ListJobs(::grpc::ServerContext*, const batch::engine::v1::ListJobsRequest*, batch::engine::v1::ListJobsResponse*) override;
  ::grpc::Status WaitForJob(::grpc::ServerContext*, const batch::engine::v1::WaitForJobRequest*, batch::engine::v1::GetJobResponse*) override;

  ::grpc::Status CreateGroup(::grpc::ServerContext*, const batch::engine::v1::CreateGroupRequest*, batch::engine::v1::CreateGroupResponse*) override;
  ::grpc::Status AddJobToGroup(::grpc::ServerContext*, const batch::engine::v1::AddJobToGroupRequest*, batch::engine::v1::GroupResponse*) override;
  ::grpc::Status CancelGroup(::grpc::ServerContext*, const batch::engine::v1::GroupRequest*, batch::engine::v1::GroupResponse*) override;
  ::grpc::Status GetGroup(::grpc::ServerContext*, const batch::engine::v1::GroupRequest*, batch::engine::v1::GroupResponse*) override;
  ::grpc::Status WaitForGroup(::grpc::ServerContext*, const batch::engine::v1::WaitForGroupRequest*, batch::engine::v1::GroupResponse*) override;

  ::grpc::Status ListTasks(::grpc::ServerContext*, const batch::engine::v1::ListTasksRequest*, batch::engine::v1::ListTasksResponse*) override;
  ::grpc::Status Stats(::grpc::ServerContext*, const batch::engine::v1::StatsRequest*, batch::engine::v1::StatsResponse*) override;
  ::grpc::Status ClearFinished(::grpc::ServerContext*, const batch::engine::v1::ClearFinishedRequest*, batch::engine::v1::ClearFinishedResponse*) override;

private:
  std::shared_ptr<batch::service::JobService> service_;
};

} // namespace batch::grpc
