#include "job_server.hpp"

#include <exception>
#include <utility>

#include "grpc_error.hpp"

namespace batch::grpc {
namespace v1 = batch::engine::v1;

namespace {

// Runs one service call, turning engine exceptions into a status.
template <typename Response, typename Call>
::grpc::Status Handle(Response* resp, Call&& call) {
  try {
    *resp = call();
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
  return ::grpc::Status::OK;
}

} // namespace

JobServer::JobServer(std::shared_ptr<batch::service::JobService> svc) : service_(std::move(svc)) {
}

::grpc::Status JobServer::CreateJob(::grpc::ServerContext*, const v1::CreateJobRequest* req, v1::CreateJobResponse* resp) {
  return Handle(resp, [&] { return service_->CreateJob(*req); });
}

::grpc::Status JobServer::SubmitJob(::grpc::ServerContext*, const v1::JobRequest* req, v1::JobStateResponse* resp) {
  return Handle(resp, [&] { return service_->SubmitJob(*req); });
}

::grpc::Status JobServer::PauseJob(::grpc::ServerContext*, const v1::JobRequest* req, v1::JobStateResponse* resp) {
  return Handle(resp, [&] { return service_->PauseJob(*req); });
}

::grpc::Status JobServer::ResumeJob(::grpc::ServerContext*, const v1::JobRequest* req, v1::JobStateResponse* resp) {
  return Handle(resp, [&] { return service_->ResumeJob(*req); });
}

::grpc::Status JobServer::CancelJob(::grpc::ServerContext*, const v1::JobRequest* req, v1::JobStateResponse* resp) {
  return Handle(resp, [&] { return service_->CancelJob(*req); });
}

::grpc::Status JobServer::SetJobPriority(::grpc::ServerContext*, const v1::SetJobPriorityRequest* req, v1::JobStateResponse* resp) {
  return Handle(resp, [&] { return service_->SetJobPriority(*req); });
}

::grpc::Status JobServer::GetJob(::grpc::ServerContext*, const v1::JobRequest* req, v1::GetJobResponse* resp) {
  return Handle(resp, [&] { return service_->GetJob(*req); });
}

::grpc::Status JobServer::ListJobs(::grpc::ServerContext*, const v1::ListJobsRequest* req, v1::ListJobsResponse* resp) {
  return Handle(resp, [&] { return service_->ListJobs(*req); });
}

::grpc::Status JobServer::WaitForJob(::grpc::ServerContext*, const v1::WaitForJobRequest* req, v1::GetJobResponse* resp) {
  return Handle(resp, [&] { return service_->WaitForJob(*req); });
}

::grpc::Status JobServer::CreateGroup(::grpc::ServerContext*, const v1::CreateGroupRequest* req, v1::CreateGroupResponse* resp) {
  return Handle(resp, [&] { return service_->CreateGroup(*req); });
}

::grpc::Status JobServer::AddJobToGroup(::grpc::ServerContext*, const v1::AddJobToGroupRequest* req, v1::GroupResponse* resp) {
  return Handle(resp, [&] { return service_->AddJobToGroup(*req); });
}

::grpc::Status JobServer::CancelGroup(::grpc::ServerContext*, const v1::GroupRequest* req, v1::GroupResponse* resp) {
  return Handle(resp, [&] { return service_->CancelGroup(*req); });
}

::grpc::Status JobServer::GetGroup(::grpc::ServerContext*, const v1::GroupRequest* req, v1::GroupResponse* resp) {
  return Handle(resp, [&] { return service_->GetGroup(*req); });
}

::grpc::Status JobServer::WaitForGroup(::grpc::ServerContext*, const v1::WaitForGroupRequest* req, v1::GroupResponse* resp) {
  return Handle(resp, [&] { return service_->WaitForGroup(*req); });
}

::grpc::Status JobServer::ListTasks(::grpc::ServerContext*, const v1::ListTasksRequest* req, v1::ListTasksResponse* resp) {
  return Handle(resp, [&] { return service_->ListTasks(*req); });
}

::grpc::Status JobServer::Stats(::grpc::ServerContext*, const v1::StatsRequest* req, v1::StatsResponse* resp) {
  return Handle(resp, [&] { return service_->Stats(*req); });
}

::grpc::Status JobServer::ClearFinished(::grpc::ServerContext*, const v1::ClearFinishedRequest* req, v1::ClearFinishedResponse* resp) {
  return Handle(resp, [&] { return service_->ClearFinished(*req); });
}

} // namespace batch::grpc
