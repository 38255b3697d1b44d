#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "batch/engine/v1.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/engine/job_engine.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/job_server.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/job_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/store/job_store.hpp"
#include "internal/task/task_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace v1 = batch::engine::v1;
using namespace std::chrono_literals;

struct Harness {
  std::shared_ptr<batch::engine::JobEngine> engine;
  std::unique_ptr<batch::grpc::JobServer>   server;
};

// Engine is left stopped unless a test starts it, so submitted jobs stay queued.
Harness BuildHarness(uint32_t max_queue_size = 1000) {
  auto registry = std::make_shared<batch::task::TaskRegistry>();
  batch::task::RegisterBuiltinTasks(*registry);

  batch::engine::EngineOptions options;
  options.max_workers      = 1;
  options.max_queue_size   = max_queue_size;
  options.poll_interval    = 5ms;
  options.recover_on_start = false;

  auto store = std::make_shared<batch::store::JobStore>(std::make_shared<batch::db::memory::MemoryRepository>());

  Harness harness;
  harness.engine = std::make_shared<batch::engine::JobEngine>(options, registry, store);

  batch::service::ServiceContext ctx;
  ctx.engine     = harness.engine;
  harness.server = std::make_unique<batch::grpc::JobServer>(std::make_shared<batch::service::JobService>(ctx));
  return harness;
}

std::string CreateJob(Harness& harness, const std::string& task, bool submit) {
  v1::CreateJobRequest req;
  req.set_task_name(task);
  req.set_submit(submit);
  v1::CreateJobResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = harness.server->CreateJob(&grpc_ctx, &req, &resp);
  assert(status.ok());
  return resp.job_id();
}

void TestExceptionMapping() {
  using ::grpc::StatusCode;
  assert(batch::grpc::ToStatus(batch::util::NotFound("x")).error_code() == StatusCode::NOT_FOUND);
  assert(batch::grpc::ToStatus(batch::util::AlreadyExists("x")).error_code() == StatusCode::ALREADY_EXISTS);
  assert(batch::grpc::ToStatus(batch::util::DuplicateTaskError("x")).error_code() == StatusCode::ALREADY_EXISTS);
  assert(batch::grpc::ToStatus(batch::util::InvalidState("x")).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(batch::grpc::ToStatus(batch::util::QueueFullError("queue full")).error_code() == StatusCode::RESOURCE_EXHAUSTED);
  assert(batch::grpc::ToStatus(batch::util::UnknownTaskError("x")).error_code() == StatusCode::INVALID_ARGUMENT);
  assert(batch::grpc::ToStatus(std::invalid_argument("x")).error_code() == StatusCode::INVALID_ARGUMENT);
  assert(batch::grpc::ToStatus(batch::util::PersistenceError("x")).error_code() == StatusCode::UNAVAILABLE);
  assert(batch::grpc::ToStatus(std::runtime_error("x")).error_code() == StatusCode::INTERNAL);

  const auto status = batch::grpc::ToStatus(batch::util::NotFound("job not found: abc"));
  assert(status.error_message() == "job not found: abc");
}

void TestMissingJobReturnsNotFound() {
  auto harness = BuildHarness();

  v1::JobRequest req;
  req.set_job_id("missing-job");
  v1::GetJobResponse    resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = harness.server->GetJob(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestEmptyIdReturnsInvalidArgument() {
  auto harness = BuildHarness();

  v1::JobRequest          req;
  v1::JobStateResponse    resp;
  ::grpc::ServerContext   grpc_ctx;
  const auto status = harness.server->CancelJob(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  v1::CreateJobRequest  create;
  v1::CreateJobResponse created;
  ::grpc::ServerContext create_ctx;
  assert(harness.server->CreateJob(&create_ctx, &create, &created).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestBadPriorityReturnsInvalidArgument() {
  auto harness = BuildHarness();

  v1::CreateJobRequest req;
  req.set_task_name("noop");
  req.set_priority(static_cast<v1::JobPriority>(99));
  v1::CreateJobResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = harness.server->CreateJob(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestCreateAndSubmitThroughServer() {
  auto harness = BuildHarness();

  v1::CreateJobRequest req;
  req.set_task_name("echo");
  req.set_name("hello");
  req.set_priority(v1::JOB_PRIORITY_HIGH);
  req.add_tags("smoke");
  (*req.mutable_args()->mutable_fields())["greeting"].set_string_value("hi");
  req.set_submit(true);
  v1::CreateJobResponse resp;
  ::grpc::ServerContext grpc_ctx;

  assert(harness.server->CreateJob(&grpc_ctx, &req, &resp).ok());
  assert(!resp.job_id().empty());
  assert(resp.state() == v1::JOB_STATE_QUEUED);

  harness.engine->Start();

  v1::WaitForJobRequest wait;
  wait.set_job_id(resp.job_id());
  wait.set_timeout_ms(5000);
  v1::GetJobResponse    done;
  ::grpc::ServerContext wait_ctx;
  assert(harness.server->WaitForJob(&wait_ctx, &wait, &done).ok());

  const auto& job = done.job();
  assert(job.state() == v1::JOB_STATE_COMPLETED);
  assert(job.name() == "hello");
  assert(job.priority() == v1::JOB_PRIORITY_HIGH);
  assert(job.tags_size() == 1 && job.tags(0) == "smoke");
  assert(job.result().struct_value().fields().at("greeting").string_value() == "hi");
  assert(job.attempt_count() == 1);
  assert(job.has_finished_at());
}

void TestUnknownTaskFailsJob() {
  auto harness = BuildHarness();

  v1::CreateJobRequest req;
  req.set_task_name("no_such_task");
  req.set_submit(true);
  v1::CreateJobResponse resp;
  ::grpc::ServerContext grpc_ctx;

  assert(harness.server->CreateJob(&grpc_ctx, &req, &resp).ok());
  assert(resp.state() == v1::JOB_STATE_FAILED);

  v1::JobRequest        get;
  v1::GetJobResponse    got;
  ::grpc::ServerContext get_ctx;
  get.set_job_id(resp.job_id());
  assert(harness.server->GetJob(&get_ctx, &get, &got).ok());
  assert(got.job().error().kind() == v1::ERROR_KIND_UNKNOWN_TASK);
}

void TestInvalidTransitionReturnsFailedPrecondition() {
  auto harness = BuildHarness();
  const auto id = CreateJob(harness, "noop", false);

  v1::JobRequest        req;
  v1::JobStateResponse  resp;
  ::grpc::ServerContext grpc_ctx;
  req.set_job_id(id);

  // a job that was never submitted cannot be paused
  const auto status = harness.server->PauseJob(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestQueueFullReturnsResourceExhausted() {
  auto harness = BuildHarness(1);
  CreateJob(harness, "noop", true);
  const auto second = CreateJob(harness, "noop", false);

  v1::JobRequest        req;
  v1::JobStateResponse  resp;
  ::grpc::ServerContext grpc_ctx;
  req.set_job_id(second);

  const auto status = harness.server->SubmitJob(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
}

void TestGroupLifecycleThroughServer() {
  auto harness = BuildHarness();

  v1::CreateGroupRequest  create;
  v1::CreateGroupResponse created;
  ::grpc::ServerContext   create_ctx;
  create.set_name("batch");
  create.set_sequential(true);
  assert(harness.server->CreateGroup(&create_ctx, &create, &created).ok());

  const auto job_id = CreateJob(harness, "noop", false);

  v1::AddJobToGroupRequest add;
  v1::GroupResponse        added;
  ::grpc::ServerContext    add_ctx;
  add.set_job_id(job_id);
  add.set_group_id(created.group_id());
  assert(harness.server->AddJobToGroup(&add_ctx, &add, &added).ok());
  assert(added.group().member_ids_size() == 1);
  assert(added.group().sequential());

  v1::GroupRequest      cancel;
  v1::GroupResponse     canceled;
  ::grpc::ServerContext cancel_ctx;
  cancel.set_group_id(created.group_id());
  assert(harness.server->CancelGroup(&cancel_ctx, &cancel, &canceled).ok());
  assert(canceled.group().state() == v1::GROUP_STATE_CANCELED);
  assert(canceled.group().finished());
  assert(canceled.group().canceled() == 1);

  v1::GroupRequest      missing;
  v1::GroupResponse     missing_resp;
  ::grpc::ServerContext missing_ctx;
  missing.set_group_id("missing-group");
  assert(harness.server->GetGroup(&missing_ctx, &missing, &missing_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestClearFinishedRejectsLiveState() {
  auto harness = BuildHarness();

  v1::ClearFinishedRequest  req;
  v1::ClearFinishedResponse resp;
  ::grpc::ServerContext     grpc_ctx;
  req.set_state(v1::JOB_STATE_RUNNING);

  const auto status = harness.server->ClearFinished(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestListTasks() {
  auto harness = BuildHarness();

  v1::ListTasksRequest  req;
  v1::ListTasksResponse resp;
  ::grpc::ServerContext grpc_ctx;
  assert(harness.server->ListTasks(&grpc_ctx, &req, &resp).ok());
  assert(resp.names_size() == 4);
  assert(resp.names(0) == "echo");
}

void TestServerOverLoopback() {
  auto registry = std::make_shared<batch::task::TaskRegistry>();
  batch::task::RegisterBuiltinTasks(*registry);

  batch::engine::EngineOptions options;
  options.max_workers      = 1;
  options.poll_interval    = 5ms;
  options.recover_on_start = false;

  auto store  = std::make_shared<batch::store::JobStore>(std::make_shared<batch::db::memory::MemoryRepository>());
  auto engine = std::make_shared<batch::engine::JobEngine>(options, registry, store);
  engine->Start();

  batch::service::ServiceContext ctx;
  ctx.engine = engine;

  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<batch::grpc::JobServer>(std::make_shared<batch::service::JobService>(ctx)));

  batch::runtime::ServerOptions server_options;
  server_options.bind_address   = "127.0.0.1:0";
  server_options.shutdown_grace = 100ms;
  batch::runtime::Server server(server_options, std::move(services));
  server.Start();
  assert(server.SelectedPort() > 0);

  auto channel = ::grpc::CreateChannel("127.0.0.1:" + std::to_string(server.SelectedPort()), ::grpc::InsecureChannelCredentials());
  auto stub    = v1::JobService::NewStub(channel);

  v1::CreateJobRequest create;
  create.set_task_name("echo");
  create.set_submit(true);
  v1::CreateJobResponse created;
  ::grpc::ClientContext create_ctx;
  assert(stub->CreateJob(&create_ctx, create, &created).ok());

  v1::WaitForJobRequest wait;
  wait.set_job_id(created.job_id());
  wait.set_timeout_ms(5000);
  v1::GetJobResponse    done;
  ::grpc::ClientContext wait_ctx;
  assert(stub->WaitForJob(&wait_ctx, wait, &done).ok());
  assert(done.job().state() == v1::JOB_STATE_COMPLETED);

  // errors keep their status code across the wire
  v1::JobRequest        missing;
  v1::GetJobResponse    missing_resp;
  ::grpc::ClientContext missing_ctx;
  missing.set_job_id("missing-job");
  assert(stub->GetJob(&missing_ctx, missing, &missing_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  server.Stop();
  server.Stop();
  engine->Stop();
}

} // namespace

int main() {
  TestExceptionMapping();
  TestMissingJobReturnsNotFound();
  TestEmptyIdReturnsInvalidArgument();
  TestBadPriorityReturnsInvalidArgument();
  TestCreateAndSubmitThroughServer();
  TestUnknownTaskFailsJob();
  TestInvalidTransitionReturnsFailedPrecondition();
  TestQueueFullReturnsResourceExhausted();
  TestGroupLifecycleThroughServer();
  TestClearFinishedRejectsLiveState();
  TestListTasks();
  TestServerOverLoopback();

  std::cout << "batch_unit_grpc_status: pass\n";
  return 0;
}
