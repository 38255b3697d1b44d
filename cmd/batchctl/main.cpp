#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "batch/engine/v1.hpp"

using namespace batch::engine::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  batchctl <addr> submit <task> [args_json] [priority=low|normal|high|critical]\n"
            << "  batchctl <addr> create <task> [args_json] [priority=low|normal|high|critical]\n"
            << "  batchctl <addr> start <job_id>\n"
            << "  batchctl <addr> status <job_id>\n"
            << "  batchctl <addr> wait <job_id> [timeout_ms]\n"
            << "  batchctl <addr> pause <job_id>\n"
            << "  batchctl <addr> resume <job_id>\n"
            << "  batchctl <addr> cancel <job_id>\n"
            << "  batchctl <addr> priority <job_id> <low|normal|high|critical>\n"
            << "  batchctl <addr> list [state]\n"
            << "  batchctl <addr> group-create <name> [sequential] [cancel_on_failure] [skip_on_failure]\n"
            << "  batchctl <addr> group-add <group_id> <job_id>\n"
            << "  batchctl <addr> group-cancel <group_id>\n"
            << "  batchctl <addr> group-status <group_id>\n"
            << "  batchctl <addr> group-wait <group_id> [timeout_ms]\n"
            << "  batchctl <addr> tasks\n"
            << "  batchctl <addr> stats\n"
            << "  batchctl <addr> clear [state]\n";
}

static std::optional<JobPriority> ParsePriority(const std::string& value) {
  if (value == "low") {
    return JOB_PRIORITY_LOW;
  }
  if (value == "normal") {
    return JOB_PRIORITY_NORMAL;
  }
  if (value == "high") {
    return JOB_PRIORITY_HIGH;
  }
  if (value == "critical") {
    return JOB_PRIORITY_CRITICAL;
  }
  return std::nullopt;
}

static std::optional<JobState> ParseState(const std::string& value) {
  const std::string upper = "JOB_STATE_" + [&] {
    std::string out;
    for (char c : value) out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    return out;
  }();

  JobState state;
  if (!JobState_Parse(upper, &state)) {
    return std::nullopt;
  }
  return state;
}

static std::string StateName(JobState state) {
  // JOB_STATE_QUEUED -> queued
  std::string name = JobState_Name(state).substr(10);
  for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return name;
}

static std::string GroupStateName(GroupState state) {
  std::string name = GroupState_Name(state).substr(12);
  for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return name;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

static void PrintJob(const JobInfo& job) {
  std::cout << "id=" << job.id() << "\n";
  std::cout << "name=" << job.name() << "\n";
  std::cout << "task=" << job.task_name() << "\n";
  std::cout << "state=" << StateName(job.state()) << "\n";
  std::cout << "attempts=" << job.attempt_count() << "/" << job.retry_policy().max_attempts() << "\n";
  std::cout << "progress=" << job.progress() << "\n";
  if (job.has_result()) {
    std::string json;
    if (google::protobuf::util::MessageToJsonString(job.result(), &json).ok()) {
      std::cout << "result=" << json << "\n";
    }
  }
  if (job.has_error()) {
    std::cout << "error=" << job.error().message() << "\n";
  } else if (job.has_last_error()) {
    std::cout << "last_error=" << job.last_error().message() << "\n";
  }
}

static void PrintGroup(const GroupInfo& group) {
  std::cout << "id=" << group.id() << "\n";
  std::cout << "name=" << group.name() << "\n";
  std::cout << "state=" << GroupStateName(group.state()) << "\n";
  std::cout << "finished=" << (group.finished() ? "true" : "false") << "\n";
  std::cout << "total=" << group.total() << " completed=" << group.completed() << " failed=" << group.failed()
            << " canceled=" << group.canceled() << " active=" << group.active() << "\n";
  std::cout << "progress=" << group.progress() << "\n";
}

static bool BuildCreateRequest(int argc, char** argv, CreateJobRequest* req) {
  req->set_task_name(argv[3]);
  if (argc >= 5) {
    auto status = google::protobuf::util::JsonStringToMessage(argv[4], req->mutable_args());
    if (!status.ok()) {
      std::cerr << "invalid args json: " << status.ToString() << "\n";
      return false;
    }
  }
  if (argc >= 6) {
    auto parsed = ParsePriority(argv[5]);
    if (!parsed.has_value()) {
      std::cerr << "unsupported priority: " << argv[5] << "\n";
      return false;
    }
    req->set_priority(parsed.value());
  }
  return true;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = JobService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "submit" || cmd == "create") {
    if (argc < 4) return 1;

    CreateJobRequest req;
    if (!BuildCreateRequest(argc, argv, &req)) {
      return 1;
    }
    req.set_submit(cmd == "submit");

    CreateJobResponse resp;
    auto              status = stub->CreateJob(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "id=" << resp.job_id() << "\n";
    std::cout << "state=" << StateName(resp.state()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "start" || cmd == "pause" || cmd == "resume" || cmd == "cancel") {
    if (argc < 4) return 1;

    JobRequest req;
    req.set_job_id(argv[3]);

    JobStateResponse resp;
    grpc::Status     status;
    if (cmd == "start") {
      status = stub->SubmitJob(&ctx, req, &resp);
    } else if (cmd == "pause") {
      status = stub->PauseJob(&ctx, req, &resp);
    } else if (cmd == "resume") {
      status = stub->ResumeJob(&ctx, req, &resp);
    } else {
      status = stub->CancelJob(&ctx, req, &resp);
    }
    if (!status.ok()) return Fail(status);

    std::cout << "state=" << StateName(resp.state()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 4) return 1;

    JobRequest req;
    req.set_job_id(argv[3]);

    GetJobResponse resp;
    auto           status = stub->GetJob(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJob(resp.job());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "wait") {
    if (argc < 4) return 1;

    WaitForJobRequest req;
    req.set_job_id(argv[3]);
    if (argc >= 5) {
      req.set_timeout_ms(std::stoull(argv[4]));
    }

    GetJobResponse resp;
    auto           status = stub->WaitForJob(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJob(resp.job());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "priority") {
    if (argc < 5) return 1;

    auto parsed = ParsePriority(argv[4]);
    if (!parsed.has_value()) {
      std::cerr << "unsupported priority: " << argv[4] << "\n";
      return 1;
    }

    SetJobPriorityRequest req;
    req.set_job_id(argv[3]);
    req.set_priority(parsed.value());

    JobStateResponse resp;
    auto             status = stub->SetJobPriority(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "state=" << StateName(resp.state()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListJobsRequest req;
    if (argc >= 4) {
      auto parsed = ParseState(argv[3]);
      if (!parsed.has_value()) {
        std::cerr << "unsupported state: " << argv[3] << "\n";
        return 1;
      }
      req.set_state(parsed.value());
    }

    ListJobsResponse resp;
    auto             status = stub->ListJobs(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& job : resp.jobs()) {
      std::cout << job.id() << " " << job.task_name() << " " << StateName(job.state()) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "group-create") {
    if (argc < 4) return 1;

    CreateGroupRequest req;
    req.set_name(argv[3]);
    for (int i = 4; i < argc; ++i) {
      const std::string flag = argv[i];
      if (flag == "sequential") {
        req.set_sequential(true);
      } else if (flag == "cancel_on_failure") {
        req.set_cancel_on_failure(true);
      } else if (flag == "skip_on_failure") {
        req.set_skip_on_failure(true);
      } else {
        std::cerr << "unsupported group flag: " << flag << "\n";
        return 1;
      }
    }

    CreateGroupResponse resp;
    auto                status = stub->CreateGroup(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "id=" << resp.group_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "group-add") {
    if (argc < 5) return 1;

    AddJobToGroupRequest req;
    req.set_group_id(argv[3]);
    req.set_job_id(argv[4]);

    GroupResponse resp;
    auto          status = stub->AddJobToGroup(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintGroup(resp.group());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "group-cancel" || cmd == "group-status") {
    if (argc < 4) return 1;

    GroupRequest req;
    req.set_group_id(argv[3]);

    GroupResponse resp;
    auto status = cmd == "group-cancel" ? stub->CancelGroup(&ctx, req, &resp) : stub->GetGroup(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintGroup(resp.group());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "group-wait") {
    if (argc < 4) return 1;

    WaitForGroupRequest req;
    req.set_group_id(argv[3]);
    if (argc >= 5) {
      req.set_timeout_ms(std::stoull(argv[4]));
    }

    GroupResponse resp;
    auto          status = stub->WaitForGroup(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintGroup(resp.group());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "tasks") {
    ListTasksRequest  req;
    ListTasksResponse resp;

    auto status = stub->ListTasks(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& name : resp.names()) {
      std::cout << name << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;

    auto status = stub->Stats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    const auto& stats = resp.stats();
    std::cout << "submitted=" << stats.submitted() << "\n";
    std::cout << "completed=" << stats.completed() << "\n";
    std::cout << "failed=" << stats.failed() << "\n";
    std::cout << "canceled=" << stats.canceled() << "\n";
    std::cout << "retried=" << stats.retried() << "\n";
    std::cout << "queue_depth=" << stats.queue_depth() << "\n";
    std::cout << "running=" << stats.running() << "\n";
    std::cout << "workers=" << stats.workers() << "\n";
    std::cout << "avg_execution_ms=" << stats.avg_execution_ms() << "\n";
    std::cout << "avg_queue_wait_ms=" << stats.avg_queue_wait_ms() << "\n";
    std::cout << "uptime_seconds=" << stats.uptime_seconds() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "clear") {
    ClearFinishedRequest req;
    if (argc >= 4) {
      auto parsed = ParseState(argv[3]);
      if (!parsed.has_value()) {
        std::cerr << "unsupported state: " << argv[3] << "\n";
        return 1;
      }
      req.set_state(parsed.value());
    }

    ClearFinishedResponse resp;
    auto                  status = stub->ClearFinished(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "cleared=" << resp.cleared() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
