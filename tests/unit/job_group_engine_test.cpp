#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/engine/job_engine.hpp"
#include "internal/store/job_store.hpp"
#include "internal/task/task_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using batch::engine::GroupSpec;
using batch::engine::JobEngine;
using batch::engine::JobSpec;
using batch::model::ErrorKind;
using batch::model::GroupState;
using batch::model::JobState;
using namespace std::chrono_literals;

constexpr auto kWait = std::chrono::milliseconds(5000);

struct Trace {
  std::mutex               mutex;
  std::vector<std::string> order;
  std::atomic<bool>        release{true};
};

std::unique_ptr<JobEngine> MakeEngine(const std::shared_ptr<Trace>& trace) {
  auto registry = std::make_shared<batch::task::TaskRegistry>();
  batch::task::RegisterBuiltinTasks(*registry);

  // Appends its label; holds while the trace is not released.
  registry->Register("step", [trace](const google::protobuf::Struct& args, batch::task::TaskContext& ctx) {
    while (!trace->release) {
      ctx.ThrowIfCancelled();
      std::this_thread::sleep_for(2ms);
    }
    const auto label = args.fields().at("label").string_value();
    {
      std::lock_guard lock(trace->mutex);
      trace->order.push_back(label);
    }
    std::this_thread::sleep_for(5ms);
    google::protobuf::Value out;
    out.set_string_value(label);
    return out;
  });

  batch::engine::EngineOptions options;
  options.max_workers                = 4;
  options.poll_interval              = 5ms;
  options.default_retry.max_attempts = 1;
  options.recover_on_start           = false;

  auto store = std::make_shared<batch::store::JobStore>(std::make_shared<batch::db::memory::MemoryRepository>());
  return std::make_unique<JobEngine>(options, registry, store);
}

JobSpec Step(const std::string& label) {
  JobSpec spec;
  spec.task_name = "step";
  (*spec.args.mutable_fields())["label"].set_string_value(label);
  return spec;
}

JobSpec Failing() {
  JobSpec spec;
  spec.task_name = "fail";
  return spec;
}

std::vector<std::string> AddMembers(JobEngine& engine, const std::string& group_id, std::vector<JobSpec> specs) {
  std::vector<std::string> ids;
  for (auto& spec : specs) {
    ids.push_back(engine.CreateJob(std::move(spec)));
    engine.AddJobToGroup(ids.back(), group_id);
  }
  return ids;
}

void TestSequentialGroupRunsInOrder() {
  auto trace  = std::make_shared<Trace>();
  auto engine = MakeEngine(trace);
  engine->Start();

  GroupSpec spec;
  spec.name       = "pipeline";
  spec.sequential = true;
  const auto group_id = engine->CreateGroup(spec);
  const auto ids      = AddMembers(*engine, group_id, {Step("extract"), Step("transform"), Step("load")});

  // submit out of order; membership order decides
  for (auto it = ids.rbegin(); it != ids.rend(); ++it) {
    engine->Submit(*it);
  }
  assert(engine->GetStatus(ids[2]).state == JobState::kWaiting);

  const auto status = engine->WaitForGroup(group_id, kWait);
  assert(status.finished);
  assert(status.state == GroupState::kCompleted);
  assert(status.completed == 3);
  assert(status.progress == 1.0);
  assert((trace->order == std::vector<std::string>{"extract", "transform", "load"}));

  const auto group = engine->GetGroup(group_id);
  assert(group.name == "pipeline");
  assert(group.member_ids == ids);
  assert(engine->GetJob(ids[1]).group_id == group_id);
}

void TestSequentialFailureCancelsRemainder() {
  auto trace  = std::make_shared<Trace>();
  auto engine = MakeEngine(trace);
  engine->Start();

  GroupSpec spec;
  spec.sequential     = true;
  const auto group_id = engine->CreateGroup(spec);
  const auto ids      = AddMembers(*engine, group_id, {Step("first"), Failing(), Step("never")});
  for (const auto& id : ids) {
    engine->Submit(id);
  }

  const auto status = engine->WaitForGroup(group_id, kWait);
  assert(status.finished);
  assert(status.state == GroupState::kFailed);
  assert(engine->GetStatus(ids[0]).state == JobState::kCompleted);
  assert(engine->GetStatus(ids[1]).state == JobState::kFailed);
  assert(engine->GetStatus(ids[2]).state == JobState::kCanceled);
  assert(engine->GetError(ids[2])->kind == ErrorKind::kDependencyFailed);
  assert((trace->order == std::vector<std::string>{"first"}));
}

void TestSkipOnFailureContinues() {
  auto trace  = std::make_shared<Trace>();
  auto engine = MakeEngine(trace);
  engine->Start();

  GroupSpec spec;
  spec.sequential      = true;
  spec.skip_on_failure = true;
  const auto group_id  = engine->CreateGroup(spec);
  const auto ids       = AddMembers(*engine, group_id, {Failing(), Step("after")});
  for (const auto& id : ids) {
    engine->Submit(id);
  }

  const auto status = engine->WaitForGroup(group_id, kWait);
  assert(status.finished);
  // one member failed, so the group still reports failure
  assert(status.state == GroupState::kFailed);
  assert(status.failed == 1 && status.completed == 1);
  assert((trace->order == std::vector<std::string>{"after"}));
}

void TestCancelOnFailureStopsSiblings() {
  auto trace     = std::make_shared<Trace>();
  trace->release = false;
  auto engine    = MakeEngine(trace);
  engine->Start();

  GroupSpec spec;
  spec.cancel_on_failure = true;
  const auto group_id    = engine->CreateGroup(spec);
  const auto ids         = AddMembers(*engine, group_id, {Step("held"), Step("queued"), Failing()});
  engine->Submit(ids[0]);
  engine->Submit(ids[1]);

  const auto deadline = std::chrono::steady_clock::now() + kWait;
  while (engine->GetStatus(ids[0]).state != JobState::kRunning || engine->GetStatus(ids[1]).state != JobState::kRunning) {
    assert(std::chrono::steady_clock::now() < deadline);
    std::this_thread::sleep_for(2ms);
  }
  engine->Submit(ids[2]);

  const auto status = engine->WaitForGroup(group_id, kWait);
  assert(status.finished);
  assert(status.state == GroupState::kFailed);
  assert(engine->GetStatus(ids[0]).state == JobState::kCanceled);
  assert(engine->GetStatus(ids[1]).state == JobState::kCanceled);
  assert(trace->order.empty());

  // a late joiner is canceled straight away
  const auto late = engine->CreateJob(Step("late"));
  engine->AddJobToGroup(late, group_id);
  assert(engine->GetStatus(late).state == JobState::kCanceled);
}

void TestCancelGroup() {
  auto trace     = std::make_shared<Trace>();
  trace->release = false;
  auto engine    = MakeEngine(trace);
  engine->Start();

  const auto group_id = engine->CreateGroup(GroupSpec{});
  const auto ids      = AddMembers(*engine, group_id, {Step("a"), Step("b")});
  engine->Submit(ids[0]);

  const auto status = engine->CancelGroup(group_id);
  assert(status.state == GroupState::kCanceled);

  const auto done = engine->WaitForGroup(group_id, kWait);
  assert(done.finished);
  assert(done.canceled == 2);
  assert(engine->GetError(ids[1])->kind == ErrorKind::kCanceled);

  const auto late = engine->CreateJob(Step("late"));
  engine->AddJobToGroup(late, group_id);
  assert(engine->GetStatus(late).state == JobState::kCanceled);
  assert(engine->GetGroup(group_id).canceled);
}

void TestEmptyGroup() {
  auto engine = MakeEngine(std::make_shared<Trace>());

  const auto group_id = engine->CreateGroup(GroupSpec{});
  const auto status   = engine->GetGroupStatus(group_id);
  assert(status.state == GroupState::kCreated);
  assert(status.total == 0);
  assert(!status.finished);
  assert(engine->GetGroup(group_id).name == "group_" + group_id.substr(0, 8));

  const auto canceled = engine->CancelGroup(group_id);
  assert(canceled.state == GroupState::kCanceled);
  assert(canceled.finished);
}

void TestLateMembersFollowGroupRules() {
  auto trace  = std::make_shared<Trace>();
  auto engine = MakeEngine(trace);

  GroupSpec spec;
  spec.sequential     = true;
  const auto group_id = engine->CreateGroup(spec);
  const auto first    = AddMembers(*engine, group_id, {Step("first")}).front();

  // queued before joining; parked behind the earlier member
  const auto second = engine->CreateJob(Step("second"));
  assert(engine->Submit(second) == JobState::kQueued);
  engine->AddJobToGroup(second, group_id);
  assert(engine->GetStatus(second).state == JobState::kWaiting);

  engine->Start();
  engine->Submit(first);
  const auto status = engine->WaitForGroup(group_id, kWait);
  assert(status.state == GroupState::kCompleted);
  assert((trace->order == std::vector<std::string>{"first", "second"}));

  // a failed job joining a cancel_on_failure group takes its siblings down
  GroupSpec strict;
  strict.cancel_on_failure = true;
  const auto strict_id     = engine->CreateGroup(strict);
  trace->release           = false;
  const auto held          = AddMembers(*engine, strict_id, {Step("held")}).front();
  engine->Submit(held);

  const auto broken = engine->CreateJob(Failing());
  engine->Submit(broken);
  assert(engine->WaitForJob(broken, kWait) == JobState::kFailed);
  engine->AddJobToGroup(broken, strict_id);

  assert(engine->WaitForJob(held, kWait) == JobState::kCanceled);
  const auto strict_status = engine->WaitForGroup(strict_id, kWait);
  assert(strict_status.state == GroupState::kFailed);
  assert(strict_status.failed == 1 && strict_status.canceled == 1);
}

void TestMembershipErrors() {
  auto engine = MakeEngine(std::make_shared<Trace>());

  const auto first  = engine->CreateGroup(GroupSpec{});
  const auto second = engine->CreateGroup(GroupSpec{});
  const auto job    = engine->CreateJob(Step("x"));

  engine->AddJobToGroup(job, first);
  // re-adding to the same group is a no-op
  engine->AddJobToGroup(job, first);
  assert(engine->GetGroup(first).member_ids.size() == 1);

  bool threw = false;
  try {
    engine->AddJobToGroup(job, second);
  } catch (const batch::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);

  // submitted jobs may join too
  const auto submitted = engine->CreateJob(Step("y"));
  engine->Submit(submitted);
  engine->AddJobToGroup(submitted, second);
  assert(engine->GetJob(submitted).group_id == second);
  assert(engine->GetStatus(submitted).state == JobState::kQueued);
  assert((engine->GetGroup(second).member_ids == std::vector<std::string>{submitted}));

  threw = false;
  try {
    engine->AddJobToGroup(job, "no-such-group");
  } catch (const batch::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    engine->GetGroupStatus("no-such-group");
  } catch (const batch::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  batch::engine::JobFilter by_group;
  by_group.group_id = first;
  const auto members = engine->ListJobs(by_group);
  assert(members.size() == 1 && members[0].id == job);
}

} // namespace

int main() {
  TestSequentialGroupRunsInOrder();
  TestSequentialFailureCancelsRemainder();
  TestSkipOnFailureContinues();
  TestCancelOnFailureStopsSiblings();
  TestCancelGroup();
  TestEmptyGroup();
  TestLateMembersFollowGroupRules();
  TestMembershipErrors();

  std::cout << "batch_unit_job_group_engine: pass\n";
  return 0;
}
