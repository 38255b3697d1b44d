#include <cassert>
#include <iostream>

#include "internal/model/job.hpp"
#include "internal/model/job_state.hpp"

namespace {

using batch::model::CanTransition;
using batch::model::IsActive;
using batch::model::IsTerminal;
using batch::model::JobState;

void TestTerminalStatesAreFinal() {
  for (auto terminal : {JobState::kCompleted, JobState::kFailed, JobState::kCanceled}) {
    assert(IsTerminal(terminal));
    assert(!IsActive(terminal));
    assert(!CanTransition(terminal, JobState::kQueued));
    assert(!CanTransition(terminal, JobState::kRunning));
    assert(CanTransition(terminal, terminal));
  }
}

void TestCreatedOnlyLeavesThroughSubmitOrCancel() {
  assert(CanTransition(JobState::kCreated, JobState::kQueued));
  assert(CanTransition(JobState::kCreated, JobState::kCanceled));
  // unknown task at submit
  assert(CanTransition(JobState::kCreated, JobState::kFailed));
  assert(!CanTransition(JobState::kCreated, JobState::kRunning));
  assert(!CanTransition(JobState::kCreated, JobState::kCompleted));
  assert(!IsActive(JobState::kCreated));
}

void TestRunningOutcomes() {
  assert(CanTransition(JobState::kRunning, JobState::kCompleted));
  assert(CanTransition(JobState::kRunning, JobState::kFailed));
  assert(CanTransition(JobState::kRunning, JobState::kCanceled));
  // retry
  assert(CanTransition(JobState::kRunning, JobState::kQueued));
  // pause requested during the attempt, attempt failed
  assert(CanTransition(JobState::kRunning, JobState::kPaused));
  assert(!CanTransition(JobState::kRunning, JobState::kWaiting));
}

void TestWaitingAndPaused() {
  assert(CanTransition(JobState::kQueued, JobState::kWaiting));
  assert(CanTransition(JobState::kWaiting, JobState::kQueued));
  assert(!CanTransition(JobState::kWaiting, JobState::kRunning));
  assert(CanTransition(JobState::kPaused, JobState::kQueued));
  assert(!CanTransition(JobState::kPaused, JobState::kRunning));
  assert(!CanTransition(JobState::kPaused, JobState::kCompleted));
  assert(IsActive(JobState::kWaiting));
  assert(IsActive(JobState::kPaused));
}

void TestStatusPrefersFinalError() {
  batch::model::Job job;
  job.id                        = "j1";
  job.retry_policy.max_attempts = 4;
  job.attempt_count             = 2;
  job.last_error                = batch::model::JobError{batch::model::ErrorKind::kTaskExecution, "first"};

  auto status = batch::model::StatusOf(job);
  assert(status.max_attempts == 4);
  assert(status.attempt_count == 2);
  assert(status.last_error && status.last_error->message == "first");

  job.error = batch::model::JobError{batch::model::ErrorKind::kTimeout, "final"};
  status    = batch::model::StatusOf(job);
  assert(status.last_error->kind == batch::model::ErrorKind::kTimeout);
  assert(status.last_error->message == "final");
}

} // namespace

int main() {
  TestTerminalStatesAreFinal();
  TestCreatedOnlyLeavesThroughSubmitOrCancel();
  TestRunningOutcomes();
  TestWaitingAndPaused();
  TestStatusPrefersFinalError();

  std::cout << "batch_unit_job_state: pass\n";
  return 0;
}
