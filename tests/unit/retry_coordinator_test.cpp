#include <cassert>
#include <chrono>
#include <iostream>

#include "internal/engine/retry_coordinator.hpp"

namespace {

using batch::engine::RetryCoordinator;
using batch::model::ErrorKind;
using std::chrono::milliseconds;

void TestBackoffGrowsAndCaps() {
  batch::model::RetryPolicy policy;
  policy.base_delay = milliseconds(100);
  policy.multiplier = 2.0;
  policy.max_delay  = milliseconds(500);

  assert(RetryCoordinator::ComputeBackoff(policy, 1) == milliseconds(100));
  assert(RetryCoordinator::ComputeBackoff(policy, 2) == milliseconds(200));
  assert(RetryCoordinator::ComputeBackoff(policy, 3) == milliseconds(400));
  assert(RetryCoordinator::ComputeBackoff(policy, 4) == milliseconds(500));
  assert(RetryCoordinator::ComputeBackoff(policy, 30) == milliseconds(500));
}

void TestMultiplierBelowOneIsFlat() {
  batch::model::RetryPolicy policy;
  policy.base_delay = milliseconds(50);
  policy.multiplier = 0.5;
  policy.max_delay  = milliseconds(1000);

  assert(RetryCoordinator::ComputeBackoff(policy, 1) == milliseconds(50));
  assert(RetryCoordinator::ComputeBackoff(policy, 5) == milliseconds(50));
}

void TestOnlyExecutionFailuresAndTimeoutsRetry() {
  assert(RetryCoordinator::IsRetryable(ErrorKind::kTaskExecution));
  assert(RetryCoordinator::IsRetryable(ErrorKind::kTimeout));
  assert(!RetryCoordinator::IsRetryable(ErrorKind::kUnknownTask));
  assert(!RetryCoordinator::IsRetryable(ErrorKind::kDependencyFailed));
  assert(!RetryCoordinator::IsRetryable(ErrorKind::kCanceled));
  assert(!RetryCoordinator::IsRetryable(ErrorKind::kInterrupted));
}

void TestDecideStopsAtMaxAttempts() {
  batch::model::Job job;
  job.retry_policy.max_attempts = 3;
  job.retry_policy.base_delay   = milliseconds(10);
  job.retry_policy.multiplier   = 3.0;
  job.retry_policy.max_delay    = milliseconds(0);

  const batch::model::JobError error{ErrorKind::kTaskExecution, "boom"};

  job.attempt_count = 1;
  auto decision     = RetryCoordinator::Decide(job, error);
  assert(decision.retry);
  assert(decision.delay == milliseconds(10));

  job.attempt_count = 2;
  decision          = RetryCoordinator::Decide(job, error);
  assert(decision.retry);
  // no cap when max_delay is zero
  assert(decision.delay == milliseconds(30));

  job.attempt_count = 3;
  assert(!RetryCoordinator::Decide(job, error).retry);

  job.attempt_count = 1;
  assert(!RetryCoordinator::Decide(job, {ErrorKind::kUnknownTask, "nope"}).retry);
}

} // namespace

int main() {
  TestBackoffGrowsAndCaps();
  TestMultiplierBelowOneIsFlat();
  TestOnlyExecutionFailuresAndTimeoutsRetry();
  TestDecideStopsAtMaxAttempts();

  std::cout << "batch_unit_retry_coordinator: pass\n";
  return 0;
}
