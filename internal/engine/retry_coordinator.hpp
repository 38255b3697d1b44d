#pragma once

#include <chrono>
#include <cstdint>

#include "internal/model/job.hpp"

namespace batch::engine {

struct RetryDecision {
  bool                      retry = false;
  std::chrono::milliseconds delay{0};
};

/*
  Decides what happens to a job after a failed attempt.

  Backoff grows geometrically from base_delay and is capped at max_delay:
      delay(n) = base_delay * multiplier^(n-1)
  where n is the number of attempts already made, so the first retry waits
  exactly base_delay.
*/
class RetryCoordinator {
 public:
  static std::chrono::milliseconds ComputeBackoff(const model::RetryPolicy& policy, uint32_t attempt_count);

  // Unknown tasks, dependency failures, cancellation and restart
  // interruption are never worth another attempt.
  static bool IsRetryable(model::ErrorKind kind);

  // job.attempt_count must already include the attempt that failed.
  static RetryDecision Decide(const model::Job& job, const model::JobError& error);
};

} // namespace batch::engine
