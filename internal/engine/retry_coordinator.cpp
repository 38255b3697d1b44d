#include "internal/engine/retry_coordinator.hpp"

#include <algorithm>
#include <cmath>

namespace batch::engine {

std::chrono::milliseconds RetryCoordinator::ComputeBackoff(const model::RetryPolicy& policy, uint32_t attempt_count) {
  const auto exponent = attempt_count > 0 ? attempt_count - 1 : 0;
  const auto base     = static_cast<double>(policy.base_delay.count());
  const auto cap      = static_cast<double>(policy.max_delay.count());

  double delay = base * std::pow(std::max(policy.multiplier, 1.0), static_cast<double>(exponent));
  if (policy.max_delay.count() > 0) {
    delay = std::min(delay, cap);
  }
  if (!std::isfinite(delay) || delay < 0.0) {
    delay = cap;
  }
  return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

bool RetryCoordinator::IsRetryable(model::ErrorKind kind) {
  switch (kind) {
    case model::ErrorKind::kTaskExecution:
    case model::ErrorKind::kTimeout:
      return true;
    case model::ErrorKind::kUnknownTask:
    case model::ErrorKind::kDependencyFailed:
    case model::ErrorKind::kCanceled:
    case model::ErrorKind::kInterrupted:
      return false;
  }
  return false;
}

RetryDecision RetryCoordinator::Decide(const model::Job& job, const model::JobError& error) {
  if (!IsRetryable(error.kind)) {
    return {};
  }
  if (job.attempt_count >= job.retry_policy.max_attempts) {
    return {};
  }
  return {true, ComputeBackoff(job.retry_policy, job.attempt_count)};
}

} // namespace batch::engine
