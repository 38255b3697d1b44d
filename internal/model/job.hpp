#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/model/job_state.hpp"
#include "internal/util/time.hpp"

namespace batch::model {

struct RetryPolicy {
  uint32_t                  max_attempts = 3;
  std::chrono::milliseconds base_delay{1000};
  double                    multiplier = 2.0;
  std::chrono::milliseconds max_delay{60000};
};

enum class ErrorKind : std::uint8_t {
  kTaskExecution    = 1,
  kTimeout          = 2,
  kUnknownTask      = 3,
  kDependencyFailed = 4,
  kCanceled         = 5,
  kInterrupted      = 6,
};

constexpr std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kTaskExecution:
      return "task_execution";
    case ErrorKind::kTimeout:
      return "timeout";
    case ErrorKind::kUnknownTask:
      return "unknown_task";
    case ErrorKind::kDependencyFailed:
      return "dependency_failed";
    case ErrorKind::kCanceled:
      return "canceled";
    case ErrorKind::kInterrupted:
      return "interrupted";
  }
  return "unknown";
}

struct JobError {
  ErrorKind   kind = ErrorKind::kTaskExecution;
  std::string message;
};

/*
  One unit of work.

  Owned by the scheduler's job table; everything outside the scheduler only
  ever sees copies.
*/
struct Job {
  std::string id;
  std::string name;
  std::string task_name;

  google::protobuf::Struct args;
  Priority                 priority = Priority::kNormal;
  std::vector<std::string> dependencies;
  RetryPolicy              retry_policy;
  std::chrono::milliseconds timeout{0}; // 0 = no budget

  JobState state         = JobState::kCreated;
  uint32_t attempt_count = 0;

  std::optional<google::protobuf::Value> result;
  std::optional<JobError>                error;
  std::optional<JobError>                last_error;

  std::string              group_id;
  std::vector<std::string> tags;
  google::protobuf::Struct metadata;

  double      progress = 0.0;
  std::string progress_message;

  util::TimePoint                created_at;
  std::optional<util::TimePoint> queued_at;
  std::optional<util::TimePoint> started_at;
  std::optional<util::TimePoint> finished_at;
  std::optional<util::TimePoint> next_attempt_at;

  uint64_t version = 0;
};

struct JobStatus {
  std::string id;
  JobState    state         = JobState::kCreated;
  uint32_t    attempt_count = 0;
  uint32_t    max_attempts  = 0;
  double      progress      = 0.0;
  std::string progress_message;

  std::optional<JobError> last_error;

  util::TimePoint                created_at;
  std::optional<util::TimePoint> started_at;
  std::optional<util::TimePoint> finished_at;
};

inline JobStatus StatusOf(const Job& job) {
  JobStatus status;
  status.id               = job.id;
  status.state            = job.state;
  status.attempt_count    = job.attempt_count;
  status.max_attempts     = job.retry_policy.max_attempts;
  status.progress         = job.progress;
  status.progress_message = job.progress_message;
  status.last_error       = job.error ? job.error : job.last_error;
  status.created_at       = job.created_at;
  status.started_at       = job.started_at;
  status.finished_at      = job.finished_at;
  return status;
}

} // namespace batch::model
