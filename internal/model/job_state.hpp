#pragma once

#include <cstdint>
#include <string_view>

namespace batch::model {

enum class JobState : std::uint8_t {
  kCreated   = 1,
  kQueued    = 2,
  kRunning   = 3,
  kPaused    = 4,
  kWaiting   = 5,
  kCompleted = 6,
  kFailed    = 7,
  kCanceled  = 8,
};

enum class Priority : std::uint8_t {
  kLow      = 0,
  kNormal   = 1,
  kHigh     = 2,
  kCritical = 3,
};

constexpr bool IsTerminal(JobState state) {
  return state == JobState::kCompleted || state == JobState::kFailed || state == JobState::kCanceled;
}

// Queued, Waiting, Running or Paused: still owes the scheduler work.
constexpr bool IsActive(JobState state) {
  return state == JobState::kQueued || state == JobState::kWaiting || state == JobState::kRunning || state == JobState::kPaused;
}

constexpr bool CanTransition(JobState from, JobState to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }

  switch (from) {
    case JobState::kCreated:
      return to == JobState::kQueued || to == JobState::kFailed || to == JobState::kCanceled;
    case JobState::kQueued:
      return to == JobState::kWaiting || to == JobState::kRunning || to == JobState::kPaused || to == JobState::kCanceled ||
             to == JobState::kFailed;
    case JobState::kWaiting:
      return to == JobState::kQueued || to == JobState::kPaused || to == JobState::kCanceled;
    case JobState::kRunning:
      return to == JobState::kCompleted || to == JobState::kQueued || to == JobState::kPaused || to == JobState::kFailed ||
             to == JobState::kCanceled;
    case JobState::kPaused:
      return to == JobState::kQueued || to == JobState::kCanceled;
    default:
      return false;
  }
}

constexpr std::string_view ToString(JobState state) {
  switch (state) {
    case JobState::kCreated:
      return "created";
    case JobState::kQueued:
      return "queued";
    case JobState::kRunning:
      return "running";
    case JobState::kPaused:
      return "paused";
    case JobState::kWaiting:
      return "waiting";
    case JobState::kCompleted:
      return "completed";
    case JobState::kFailed:
      return "failed";
    case JobState::kCanceled:
      return "canceled";
  }
  return "unknown";
}

constexpr std::string_view ToString(Priority priority) {
  switch (priority) {
    case Priority::kLow:
      return "low";
    case Priority::kNormal:
      return "normal";
    case Priority::kHigh:
      return "high";
    case Priority::kCritical:
      return "critical";
  }
  return "unknown";
}

} // namespace batch::model
