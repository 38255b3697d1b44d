#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/model/job_state.hpp"
#include "internal/util/time.hpp"

namespace batch::model {

enum class GroupState : std::uint8_t {
  kCreated   = 1,
  kRunning   = 2,
  kCompleted = 3,
  kFailed    = 4,
  kCanceled  = 5,
};

constexpr std::string_view ToString(GroupState state) {
  switch (state) {
    case GroupState::kCreated:
      return "created";
    case GroupState::kRunning:
      return "running";
    case GroupState::kCompleted:
      return "completed";
    case GroupState::kFailed:
      return "failed";
    case GroupState::kCanceled:
      return "canceled";
  }
  return "unknown";
}

/*
  A named set of jobs coordinated as a unit.

  Members are referenced by id; the scheduler's job table owns the jobs.
  `state` and `finished` are caches of Summarize() kept for persistence.
*/
struct JobGroup {
  std::string              id;
  std::string              name;
  std::string              description;
  google::protobuf::Struct metadata;

  bool sequential        = false;
  bool cancel_on_failure = false;
  bool skip_on_failure   = false;
  bool canceled          = false;

  std::vector<std::string> member_ids;

  GroupState state    = GroupState::kCreated;
  bool       finished = false;

  util::TimePoint created_at;
  util::TimePoint updated_at;
  uint64_t        version = 0;
};

struct GroupStatus {
  std::string id;
  std::string name;
  GroupState  state    = GroupState::kCreated;
  bool        finished = false;

  uint32_t total     = 0;
  uint32_t completed = 0;
  uint32_t failed    = 0;
  uint32_t canceled  = 0;
  uint32_t active    = 0;

  double progress = 0.0; // terminal members / total
};

// member_states must be in member_ids order.
GroupStatus Summarize(const JobGroup& group, const std::vector<JobState>& member_states);

} // namespace batch::model
