#include "internal/model/job_group.hpp"

namespace batch::model {

GroupStatus Summarize(const JobGroup& group, const std::vector<JobState>& member_states) {
  GroupStatus status;
  status.id    = group.id;
  status.name  = group.name;
  status.total = static_cast<uint32_t>(member_states.size());

  for (const auto state : member_states) {
    switch (state) {
      case JobState::kCompleted:
        ++status.completed;
        break;
      case JobState::kFailed:
        ++status.failed;
        break;
      case JobState::kCanceled:
        ++status.canceled;
        break;
      default:
        ++status.active;
        break;
    }
  }

  if (status.total == 0) {
    status.state    = group.canceled ? GroupState::kCanceled : GroupState::kCreated;
    status.finished = group.canceled;
    return status;
  }

  const auto terminal = status.completed + status.failed + status.canceled;
  status.progress     = static_cast<double>(terminal) / static_cast<double>(status.total);
  status.finished     = status.active == 0;

  // an explicit cancel wins over member failures
  if (group.canceled) {
    status.state = GroupState::kCanceled;
  } else if (status.failed > 0) {
    status.state = GroupState::kFailed;
  } else if (status.active > 0) {
    status.state = GroupState::kRunning;
  } else if (status.canceled > 0) {
    status.state = GroupState::kCanceled;
  } else {
    status.state = GroupState::kCompleted;
  }
  return status;
}

} // namespace batch::model
