#include "internal/task/task_context.hpp"

#include "internal/util/errors.hpp"

namespace batch::task {

void TaskContext::ThrowIfCancelled() const {
  if (IsCancelled()) {
    throw util::TaskCanceledError("job canceled: " + handle_->job_id);
  }
}

} // namespace batch::task
