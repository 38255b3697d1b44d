#include "internal/engine/worker_pool.hpp"

#include <algorithm>
#include <condition_variable>

#include "internal/observability/logging.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/util/errors.hpp"

namespace batch::engine {
namespace {

AttemptResult Failure(model::ErrorKind kind, std::string message) {
  AttemptResult result;
  result.error = model::JobError{kind, std::move(message)};
  return result;
}

AttemptResult RunBody(const task::TaskFunction& fn, const google::protobuf::Struct& args, const task::AttemptHandlePtr& handle) {
  observability::ScopedJobContext log_context(handle->job_id, handle->attempt);
  task::TaskContext              ctx(handle);
  try {
    AttemptResult result;
    result.value = fn(args, ctx);
    return result;
  } catch (const util::TaskCanceledError& e) {
    return Failure(model::ErrorKind::kCanceled, e.what());
  } catch (const util::TimeoutError& e) {
    return Failure(model::ErrorKind::kTimeout, e.what());
  } catch (const util::DependencyFailedError& e) {
    // an upstream input the task found unusable; retrying cannot fix it
    return Failure(model::ErrorKind::kDependencyFailed, e.what());
  } catch (const std::exception& e) {
    return Failure(model::ErrorKind::kTaskExecution, e.what());
  } catch (...) {
    return Failure(model::ErrorKind::kTaskExecution, "task threw a non-standard exception");
  }
}

} // namespace

// Helper thread running one timed attempt. Once the worker gives up on it,
// the slot and the job stay held in the scheduler until the body returns.
struct WorkerPool::Body {
  std::thread             thread;
  std::mutex              mutex;
  std::condition_variable done_cv;
  bool                    done      = false;
  bool                    abandoned = false;
  AttemptResult           result;
};

WorkerPool::WorkerPool(std::size_t workers, std::shared_ptr<JobScheduler> scheduler, std::shared_ptr<task::TaskRegistry> registry)
    : size_(workers == 0 ? 1 : workers), scheduler_(std::move(scheduler)), registry_(std::move(registry)) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) {
    return;
  }
  threads_.reserve(size_);
  for (std::size_t i = 0; i < size_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
  BATCH_LOG_INFO("Worker pool started", {observability::IntField("workers", static_cast<int64_t>(size_))});
}

void WorkerPool::Stop() {
  scheduler_->Shutdown();
  if (running_.exchange(false)) {
    for (auto& thread : threads_) {
      if (thread.joinable()) thread.join();
    }
    threads_.clear();
    BATCH_LOG_INFO("Worker pool stopped");
  }
  JoinFinishedBodies(true);
}

void WorkerPool::JoinFinishedBodies(bool all) {
  std::vector<std::shared_ptr<Body>> finished;
  {
    std::lock_guard lock(bodies_mutex_);
    auto            split = std::stable_partition(bodies_.begin(), bodies_.end(), [all](const std::shared_ptr<Body>& body) {
      std::lock_guard body_lock(body->mutex);
      return !all && !body->done;
    });
    finished.assign(split, bodies_.end());
    bodies_.erase(split, bodies_.end());
  }
  for (auto& body : finished) {
    if (body->thread.joinable()) body->thread.join();
  }
}

AttemptResult WorkerPool::Execute(const Dispatch& dispatch) {
  const auto& job = dispatch.job;

  task::TaskFunction fn;
  try {
    fn = registry_->Resolve(job.task_name);
  } catch (const util::UnknownTaskError& e) {
    return Failure(model::ErrorKind::kUnknownTask, e.what());
  }

  if (job.timeout.count() <= 0) {
    return RunBody(fn, job.args, dispatch.handle);
  }

  JoinFinishedBodies(false);

  auto body    = std::make_shared<Body>();
  body->thread = std::thread([body, fn, args = job.args, handle = dispatch.handle, scheduler = scheduler_] {
    auto result = RunBody(fn, args, handle);

    std::lock_guard lock(body->mutex);
    body->done   = true;
    body->result = std::move(result);
    if (body->abandoned) {
      scheduler->ReleaseAbandoned(handle->job_id);
    }
    body->done_cv.notify_all();
  });
  {
    std::lock_guard lock(bodies_mutex_);
    bodies_.push_back(body);
  }

  std::unique_lock lock(body->mutex);
  if (body->done_cv.wait_for(lock, job.timeout, [&] { return body->done; })) {
    return std::move(body->result);
  }

  // still under body->mutex, so the body cannot finish before the hold is
  // in place
  body->abandoned = true;
  scheduler_->HoldAbandoned(job.id);
  dispatch.handle->token.Cancel();
  lock.unlock();

  BATCH_LOG_WARN("Job attempt timed out", {observability::StringField("job_id", job.id), observability::IntField("timeout_ms", job.timeout.count())});
  return Failure(model::ErrorKind::kTimeout, "attempt exceeded " + std::to_string(job.timeout.count()) + "ms");
}

void WorkerPool::Run() {
  while (true) {
    auto dispatch = scheduler_->Dequeue();
    if (!dispatch) break;

    observability::SpanScope span("job.execute");
    span.SetAttribute("job.id", dispatch->job.id);
    span.SetAttribute("job.task", dispatch->job.task_name);
    span.SetAttribute("job.attempt", static_cast<std::int64_t>(dispatch->handle->attempt));

    auto result = Execute(*dispatch);
    if (result.error) {
      span.RecordException(result.error->message);
    }
    try {
      scheduler_->ReportOutcome(dispatch->job.id, std::move(result));
    } catch (const std::exception& e) {
      BATCH_LOG_ERROR("Failed to record job outcome", {observability::StringField("job_id", dispatch->job.id), observability::StringField("error", e.what())});
    }
  }
}

} // namespace batch::engine
