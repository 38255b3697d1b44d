#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/engine/job_scheduler.hpp"
#include "internal/task/task_registry.hpp"

namespace batch::engine {

/*
  Fixed set of threads that execute job attempts.

  Each thread loops:
      Dequeue -> resolve task -> run body -> ReportOutcome

  A task body never takes the worker down with it: anything it throws is
  turned into a recorded job error.
*/
class WorkerPool {
 public:
  WorkerPool(std::size_t workers, std::shared_ptr<JobScheduler> scheduler, std::shared_ptr<task::TaskRegistry> registry);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();

  // Stops dequeuing and waits for in-flight attempts to be reported, and
  // for the bodies of timed-out attempts to return.
  void Stop();

  std::size_t Size() const {
    return size_;
  }

  // Runs one attempt on the calling thread (on a helper thread when the
  // job has a timeout). Exposed for tests.
  AttemptResult Execute(const Dispatch& dispatch);

 private:
  struct Body;

  void Run();
  void JoinFinishedBodies(bool all);

  std::size_t                         size_;
  std::shared_ptr<JobScheduler>       scheduler_;
  std::shared_ptr<task::TaskRegistry> registry_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};

  std::mutex                         bodies_mutex_;
  std::vector<std::shared_ptr<Body>> bodies_;
};

} // namespace batch::engine
