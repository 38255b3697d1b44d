#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace batch::task {

/*
  Cooperative cancellation flag shared between the scheduler and a running
  task body. Setting it never interrupts the body; the body polls.
*/
class CancellationToken {
 public:
  void Cancel() noexcept {
    cancelled_.store(true, std::memory_order_release);
  }

  bool IsCancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

/*
  Per-attempt state shared by the scheduler (cancel, progress reads) and the
  worker executing the attempt.
*/
struct AttemptHandle {
  std::string       job_id;
  uint32_t          attempt = 0;
  CancellationToken token;

  void SetProgress(double percent, std::string message) {
    std::lock_guard lock(mutex);
    progress         = std::clamp(percent, 0.0, 100.0);
    progress_message = std::move(message);
  }

  std::mutex  mutex;
  double      progress = 0.0;
  std::string progress_message;
};

using AttemptHandlePtr = std::shared_ptr<AttemptHandle>;

class TaskContext {
 public:
  explicit TaskContext(AttemptHandlePtr handle) : handle_(std::move(handle)) {
  }

  const std::string& JobId() const {
    return handle_->job_id;
  }

  uint32_t Attempt() const {
    return handle_->attempt;
  }

  bool IsCancelled() const {
    return handle_->token.IsCancelled();
  }

  // Throws TaskCanceledError once the job has been asked to stop.
  void ThrowIfCancelled() const;

  void ReportProgress(double percent, std::string message = {}) {
    handle_->SetProgress(percent, std::move(message));
  }

 private:
  AttemptHandlePtr handle_;
};

} // namespace batch::task
