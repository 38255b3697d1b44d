#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace batch::runtime::config {
class RuntimeConfig;
}

namespace batch::observability {

bool InitializeMetrics(const batch::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process-wide instruments. Instance() binds to whichever meter provider is
  installed at first use, so InitializeMetrics must run before the engine
  records anything. Without OpenTelemetry every call is a no-op.
*/
class Metrics {
 public:
  static Metrics& Instance();
  ~Metrics();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // outcome is the terminal state name ("completed", "failed", ...) or "retried"
  void RecordJobOutcome(std::string_view task_name, std::string_view outcome);
  void ObserveJobDurationMs(std::string_view task_name, double duration_ms);
  void SetQueueDepth(std::uint64_t depth);

  // state name of a group that just finished
  void RecordGroupOutcome(std::string_view outcome);

 private:
  Metrics();

  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace batch::observability
