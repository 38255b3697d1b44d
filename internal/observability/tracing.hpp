#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace batch::runtime::config {
class RuntimeConfig;
}

namespace batch::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

// Exporter settings shared by the trace and metric pipelines.
struct OtlpConfig {
  OtlpSignal    signal{OtlpSignal::kTraces};
  std::string   service_name{"batch-engine"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t collection_interval_ms{1000};
  double        sample_ratio{1.0};
};

// Returns false (and installs nothing) when tracing is disabled in config or
// the build has no OpenTelemetry support.
bool InitializeTracing(const batch::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  RAII span, made the active span for its lifetime. Without OpenTelemetry,
  or before InitializeTracing, every call is a no-op.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);

  // adds an "exception" event and marks the span as failed
  void RecordException(std::string_view description);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace batch::observability
