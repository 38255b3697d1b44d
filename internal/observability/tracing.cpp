#include "internal/observability/tracing.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/parent_factory.h>
#include <opentelemetry/sdk/trace/samplers/trace_id_ratio_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <mutex>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace batch::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

constexpr const char* kTracerName = "batch.engine";

using TracerPtr = opentelemetry::nostd::shared_ptr<trace_api::Tracer>;

std::mutex                                g_mutex;
std::shared_ptr<sdktrace::TracerProvider> g_sdk_provider;
TracerPtr                                 g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

// Child spans follow the parent's decision; roots are kept at sample_ratio.
std::unique_ptr<sdktrace::Sampler> MakeSampler(const OtlpConfig& config) {
  std::shared_ptr<sdktrace::Sampler> root = sdktrace::TraceIdRatioBasedSamplerFactory::Create(config.sample_ratio);
  return sdktrace::ParentBasedSamplerFactory::Create(root);
}

// Spans opened before InitializeTracing (or with tracing off) go to whatever
// provider is installed globally, which is the no-op provider by default.
TracerPtr CurrentTracer() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_tracer) {
    if (auto provider = trace_api::Provider::GetTracerProvider()) {
      g_tracer = provider->GetTracer(kTracerName, BATCH_ENGINE_VERSION);
    }
  }
  return g_tracer;
}

} // namespace

bool InitializeTracing(const batch::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto otlp_config = ResolveOtlpConfig(config, OtlpSignal::kTraces);

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(otlp_config), sdktrace::BatchSpanProcessorOptions{});
  std::shared_ptr<sdktrace::TracerProvider> provider =
      sdktrace::TracerProviderFactory::Create(std::move(processor), BuildResource(otlp_config), MakeSampler(otlp_config));

  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(provider));

  std::lock_guard<std::mutex> lock(g_mutex);
  g_sdk_provider = std::move(provider);
  g_tracer       = g_sdk_provider->GetTracer(kTracerName, BATCH_ENGINE_VERSION);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  std::shared_ptr<sdktrace::TracerProvider> provider;
  {
    std::lock_guard<std::mutex> lock(g_mutex);
    provider = std::move(g_sdk_provider);
    g_tracer = nullptr;
  }
  if (provider) {
    provider->ForceFlush();
    provider->Shutdown();
  }
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;

  template <typename Value>
  void Set(std::string_view key, Value value) {
    if (span) {
      span->SetAttribute(opentelemetry::nostd::string_view(key.data(), key.size()), value);
    }
  }
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = CurrentTracer();
  if (!tracer) {
    return;
  }

  impl_->span  = tracer->StartSpan(opentelemetry::nostd::string_view(name.data(), name.size()));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (!impl_ || !impl_->span) {
    return;
  }
  // leave the active-span stack before ending so nested scopes unwind in order
  impl_->scope.reset();
  impl_->span->End();
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_) {
    impl_->Set(key, opentelemetry::nostd::string_view(value.data(), value.size()));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_) {
    impl_->Set(key, value);
  }
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_) {
    impl_->Set(key, value);
  }
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent(opentelemetry::nostd::string_view(name.data(), name.size()));
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_ || !impl_->span) {
    return;
  }
  const std::string message(description);
  impl_->span->AddEvent("exception", {{"exception.message", message}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, message);
}

} // namespace batch::observability

#else

namespace batch::observability {

bool InitializeTracing(const batch::runtime::config::RuntimeConfig&) {
  return false;
}

void ShutdownTracing() {}

struct SpanScope::Impl {};

SpanScope::SpanScope(std::string_view) {}
SpanScope::~SpanScope() = default;

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view, std::string_view) {}
void SpanScope::SetAttribute(std::string_view, std::int64_t) {}
void SpanScope::SetAttribute(std::string_view, double) {}
void SpanScope::AddEvent(std::string_view) {}
void SpanScope::RecordException(std::string_view) {}

} // namespace batch::observability

#endif
