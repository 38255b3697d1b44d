#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define BATCH_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define BATCH_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace batch::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

opentelemetry::nostd::string_view View(std::string_view value) {
  return opentelemetry::nostd::string_view(value.data(), value.size());
}

template <typename Provider>
void ConfigureResource(Provider& provider, const opentelemetry::sdk::resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> job_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      job_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   queue_depth_gauge;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> group_outcomes;

  std::atomic<std::int64_t> queue_depth{0};

  static void ObserveQueueDepth(metrics_api::ObserverResult result, void* state) {
    auto* impl       = static_cast<Impl*>(state);
    auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
    int_result->Observe(impl->queue_depth.load());
  }
};

bool InitializeMetrics(const batch::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = ResolveOtlpConfig(config, OtlpSignal::kMetrics);
  const auto endpoint    = ResolveEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(otlp_config.collection_interval_ms);
#ifdef BATCH_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  auto resource = BuildResource(otlp_config);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  ConfigureResource(*g_provider, resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("batch.engine", BATCH_ENGINE_VERSION);

  impl_->request_count      = impl_->meter->CreateUInt64Counter("batch.request.count", "1", "Total number of service requests");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("batch.request.latency_ms", "ms", "End-to-end request latency in milliseconds");
  impl_->job_outcomes       = impl_->meter->CreateUInt64Counter("batch.job.outcomes", "1", "Job attempt outcomes by task");
  impl_->job_duration_ms    = impl_->meter->CreateDoubleHistogram("batch.job.duration_ms", "ms", "Job attempt execution time in milliseconds");
  impl_->queue_depth_gauge  = impl_->meter->CreateInt64ObservableGauge("batch.queue.depth", "Jobs waiting for a worker", "1");
  impl_->group_outcomes     = impl_->meter->CreateUInt64Counter("batch.group.outcomes", "1", "Finished groups by final state");
  impl_->queue_depth_gauge->AddCallback(Impl::ObserveQueueDepth, impl_.get());
}

Metrics::~Metrics() {
  if (impl_ && impl_->queue_depth_gauge) {
    impl_->queue_depth_gauge->RemoveCallback(Impl::ObserveQueueDepth, impl_.get());
  }
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", View(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", View(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordJobOutcome(std::string_view task_name, std::string_view outcome) {
  if (!impl_ || !impl_->job_outcomes) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"task", View(task_name)}, {"outcome", View(outcome)}};
  AddWithAttributes(impl_->job_outcomes, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveJobDurationMs(std::string_view task_name, double duration_ms) {
  if (!impl_ || !impl_->job_duration_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"task", View(task_name)}};
  RecordWithAttributes(impl_->job_duration_ms, duration_ms, attributes);
}

void Metrics::SetQueueDepth(std::uint64_t depth) {
  if (!impl_) {
    return;
  }
  impl_->queue_depth.store(static_cast<std::int64_t>(depth));
}

void Metrics::RecordGroupOutcome(std::string_view outcome) {
  if (!impl_ || !impl_->group_outcomes) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"outcome", View(outcome)}};
  AddWithAttributes(impl_->group_outcomes, static_cast<std::uint64_t>(1), attributes);
}

} // namespace batch::observability

#else

namespace batch::observability {

bool InitializeMetrics(const batch::runtime::config::RuntimeConfig&) {
  return false;
}

void ShutdownMetrics() {}

struct Metrics::Impl {};

Metrics::Metrics()  = default;
Metrics::~Metrics() = default;

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view, bool) {}
void Metrics::ObserveRequestLatencyMs(std::string_view, double) {}
void Metrics::RecordJobOutcome(std::string_view, std::string_view) {}
void Metrics::ObserveJobDurationMs(std::string_view, double) {}
void Metrics::SetQueueDepth(std::uint64_t) {}
void Metrics::RecordGroupOutcome(std::string_view) {}

} // namespace batch::observability

#endif

