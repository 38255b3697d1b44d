#include "internal/observability/otlp.hpp"

#ifdef ENABLE_OTEL

#include <unistd.h>

#include <cstdlib>

#include "config/config.pb.h"
#include "internal/util/uuid.hpp"

namespace batch::observability {
namespace resource = opentelemetry::sdk::resource;

namespace {

const std::string& InstanceId() {
  static const std::string id = batch::util::NewId();
  return id;
}

std::string HostName() {
  char buffer[256] = {};
  if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
    return "unknown";
  }
  return buffer;
}

} // namespace

OtlpConfig ResolveOtlpConfig(const batch::runtime::config::RuntimeConfig& config, OtlpSignal signal) {
  const auto& observability = config.observability();

  OtlpConfig otlp;
  otlp.signal    = signal;
  otlp.endpoint  = observability.otlp_endpoint();
  otlp.transport = observability.transport() == batch::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (!observability.service_name().empty()) {
    otlp.service_name = observability.service_name();
  }
  if (observability.collection_interval_ms() > 0) {
    otlp.collection_interval_ms = observability.collection_interval_ms();
  }
  if (observability.trace_sample_ratio() > 0.0 && observability.trace_sample_ratio() <= 1.0) {
    otlp.sample_ratio = observability.trace_sample_ratio();
  }
  return otlp;
}

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  const bool  traces = config.signal == OtlpSignal::kTraces;
  const char* signal_env = std::getenv(traces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
  if (signal_env != nullptr) {
    return signal_env;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  if (config.transport == OtlpTransport::kGrpc) {
    return "localhost:4317";
  }
  return traces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {
      {"service.name", config.service_name},
      {"service.version", std::string(BATCH_ENGINE_VERSION)},
      {"service.instance.id", InstanceId()},
      {"host.name", HostName()},
  };
  return resource::Resource::Create(attrs);
}

} // namespace batch::observability

#endif
