#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <string>

#include "internal/observability/tracing.hpp"

#ifndef BATCH_ENGINE_VERSION
#define BATCH_ENGINE_VERSION "0.0.0"
#endif

namespace batch::runtime::config {
class RuntimeConfig;
}

namespace batch::observability {

// Reads the observability section for one signal. Defaults come from the
// config loader, endpoint falls back to the OTEL_EXPORTER_* environment.
OtlpConfig ResolveOtlpConfig(const batch::runtime::config::RuntimeConfig& config, OtlpSignal signal);

std::string ResolveEndpoint(const OtlpConfig& config);

// service.name, service.version, service.instance.id and host.name. The
// instance id is generated once per process so traces and metrics agree.
opentelemetry::sdk::resource::Resource BuildResource(const OtlpConfig& config);

} // namespace batch::observability

#endif
