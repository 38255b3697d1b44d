#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace batch::observability {
namespace {

constexpr const char* kLoggerName     = "batch-engine";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [t%t] %v";

struct LogSettings {
  spdlog::level::level_enum level{spdlog::level::info};
  std::string               pattern{kDefaultPattern};
  std::string               file;
  bool                      include_trace_context{false};
};

std::string FromEnv(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  return value != nullptr && *value != '\0' ? std::string(value) : fallback;
}

LogSettings ResolveSettings(const batch::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  LogSettings settings;
  settings.level   = spdlog::level::from_str(FromEnv("BATCH_LOG_LEVEL", logging.level().empty() ? "info" : logging.level()));
  settings.pattern = FromEnv("BATCH_LOG_PATTERN", logging.pattern().empty() ? kDefaultPattern : logging.pattern());
  settings.file    = logging.file();

  const auto trace_flag          = FromEnv("BATCH_LOG_INCLUDE_TRACE_CONTEXT", logging.include_trace_context() ? "true" : "false");
  settings.include_trace_context = trace_flag == "1" || trace_flag == "true";
  return settings;
}

bool g_include_trace_context{false};

thread_local std::string   t_job_id;
thread_local std::uint32_t t_attempt{0};

// Values with spaces, quotes or '=' are quoted so error messages stay one field.
void AppendField(std::string& line, std::string_view key, std::string_view value) {
  line.push_back(' ');
  line.append(key);
  line.push_back('=');

  if (!value.empty() && value.find_first_of(" \t\"=") == std::string_view::npos) {
    line.append(value);
    return;
  }

  line.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') {
      line.push_back('\\');
    }
    line.push_back(c);
  }
  line.push_back('"');
}

void AppendJobContext(std::string& line, std::initializer_list<LogField> fields) {
  if (t_job_id.empty()) {
    return;
  }
  for (const auto& field : fields) {
    if (field.key == "job_id") {
      return;
    }
  }
  AppendField(line, "job_id", t_job_id);
  AppendField(line, "attempt", std::to_string(t_attempt));
}

#ifdef ENABLE_OTEL
std::string Hex(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out(size * 2, '0');
  for (std::size_t i = 0; i < size; ++i) {
    out[2 * i]     = kHex[data[i] >> 4];
    out[2 * i + 1] = kHex[data[i] & 0x0F];
  }
  return out;
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span || !span->GetContext().IsValid()) {
    return;
  }

  const auto context = span->GetContext();
  uint8_t    trace_bytes[16];
  uint8_t    span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  AppendField(line, "trace_id", Hex(trace_bytes, sizeof(trace_bytes)));
  AppendField(line, "span_id", Hex(span_bytes, sizeof(span_bytes)));
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

void InitializeLogging(const batch::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveSettings(config);

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!settings.file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.file));
  }

  // re-initialization replaces the previous logger
  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(settings.pattern);
  logger->set_level(settings.level);
  logger->flush_on(spdlog::level::warn);
  spdlog::register_logger(logger);
  spdlog::set_default_logger(std::move(logger));

  g_include_trace_context = settings.include_trace_context;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

ScopedJobContext::ScopedJobContext(std::string_view job_id, std::uint32_t attempt)
    : previous_job_id_(std::move(t_job_id)), previous_attempt_(t_attempt) {
  t_job_id  = std::string(job_id);
  t_attempt = attempt;
}

ScopedJobContext::~ScopedJobContext() {
  t_job_id  = std::move(previous_job_id_);
  t_attempt = previous_attempt_;
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::default_logger_raw()->should_log(level)) {
    return;
  }

  std::string line(message);
  for (const auto& field : fields) {
    AppendField(line, field.key, field.value);
  }
  AppendJobContext(line, fields);
  AppendTraceContext(line);

  spdlog::log(level, "{}", line);
}

} // namespace batch::observability
