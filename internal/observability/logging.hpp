#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace batch::runtime::config {
class RuntimeConfig;
}

namespace batch::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

// Console sink always, plus a file sink when logging.file is set. Level,
// pattern and trace-context tagging can be overridden with BATCH_LOG_LEVEL,
// BATCH_LOG_PATTERN and BATCH_LOG_INCLUDE_TRACE_CONTEXT.
void InitializeLogging(const batch::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// While alive, every line logged from this thread carries job_id and
// attempt. Scopes nest; the outer job is restored on destruction.
class ScopedJobContext {
 public:
  ScopedJobContext(std::string_view job_id, std::uint32_t attempt);
  ~ScopedJobContext();

  ScopedJobContext(const ScopedJobContext&)            = delete;
  ScopedJobContext& operator=(const ScopedJobContext&) = delete;

 private:
  std::string   previous_job_id_;
  std::uint32_t previous_attempt_;
};

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace batch::observability

#define BATCH_LOG_DEBUG(message, ...) ::batch::observability::LogDebug((message), ##__VA_ARGS__)
#define BATCH_LOG_INFO(message, ...) ::batch::observability::LogInfo((message), ##__VA_ARGS__)
#define BATCH_LOG_WARN(message, ...) ::batch::observability::LogWarn((message), ##__VA_ARGS__)
#define BATCH_LOG_ERROR(message, ...) ::batch::observability::LogError((message), ##__VA_ARGS__)
