#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace batch::db::model {

/*
  Flat, backend-neutral row for one job.

  Structured fields (args, result, dependencies, tags, metadata) travel as
  JSON text; enums as their integer values; timestamps as unix millis with
  0 meaning "unset".
*/
struct JobRecord {
  std::string id;
  std::string name;
  std::string task_name;

  std::string args_json         = "{}";
  int         priority          = 1;
  std::string dependencies_json = "[]";

  uint32_t max_attempts  = 1;
  uint64_t base_delay_ms = 0;
  double   multiplier    = 1.0;
  uint64_t max_delay_ms  = 0;
  uint64_t timeout_ms    = 0;

  int      state         = 1;
  uint32_t attempt_count = 0;

  std::optional<std::string> result_json;
  int                        error_kind = 0; // 0 = no error
  std::string                error_message;
  int                        last_error_kind = 0;
  std::string                last_error_message;

  std::string group_id;
  std::string tags_json     = "[]";
  std::string metadata_json = "{}";

  double      progress = 0.0;
  std::string progress_message;

  uint64_t created_at_ms      = 0;
  uint64_t queued_at_ms       = 0;
  uint64_t started_at_ms      = 0;
  uint64_t finished_at_ms     = 0;
  uint64_t next_attempt_at_ms = 0;

  uint64_t version = 0;
};

} // namespace batch::db::model
