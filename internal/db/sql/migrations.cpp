#include "internal/db/sql/migrations.hpp"

#include <stdexcept>

namespace batch::db::sql {

const std::vector<Migration>& SchemaMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       "job and job_group tables",
       {"CREATE TABLE IF NOT EXISTS job ("
        " id TEXT PRIMARY KEY,"
        " name TEXT NOT NULL,"
        " task_name TEXT NOT NULL,"
        " args_json TEXT NOT NULL,"
        " priority INTEGER NOT NULL,"
        " dependencies_json TEXT NOT NULL,"
        " max_attempts INTEGER NOT NULL,"
        " base_delay_ms INTEGER NOT NULL,"
        " multiplier REAL NOT NULL,"
        " max_delay_ms INTEGER NOT NULL,"
        " timeout_ms INTEGER NOT NULL,"
        " state INTEGER NOT NULL,"
        " attempt_count INTEGER NOT NULL,"
        " result_json TEXT,"
        " error_kind INTEGER NOT NULL DEFAULT 0,"
        " error_message TEXT NOT NULL DEFAULT '',"
        " last_error_kind INTEGER NOT NULL DEFAULT 0,"
        " last_error_message TEXT NOT NULL DEFAULT '',"
        " group_id TEXT NOT NULL DEFAULT '',"
        " tags_json TEXT NOT NULL,"
        " metadata_json TEXT NOT NULL,"
        " progress REAL NOT NULL DEFAULT 0,"
        " progress_message TEXT NOT NULL DEFAULT '',"
        " created_at_ms INTEGER NOT NULL,"
        " queued_at_ms INTEGER NOT NULL DEFAULT 0,"
        " started_at_ms INTEGER NOT NULL DEFAULT 0,"
        " finished_at_ms INTEGER NOT NULL DEFAULT 0,"
        " next_attempt_at_ms INTEGER NOT NULL DEFAULT 0,"
        " version INTEGER NOT NULL);",
        "CREATE INDEX IF NOT EXISTS job_state_idx ON job(state);",
        "CREATE TABLE IF NOT EXISTS job_group ("
        " id TEXT PRIMARY KEY,"
        " name TEXT NOT NULL,"
        " description TEXT NOT NULL DEFAULT '',"
        " metadata_json TEXT NOT NULL,"
        " sequential INTEGER NOT NULL,"
        " cancel_on_failure INTEGER NOT NULL,"
        " skip_on_failure INTEGER NOT NULL,"
        " canceled INTEGER NOT NULL,"
        " member_ids_json TEXT NOT NULL,"
        " state INTEGER NOT NULL,"
        " finished INTEGER NOT NULL,"
        " created_at_ms INTEGER NOT NULL,"
        " updated_at_ms INTEGER NOT NULL,"
        " version INTEGER NOT NULL);",
        "CREATE INDEX IF NOT EXISTS job_group_finished_idx ON job_group(finished);"}},
      {2,
       "pending-job listing index",
       {"CREATE INDEX IF NOT EXISTS job_state_created_idx ON job(state, created_at_ms);",
        "DROP INDEX IF EXISTS job_state_idx;"}},
  };
  return kMigrations;
}

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& migrations) {
  const int current = executor.SchemaVersion();
  const int latest  = migrations.empty() ? 0 : migrations.back().version;
  if (current > latest) {
    throw std::runtime_error("database schema version " + std::to_string(current) + " is newer than supported version " +
                             std::to_string(latest));
  }

  int applied = 0;
  for (const auto& migration : migrations) {
    if (migration.version <= current) continue;
    for (const auto& sql : migration.statements) {
      executor.ExecuteSQL(sql);
    }
    executor.SetSchemaVersion(migration.version);
    ++applied;
  }
  return applied;
}

} // namespace batch::db::sql
