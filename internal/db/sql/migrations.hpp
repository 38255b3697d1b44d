#pragma once

#include <string>
#include <vector>

namespace batch::db::sql {

// One schema step. Versions start at 1 and increase by one.
struct Migration {
  int                      version = 0;
  std::string              description;
  std::vector<std::string> statements;
};

/*
  Backend hook for migrations. The recorded version is what the database
  says it has applied; 0 means an empty database.
*/
class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  virtual int  SchemaVersion()               = 0;
  virtual void SetSchemaVersion(int version) = 0;
};

// job and job_group tables, in apply order
const std::vector<Migration>& SchemaMigrations();

// Applies every migration newer than the recorded version and records each
// one as it lands. Returns how many ran. Throws std::runtime_error when the
// database was written by a newer schema than `migrations` knows about.
int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& migrations);

} // namespace batch::db::sql
