#include "sqlite_db.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace batch::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  try {
    Configure();
    Migrate();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

int SqliteDB::SchemaVersion() {
  sqlite3_stmt* stmt = nullptr;
  ThrowIf(sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &stmt, nullptr), db_, "read user_version");

  int version = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    version = sqlite3_column_int(stmt, 0);
  }
  sqlite3_finalize(stmt);
  return version;
}

void SqliteDB::SetSchemaVersion(int version) {
  Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

void SqliteDB::Migrate() {
  const int from = SchemaVersion();

  Exec("BEGIN IMMEDIATE;");
  int applied = 0;
  try {
    applied = sql::RunMigrations(*this, sql::SchemaMigrations());
    Exec("COMMIT;");
  } catch (const std::exception& e) {
    BATCH_LOG_ERROR("sqlite migration failed", {observability::StringField("db", path_), observability::StringField("error", e.what())});
    Exec("ROLLBACK;");
    throw;
  }

  if (applied > 0) {
    BATCH_LOG_INFO("sqlite schema migrated", {observability::StringField("db", path_), observability::IntField("from", from),
                                              observability::IntField("to", SchemaVersion())});
  }
}

void SqliteDB::Configure() {
  // WAL keeps readers off the writer's lock
  Exec("PRAGMA journal_mode=WAL;");

  // a job transition is re-derivable on restart; NORMAL is enough
  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace batch::db::sqlite
