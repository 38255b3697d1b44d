#pragma once

#include <sqlite3.h>

#include <string>

#include "internal/db/sql/migrations.hpp"

namespace batch::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Opening a database applies the job schema, so a fresh file is usable
  immediately.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // PRAGMA user_version
  int  SchemaVersion() override;
  void SetSchemaVersion(int version) override;

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  // all pending migrations in one transaction
  void Migrate();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace batch::db::sqlite
