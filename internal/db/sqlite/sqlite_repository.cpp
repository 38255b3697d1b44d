#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"

namespace batch::db::sqlite {

using batch::db::ErrorCode;
using batch::db::Result;

namespace {

/*
  Owns a prepared statement for the duration of one call.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) st_ = nullptr;
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }
  explicit operator bool() const {
    return st_ != nullptr;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

model::JobRecord ReadJob(sqlite3_stmt* st) {
  model::JobRecord r;
  r.id                 = ColText(st, 0);
  r.name               = ColText(st, 1);
  r.task_name          = ColText(st, 2);
  r.args_json          = ColText(st, 3);
  r.priority           = ColI32(st, 4);
  r.dependencies_json  = ColText(st, 5);
  r.max_attempts       = static_cast<uint32_t>(ColI32(st, 6));
  r.base_delay_ms      = ColU64(st, 7);
  r.multiplier         = ColDouble(st, 8);
  r.max_delay_ms       = ColU64(st, 9);
  r.timeout_ms         = ColU64(st, 10);
  r.state              = ColI32(st, 11);
  r.attempt_count      = static_cast<uint32_t>(ColI32(st, 12));
  r.result_json        = ColOptText(st, 13);
  r.error_kind         = ColI32(st, 14);
  r.error_message      = ColText(st, 15);
  r.last_error_kind    = ColI32(st, 16);
  r.last_error_message = ColText(st, 17);
  r.group_id           = ColText(st, 18);
  r.tags_json          = ColText(st, 19);
  r.metadata_json      = ColText(st, 20);
  r.progress           = ColDouble(st, 21);
  r.progress_message   = ColText(st, 22);
  r.created_at_ms      = ColU64(st, 23);
  r.queued_at_ms       = ColU64(st, 24);
  r.started_at_ms      = ColU64(st, 25);
  r.finished_at_ms     = ColU64(st, 26);
  r.next_attempt_at_ms = ColU64(st, 27);
  r.version            = ColU64(st, 28);
  return r;
}

model::GroupRecord ReadGroup(sqlite3_stmt* st) {
  model::GroupRecord r;
  r.id                = ColText(st, 0);
  r.name              = ColText(st, 1);
  r.description       = ColText(st, 2);
  r.metadata_json     = ColText(st, 3);
  r.sequential        = ColI32(st, 4) != 0;
  r.cancel_on_failure = ColI32(st, 5) != 0;
  r.skip_on_failure   = ColI32(st, 6) != 0;
  r.canceled          = ColI32(st, 7) != 0;
  r.member_ids_json   = ColText(st, 8);
  r.state             = ColI32(st, 9);
  r.finished          = ColI32(st, 10) != 0;
  r.created_at_ms     = ColU64(st, 11);
  r.updated_at_ms     = ColU64(st, 12);
  r.version           = ColU64(st, 13);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(TxMode mode) {
  return std::make_unique<SqliteTransaction>(db_, mode);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::UpsertJob(Transaction& t, const model::JobRecord& r) {
  if (t.Mode() == TxMode::kRead) return Result::Err(ErrorCode::ReadOnly, "upsert job " + r.id);
  auto* db = TX(t).Handle();

  Statement st(db, sql::UPSERT_JOB);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  auto* s = st.get();
  BindText(s, 1, r.id);
  BindText(s, 2, r.name);
  BindText(s, 3, r.task_name);
  BindText(s, 4, r.args_json);
  BindI32(s, 5, r.priority);
  BindText(s, 6, r.dependencies_json);
  BindI32(s, 7, static_cast<int>(r.max_attempts));
  BindU64(s, 8, r.base_delay_ms);
  BindDouble(s, 9, r.multiplier);
  BindU64(s, 10, r.max_delay_ms);
  BindU64(s, 11, r.timeout_ms);
  BindI32(s, 12, r.state);
  BindI32(s, 13, static_cast<int>(r.attempt_count));
  BindOptText(s, 14, r.result_json);
  BindI32(s, 15, r.error_kind);
  BindText(s, 16, r.error_message);
  BindI32(s, 17, r.last_error_kind);
  BindText(s, 18, r.last_error_message);
  BindText(s, 19, r.group_id);
  BindText(s, 20, r.tags_json);
  BindText(s, 21, r.metadata_json);
  BindDouble(s, 22, r.progress);
  BindText(s, 23, r.progress_message);
  BindU64(s, 24, r.created_at_ms);
  BindU64(s, 25, r.queued_at_ms);
  BindU64(s, 26, r.started_at_ms);
  BindU64(s, 27, r.finished_at_ms);
  BindU64(s, 28, r.next_attempt_at_ms);
  BindU64(s, 29, r.version);

  return Translate(db, sqlite3_step(s));
}

std::optional<model::JobRecord> SqliteRepository::GetJob(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_JOB);
  if (!st) return std::nullopt;

  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  return ReadJob(st.get());
}

std::vector<model::JobRecord> SqliteRepository::ListPendingJobs(Transaction& t) {
  auto* db = TX(t).Handle();

  std::vector<model::JobRecord> out;
  Statement                     st(db, sql::SELECT_PENDING_JOBS);
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadJob(st.get()));
  }
  return out;
}

Result SqliteRepository::DeleteJob(Transaction& t, const std::string& id) {
  if (t.Mode() == TxMode::kRead) return Result::Err(ErrorCode::ReadOnly, "delete job " + id);
  auto* db = TX(t).Handle();

  Statement st(db, sql::DELETE_JOB);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Groups
// ------------------------------------------------------------------

Result SqliteRepository::UpsertGroup(Transaction& t, const model::GroupRecord& r) {
  if (t.Mode() == TxMode::kRead) return Result::Err(ErrorCode::ReadOnly, "upsert group " + r.id);
  auto* db = TX(t).Handle();

  Statement st(db, sql::UPSERT_GROUP);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  auto* s = st.get();
  BindText(s, 1, r.id);
  BindText(s, 2, r.name);
  BindText(s, 3, r.description);
  BindText(s, 4, r.metadata_json);
  BindI32(s, 5, r.sequential ? 1 : 0);
  BindI32(s, 6, r.cancel_on_failure ? 1 : 0);
  BindI32(s, 7, r.skip_on_failure ? 1 : 0);
  BindI32(s, 8, r.canceled ? 1 : 0);
  BindText(s, 9, r.member_ids_json);
  BindI32(s, 10, r.state);
  BindI32(s, 11, r.finished ? 1 : 0);
  BindU64(s, 12, r.created_at_ms);
  BindU64(s, 13, r.updated_at_ms);
  BindU64(s, 14, r.version);

  return Translate(db, sqlite3_step(s));
}

std::optional<model::GroupRecord> SqliteRepository::GetGroup(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_GROUP);
  if (!st) return std::nullopt;

  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  return ReadGroup(st.get());
}

std::vector<model::GroupRecord> SqliteRepository::ListUnfinishedGroups(Transaction& t) {
  auto* db = TX(t).Handle();

  std::vector<model::GroupRecord> out;
  Statement                       st(db, sql::SELECT_UNFINISHED_GROUPS);
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadGroup(st.get()));
  }
  return out;
}

} // namespace batch::db::sqlite
