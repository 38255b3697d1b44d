#pragma once

namespace batch::db::sql {

/*
  Canonical SQL used by the sqlite backend.

  Upserts only replace a row when the incoming version is newer; an older
  snapshot arriving late leaves the row untouched.
*/

static constexpr const char* UPSERT_JOB =
    "INSERT INTO job(id,name,task_name,args_json,priority,dependencies_json,"
    "max_attempts,base_delay_ms,multiplier,max_delay_ms,timeout_ms,"
    "state,attempt_count,result_json,error_kind,error_message,last_error_kind,last_error_message,"
    "group_id,tags_json,metadata_json,progress,progress_message,"
    "created_at_ms,queued_at_ms,started_at_ms,finished_at_ms,next_attempt_at_ms,version)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " name=excluded.name,"
    " task_name=excluded.task_name,"
    " args_json=excluded.args_json,"
    " priority=excluded.priority,"
    " dependencies_json=excluded.dependencies_json,"
    " max_attempts=excluded.max_attempts,"
    " base_delay_ms=excluded.base_delay_ms,"
    " multiplier=excluded.multiplier,"
    " max_delay_ms=excluded.max_delay_ms,"
    " timeout_ms=excluded.timeout_ms,"
    " state=excluded.state,"
    " attempt_count=excluded.attempt_count,"
    " result_json=excluded.result_json,"
    " error_kind=excluded.error_kind,"
    " error_message=excluded.error_message,"
    " last_error_kind=excluded.last_error_kind,"
    " last_error_message=excluded.last_error_message,"
    " group_id=excluded.group_id,"
    " tags_json=excluded.tags_json,"
    " metadata_json=excluded.metadata_json,"
    " progress=excluded.progress,"
    " progress_message=excluded.progress_message,"
    " created_at_ms=excluded.created_at_ms,"
    " queued_at_ms=excluded.queued_at_ms,"
    " started_at_ms=excluded.started_at_ms,"
    " finished_at_ms=excluded.finished_at_ms,"
    " next_attempt_at_ms=excluded.next_attempt_at_ms,"
    " version=excluded.version"
    " WHERE excluded.version > job.version;";

#define BATCH_JOB_COLUMNS                                                                    \
  "id,name,task_name,args_json,priority,dependencies_json,"                                  \
  "max_attempts,base_delay_ms,multiplier,max_delay_ms,timeout_ms,"                           \
  "state,attempt_count,result_json,error_kind,error_message,last_error_kind,last_error_message," \
  "group_id,tags_json,metadata_json,progress,progress_message,"                              \
  "created_at_ms,queued_at_ms,started_at_ms,finished_at_ms,next_attempt_at_ms,version"

static constexpr const char* SELECT_JOB =
    "SELECT " BATCH_JOB_COLUMNS " FROM job WHERE id=?;";

static constexpr const char* SELECT_PENDING_JOBS =
    "SELECT " BATCH_JOB_COLUMNS " FROM job WHERE state NOT IN (6,7,8)"
    " ORDER BY created_at_ms, id;";

#undef BATCH_JOB_COLUMNS

static constexpr const char* DELETE_JOB =
    "DELETE FROM job WHERE id=?;";

// groups

static constexpr const char* UPSERT_GROUP =
    "INSERT INTO job_group(id,name,description,metadata_json,sequential,cancel_on_failure,"
    "skip_on_failure,canceled,member_ids_json,state,finished,created_at_ms,updated_at_ms,version)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " name=excluded.name,"
    " description=excluded.description,"
    " metadata_json=excluded.metadata_json,"
    " sequential=excluded.sequential,"
    " cancel_on_failure=excluded.cancel_on_failure,"
    " skip_on_failure=excluded.skip_on_failure,"
    " canceled=excluded.canceled,"
    " member_ids_json=excluded.member_ids_json,"
    " state=excluded.state,"
    " finished=excluded.finished,"
    " created_at_ms=excluded.created_at_ms,"
    " updated_at_ms=excluded.updated_at_ms,"
    " version=excluded.version"
    " WHERE excluded.version > job_group.version;";

static constexpr const char* SELECT_GROUP =
    "SELECT id,name,description,metadata_json,sequential,cancel_on_failure,skip_on_failure,canceled,"
    "member_ids_json,state,finished,created_at_ms,updated_at_ms,version"
    " FROM job_group WHERE id=?;";

static constexpr const char* SELECT_UNFINISHED_GROUPS =
    "SELECT id,name,description,metadata_json,sequential,cancel_on_failure,skip_on_failure,canceled,"
    "member_ids_json,state,finished,created_at_ms,updated_at_ms,version"
    " FROM job_group WHERE finished=0 ORDER BY created_at_ms, id;";

} // namespace batch::db::sql
