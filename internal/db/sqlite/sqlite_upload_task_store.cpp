#include "sqlite_upload_task_store.hpp"

#include <stdexcept>

namespace bookrec::db::sqlite {

namespace {

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS upload_task (
  booking_id     TEXT PRIMARY KEY,
  camera_id      TEXT NOT NULL,
  user_id        TEXT NOT NULL DEFAULT '',
  artifact_path  TEXT NOT NULL,
  attempt_count  INTEGER NOT NULL DEFAULT 0,
  status         TEXT NOT NULL,
  not_before_ms  INTEGER NOT NULL DEFAULT 0,
  created_at_ms  INTEGER NOT NULL DEFAULT 0,
  finished_at_ms INTEGER NOT NULL DEFAULT 0,
  remote_url     TEXT NOT NULL DEFAULT '',
  last_error     TEXT NOT NULL DEFAULT ''
);
)SQL";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

std::int64_t ToMillis(util::TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

util::TimePoint FromMillis(std::int64_t ms) {
  return util::TimePoint(std::chrono::milliseconds(ms));
}

} // namespace

SqliteUploadTaskStore::SqliteUploadTaskStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec(kSchema);
}

Result SqliteUploadTaskStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteUploadTaskStore::Upsert(const model::UploadTask& task) {
  auto* db = db_->Handle();

  const char* sql =
      "INSERT INTO upload_task(booking_id,camera_id,user_id,artifact_path,attempt_count,status,not_before_ms,created_at_ms,finished_at_ms,"
      "remote_url,last_error) "
      "VALUES(?,?,?,?,?,?,?,?,?,?,?) "
      "ON CONFLICT(booking_id) DO UPDATE SET "
      "camera_id=excluded.camera_id, user_id=excluded.user_id, artifact_path=excluded.artifact_path, "
      "attempt_count=excluded.attempt_count, status=excluded.status, not_before_ms=excluded.not_before_ms, "
      "finished_at_ms=excluded.finished_at_ms, "
      "remote_url=excluded.remote_url, last_error=excluded.last_error;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, task.booking_id);
  BindText(st, 2, task.camera_id);
  BindText(st, 3, task.user_id);
  BindText(st, 4, task.artifact_path);
  BindI64(st, 5, task.attempt_count);
  BindText(st, 6, std::string(model::ToString(task.status)));
  BindI64(st, 7, ToMillis(task.not_before));
  BindI64(st, 8, ToMillis(task.created_at));
  BindI64(st, 9, ToMillis(task.finished_at));
  BindText(st, 10, task.remote_url);
  BindText(st, 11, task.last_error);

  int    rc     = sqlite3_step(st);
  Result result = Translate(db, rc);
  sqlite3_finalize(st);

  return result;
}

Result SqliteUploadTaskStore::Delete(const std::string& booking_id) {
  auto* db = db_->Handle();

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "DELETE FROM upload_task WHERE booking_id = ?;", -1, &st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }

  BindText(st, 1, booking_id);
  int    rc     = sqlite3_step(st);
  Result result = Translate(db, rc);
  sqlite3_finalize(st);

  return result;
}

std::vector<model::UploadTask> SqliteUploadTaskStore::LoadAll() {
  sqlite3_stmt* st = db_->Prepare(
      "SELECT booking_id,camera_id,user_id,artifact_path,attempt_count,status,not_before_ms,created_at_ms,finished_at_ms,remote_url,"
      "last_error "
      "FROM upload_task ORDER BY created_at_ms, booking_id;");

  std::vector<model::UploadTask> out;
  int                            rc = SQLITE_OK;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    const auto status = model::ParseUploadStatus(ColText(st, 5));
    if (!status) {
      continue;
    }

    model::UploadTask task;
    task.booking_id    = ColText(st, 0);
    task.camera_id     = ColText(st, 1);
    task.user_id       = ColText(st, 2);
    task.artifact_path = ColText(st, 3);
    task.attempt_count = static_cast<std::uint32_t>(ColI64(st, 4));
    task.status        = *status;
    task.not_before    = FromMillis(ColI64(st, 6));
    task.created_at    = FromMillis(ColI64(st, 7));
    task.finished_at   = FromMillis(ColI64(st, 8));
    task.remote_url    = ColText(st, 9);
    task.last_error    = ColText(st, 10);
    out.push_back(std::move(task));
  }
  const std::string error = rc == SQLITE_DONE ? std::string{} : sqlite3_errmsg(db_->Handle());
  sqlite3_finalize(st);

  if (rc != SQLITE_DONE) {
    throw std::runtime_error("upload_task scan: " + error);
  }
  return out;
}

} // namespace bookrec::db::sqlite
