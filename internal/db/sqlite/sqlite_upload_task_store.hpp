#pragma once

#include <memory>
#include <string>

#include "internal/upload/upload_task_store.hpp"
#include "sqlite_db.hpp"

namespace bookrec::db::sqlite {

/*
  UploadTaskStore on a local SQLite file.

  Schema (created on construction):

      upload_task(booking_id PK, camera_id, user_id, artifact_path,
                  attempt_count, status, not_before_ms, created_at_ms,
                  finished_at_ms, remote_url, last_error)
*/
class SqliteUploadTaskStore final : public upload::UploadTaskStore {
 public:
  explicit SqliteUploadTaskStore(std::shared_ptr<SqliteDB> db);

  Result Upsert(const model::UploadTask& task) override;
  Result Delete(const std::string& booking_id) override;

  // Throws std::runtime_error when the table cannot be read.
  std::vector<model::UploadTask> LoadAll() override;

 private:
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace bookrec::db::sqlite
