#pragma once

#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/model/upload_task.hpp"

namespace bookrec::upload {

/*
  Durable copy of the upload queue, keyed by booking_id.

  The queue writes through on every state change and hydrates from
  LoadAll() at startup, so a crash never loses a finalized recording.
  Uploaded tasks are deleted once their retention window has passed.
*/
class UploadTaskStore {
 public:
  virtual ~UploadTaskStore() = default;

  virtual db::Result Upsert(const model::UploadTask& task) = 0;

  // OK when no row exists for the id
  virtual db::Result Delete(const std::string& booking_id) = 0;

  virtual std::vector<model::UploadTask> LoadAll() = 0;
};

} // namespace bookrec::upload
