#include "orphan_recovery.hpp"

#include "internal/camera/artifact_naming.hpp"
#include "internal/observability/logging.hpp"

namespace bookrec::upload {

std::size_t RecoverOrphans(const std::filesystem::path& recordings_dir, const std::vector<std::string>& camera_ids, const std::string& user_id,
                           UploadQueue& queue) {
  std::size_t recovered = 0;

  for (const auto& camera_id : camera_ids) {
    const auto      dir = recordings_dir / camera_id;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
      continue;
    }

    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
      if (!it->is_regular_file(ec)) {
        continue;
      }

      auto name = camera::ParseArtifactPath(it->path());
      if (!name || name->camera_id != camera_id || queue.Find(name->booking_id)) {
        continue;
      }

      model::UploadTask task;
      task.booking_id    = name->booking_id;
      task.camera_id     = camera_id;
      task.user_id       = user_id;
      task.artifact_path = it->path().string();

      const auto outcome = queue.Enqueue(task);
      if (outcome == EnqueueOutcome::kFull) {
        BOOKREC_LOG_WARN("Upload queue full during orphan recovery", {observability::StringField("camera_id", camera_id)});
        return recovered;
      }
      if (outcome == EnqueueOutcome::kQueued) {
        ++recovered;
        BOOKREC_LOG_INFO("Orphaned recording queued for upload", {observability::StringField("booking_id", task.booking_id),
                                                                  observability::StringField("path", task.artifact_path)});
      }
    }

    if (ec) {
      BOOKREC_LOG_WARN("Recordings directory scan failed",
                       {observability::StringField("path", dir.string()), observability::StringField("error", ec.message())});
    }
  }
  return recovered;
}

} // namespace bookrec::upload
