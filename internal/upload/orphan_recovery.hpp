#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "upload_queue.hpp"

namespace bookrec::upload {

/*
  Startup scan for recordings that never made it into the queue (the
  process died between finalize and enqueue, or the task store was lost).

  Every file under <recordings_dir>/<camera_id>/ that parses as an artifact
  name and has no task is enqueued. Returns the number enqueued.
*/
std::size_t RecoverOrphans(const std::filesystem::path& recordings_dir, const std::vector<std::string>& camera_ids, const std::string& user_id,
                           UploadQueue& queue);

} // namespace bookrec::upload
