#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace bookrec::camera {

/*
  Local artifact layout:

      <recordings_dir>/<camera_id>/recording_<YYYYmmdd_HHMMSS>_<booking_id>.mp4

  The timestamp is the UTC session start. Orphan recovery parses the same
  layout back, so the two functions must stay symmetric.
*/
std::filesystem::path ArtifactPath(const std::filesystem::path& recordings_dir, const std::string& camera_id, const std::string& booking_id,
                                   util::TimePoint started_at);

struct ArtifactName {
  std::string     camera_id;
  std::string     booking_id;
  util::TimePoint started_at;
};

std::optional<ArtifactName> ParseArtifactPath(const std::filesystem::path& path);

} // namespace bookrec::camera
