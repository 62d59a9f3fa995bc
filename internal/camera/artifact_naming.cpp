#include "artifact_naming.hpp"

#include <absl/strings/match.h>
#include <absl/time/time.h>

#include <string_view>

#include "internal/storage/common/path_utils.hpp"

namespace bookrec::camera {

namespace {
constexpr const char* kPrefix      = "recording_";
constexpr const char* kExtension   = ".mp4";
constexpr const char* kStampFormat = "%Y%m%d_%H%M%S";
constexpr std::size_t kStampLength = 15;
} // namespace

std::filesystem::path ArtifactPath(const std::filesystem::path& recordings_dir, const std::string& camera_id, const std::string& booking_id,
                                   util::TimePoint started_at) {
  storage::common::ValidatePathComponent(camera_id, "camera id");
  storage::common::ValidateBookingId(booking_id);

  const auto stamp = absl::FormatTime(kStampFormat, absl::FromChrono(started_at), absl::UTCTimeZone());
  return recordings_dir / camera_id / (std::string(kPrefix) + stamp + "_" + booking_id + kExtension);
}

std::optional<ArtifactName> ParseArtifactPath(const std::filesystem::path& path) {
  const std::string filename = path.filename().string();
  if (!absl::StartsWith(filename, kPrefix) || !absl::EndsWith(filename, kExtension)) {
    return std::nullopt;
  }

  std::string_view body(filename);
  body.remove_prefix(std::char_traits<char>::length(kPrefix));
  body.remove_suffix(std::char_traits<char>::length(kExtension));
  if (body.size() < kStampLength + 2 || body[kStampLength] != '_') {
    return std::nullopt;
  }

  absl::Time  started;
  std::string err;
  if (!absl::ParseTime(kStampFormat, std::string(body.substr(0, kStampLength)), absl::UTCTimeZone(), &started, &err)) {
    return std::nullopt;
  }

  ArtifactName name;
  name.booking_id = std::string(body.substr(kStampLength + 1));
  name.camera_id  = path.parent_path().filename().string();
  name.started_at = absl::ToChronoTime(started);
  if (name.camera_id.empty()) {
    return std::nullopt;
  }
  return name;
}

} // namespace bookrec::camera
