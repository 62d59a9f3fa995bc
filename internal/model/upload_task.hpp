#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace bookrec::model {

enum class UploadStatus : std::uint8_t {
  kPending           = 0,
  kUploading         = 1,
  kUploaded          = 2,
  kPermanentlyFailed = 3,
};

constexpr bool IsTerminal(UploadStatus status) {
  return status == UploadStatus::kUploaded || status == UploadStatus::kPermanentlyFailed;
}

constexpr std::string_view ToString(UploadStatus status) {
  switch (status) {
    case UploadStatus::kPending:
      return "pending";
    case UploadStatus::kUploading:
      return "uploading";
    case UploadStatus::kUploaded:
      return "uploaded";
    case UploadStatus::kPermanentlyFailed:
      return "permanently_failed";
  }
  return "unknown";
}

constexpr std::optional<UploadStatus> ParseUploadStatus(std::string_view value) {
  if (value == "pending") return UploadStatus::kPending;
  if (value == "uploading") return UploadStatus::kUploading;
  if (value == "uploaded") return UploadStatus::kUploaded;
  if (value == "permanently_failed") return UploadStatus::kPermanentlyFailed;
  return std::nullopt;
}

/*
  One finalized artifact on its way to the remote store.

  booking_id is the idempotency key.
*/
struct UploadTask {
  std::string     booking_id;
  std::string     camera_id;
  std::string     user_id;
  std::string     artifact_path;
  std::uint32_t   attempt_count = 0;
  UploadStatus    status        = UploadStatus::kPending;
  util::TimePoint not_before{};
  util::TimePoint created_at{};
  util::TimePoint finished_at{}; // set on reaching a terminal status
  std::string     remote_url;
  std::string     last_error;
};

} // namespace bookrec::model
