#pragma once

#include <filesystem>
#include <string>

namespace bookrec::upload {

/*
  Remote destination for finalized recordings.

  Upload() returns the remote URL. Uploading the same idempotency key twice
  must leave one remote object; the second call returns the existing URL.

  Throws util::UploadError for retryable failures and
  util::PermanentUploadFailure when the upload can never succeed.
*/
class ArtifactStore {
 public:
  virtual ~ArtifactStore() = default;

  virtual std::string Upload(const std::filesystem::path& local_path, const std::string& idempotency_key) = 0;
};

} // namespace bookrec::upload
