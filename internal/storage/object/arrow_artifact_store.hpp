#pragma once

#include <memory>
#include <string>

#include <arrow/filesystem/filesystem.h>

#include "internal/upload/artifact_store.hpp"

namespace bookrec::storage {

/*
  ArtifactStore over an Arrow filesystem (S3 / MinIO or a local mount).

  Object key layout:

      <root_path>/<booking_id><extension of the local file>

  An object that already exists under the key is treated as a previous
  successful upload and its URL returned without writing.
*/
class ArrowArtifactStore final : public upload::ArtifactStore {
 public:
  ArrowArtifactStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  std::string Upload(const std::filesystem::path& local_path, const std::string& idempotency_key) override;

  std::string ObjectPath(const std::string& idempotency_key, const std::string& extension) const;

 private:
  std::string Url(const std::string& object_path) const;
  void        CopyToObject(const std::filesystem::path& local_path, const std::string& object_path);

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
  bool                                   is_s3_;
};

} // namespace bookrec::storage
