#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace bookrec::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Filesystem and root path for the configured artifact store.

      s3://bucket/prefix   S3FileSystem built from the s3 options
      file:///mnt/share    LocalFileSystem
      /mnt/share           LocalFileSystem
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const bookrec::runtime::config::ArtifactStoreConfig& config);

// Releases the AWS SDK if S3 was used. Call once at process exit.
void FinalizeFileSystems();

} // namespace bookrec::storage::common
