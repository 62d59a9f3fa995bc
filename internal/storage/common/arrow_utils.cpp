#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>

#include <atomic>

#include "internal/observability/logging.hpp"

namespace bookrec::storage::common {

namespace {

std::atomic<bool> s3_initialized{false};

bool IsS3Uri(const std::string& uri) {
  return uri.rfind("s3://", 0) == 0;
}

} // namespace

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const bookrec::runtime::config::ArtifactStoreConfig& config) {
  std::string resolved_path;

  if (IsS3Uri(config.uri())) {
    if (!s3_initialized.exchange(true)) {
      ARROW_RETURN_NOT_OK(arrow::fs::EnsureS3Initialized());
    }

    ARROW_ASSIGN_OR_RAISE(auto options, arrow::fs::S3Options::FromUri(config.uri(), &resolved_path));

    const auto& s3 = config.s3();
    if (!s3.region().empty()) options.region = s3.region();
    if (!s3.endpoint_override().empty()) options.endpoint_override = s3.endpoint_override();
    if (!s3.scheme().empty()) options.scheme = s3.scheme();
    if (s3.connect_timeout_s() > 0) options.connect_timeout = s3.connect_timeout_s();
    if (s3.request_timeout_s() > 0) options.request_timeout = s3.request_timeout_s();
    if (!s3.access_key().empty()) options.ConfigureAccessKey(s3.access_key(), s3.secret_key());
    options.allow_bucket_creation = s3.allow_bucket_creation();

    ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::S3FileSystem::Make(options));
    return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::move(fs)), resolved_path);
  }

  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(config.uri(), &resolved_path));
  return std::make_pair(std::move(fs), resolved_path);
}

void FinalizeFileSystems() {
  if (s3_initialized.exchange(false)) {
    auto status = arrow::fs::FinalizeS3();
    if (!status.ok()) {
      BOOKREC_LOG_WARN("S3 finalize failed", {observability::StringField("error", status.ToString())});
    }
  }
}

} // namespace bookrec::storage::common
