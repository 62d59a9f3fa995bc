#include "arrow_artifact_store.hpp"

#include <arrow/io/file.h>
#include <arrow/io/interfaces.h>

#include <stdexcept>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace bookrec::storage {

using namespace bookrec::storage::common;

namespace {
constexpr std::int64_t kChunkSize = 1 << 20;
} // namespace

ArrowArtifactStore::ArrowArtifactStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : fs_(std::move(fs)), root_path_(std::move(root_path)), is_s3_(fs_->type_name() == "s3") {
}

std::string ArrowArtifactStore::ObjectPath(const std::string& idempotency_key, const std::string& extension) const {
  ValidateBookingId(idempotency_key);
  return JoinObjectPath(root_path_, idempotency_key + extension);
}

std::string ArrowArtifactStore::Url(const std::string& object_path) const {
  return (is_s3_ ? "s3://" : "file://") + object_path;
}

std::string ArrowArtifactStore::Upload(const std::filesystem::path& local_path, const std::string& idempotency_key) {
  std::string object_path;
  try {
    object_path = ObjectPath(idempotency_key, local_path.extension().string());
  } catch (const std::invalid_argument& e) {
    throw util::PermanentUploadFailure(e.what());
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(local_path, ec)) {
    throw util::PermanentUploadFailure("artifact " + local_path.string() + " does not exist");
  }

  try {
    // merge with a previous upload of the same booking
    auto info = Unwrap(fs_->GetFileInfo(object_path));
    if (info.IsFile()) {
      return Url(object_path);
    }

    CopyToObject(local_path, object_path);
  } catch (const std::runtime_error& e) {
    throw util::UploadError("upload of " + local_path.string() + " to " + Url(object_path) + " failed: " + e.what());
  }
  return Url(object_path);
}

/*
  S3 objects appear atomically when the output stream closes. On a local
  mount the bytes go to <object>.partial first and are renamed, so a crash
  never leaves a truncated object under the final key.
*/
void ArrowArtifactStore::CopyToObject(const std::filesystem::path& local_path, const std::string& object_path) {
  const std::string target = is_s3_ ? object_path : object_path + ".partial";

  if (!is_s3_) {
    const auto parent = std::filesystem::path(object_path).parent_path().string();
    if (!parent.empty()) {
      Unwrap(fs_->CreateDir(parent, true));
    }
  }

  auto input  = Unwrap(arrow::io::ReadableFile::Open(local_path.string()));
  auto output = Unwrap(fs_->OpenOutputStream(target));

  for (;;) {
    auto chunk = Unwrap(input->Read(kChunkSize));
    if (chunk->size() == 0) {
      break;
    }
    Unwrap(output->Write(chunk));
  }
  Unwrap(output->Close());
  Unwrap(input->Close());

  if (!is_s3_) {
    Unwrap(fs_->Move(target, object_path));
  }
}

} // namespace bookrec::storage
