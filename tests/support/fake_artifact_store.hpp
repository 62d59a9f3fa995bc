#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>

#include "internal/upload/artifact_store.hpp"
#include "internal/util/errors.hpp"

namespace bookrec::test {

/*
  In-memory remote store. Keeps one object per idempotency key and can be
  told to fail the next N uploads.
*/
class FakeArtifactStore final : public upload::ArtifactStore {
 public:
  std::string Upload(const std::filesystem::path& local_path, const std::string& idempotency_key) override {
    std::lock_guard lock(mutex_);
    ++calls_;
    if (permanent_failure_) {
      throw util::PermanentUploadFailure("bucket policy denies writes");
    }
    if (transient_failures_left_ > 0) {
      --transient_failures_left_;
      throw util::UploadError("connection reset by peer");
    }
    if (!std::filesystem::exists(local_path)) {
      throw util::PermanentUploadFailure("local artifact missing: " + local_path.string());
    }

    const auto url = "mem://recordings/" + idempotency_key + ".mp4";
    objects_.emplace(idempotency_key, url);
    return url;
  }

  void FailNext(int count) {
    std::lock_guard lock(mutex_);
    transient_failures_left_ = count;
  }

  void FailPermanently(bool fail) {
    std::lock_guard lock(mutex_);
    permanent_failure_ = fail;
  }

  std::size_t object_count() const {
    std::lock_guard lock(mutex_);
    return objects_.size();
  }

  bool has_object(const std::string& key) const {
    std::lock_guard lock(mutex_);
    return objects_.count(key) > 0;
  }

  int calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
  }

 private:
  mutable std::mutex                 mutex_;
  std::map<std::string, std::string> objects_;
  int                                transient_failures_left_ = 0;
  bool                               permanent_failure_       = false;
  int                                calls_                   = 0;
};

} // namespace bookrec::test
