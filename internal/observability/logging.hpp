#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace bookrec::runtime::config {
class RuntimeConfig;
}

namespace bookrec::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Fields attached to every line logged on this thread while the scope is
  alive, e.g. the camera a lifecycle tick works for or the booking being
  uploaded. Scopes nest. A field passed to Log() directly wins over a
  context field with the same key.
*/
class ScopedLogContext {
 public:
  ScopedLogContext(std::initializer_list<LogField> fields);
  ~ScopedLogContext();

  ScopedLogContext(const ScopedLogContext&)            = delete;
  ScopedLogContext& operator=(const ScopedLogContext&) = delete;

 private:
  std::size_t pushed_;
};

// Lines carry node=<node_id> once set; InitializeLogging sets it from config.
void SetLogNodeId(std::string_view node_id);

void InitializeLogging(const bookrec::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace bookrec::observability

#define BOOKREC_LOG_DEBUG(message, ...) ::bookrec::observability::LogDebug((message), ##__VA_ARGS__)
#define BOOKREC_LOG_INFO(message, ...) ::bookrec::observability::LogInfo((message), ##__VA_ARGS__)
#define BOOKREC_LOG_WARN(message, ...) ::bookrec::observability::LogWarn((message), ##__VA_ARGS__)
#define BOOKREC_LOG_ERROR(message, ...) ::bookrec::observability::LogError((message), ##__VA_ARGS__)
