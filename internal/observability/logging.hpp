#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace arena::runtime::config {
class RuntimeConfig;
}

namespace arena::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

enum class LogSink {
  kStdout,
  // Used by tools that write their results to stdout.
  kStderr,
};

void InitializeLogging(const arena::runtime::config::RuntimeConfig& config, LogSink sink = LogSink::kStdout);
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

/*
  Tags every log line written by the current thread with run_id=<id> while
  in scope. Scopes nest; the innermost wins.
*/
class RunLogScope {
 public:
  explicit RunLogScope(std::string run_id);
  ~RunLogScope();

  RunLogScope(const RunLogScope&)            = delete;
  RunLogScope& operator=(const RunLogScope&) = delete;

 private:
  std::string previous_;
};

} // namespace arena::observability

#define ARENA_LOG_DEBUG(message, ...) ::arena::observability::LogDebug((message), ##__VA_ARGS__)
#define ARENA_LOG_INFO(message, ...) ::arena::observability::LogInfo((message), ##__VA_ARGS__)
#define ARENA_LOG_WARN(message, ...) ::arena::observability::LogWarn((message), ##__VA_ARGS__)
#define ARENA_LOG_ERROR(message, ...) ::arena::observability::LogError((message), ##__VA_ARGS__)
