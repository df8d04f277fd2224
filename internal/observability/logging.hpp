#pragma once

#include <spdlog/common.h>
#include <spdlog/logger.h>

#include <cstdint>
#include <exception>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace rollback::runtime::config {
class RuntimeConfig;
}

namespace rollback::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const rollback::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

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
  Logger handed to engine components.

  Wraps a spdlog logger so each engine (or each test) can route its output
  independently. A default-constructed Logger writes through whatever
  spdlog default logger is installed at the time of the call.
*/
class Logger {
 public:
  Logger() = default;
  explicit Logger(std::shared_ptr<spdlog::logger> sink);

  void Info(std::string_view message, std::initializer_list<LogField> fields = {}) const;
  void Warn(std::string_view message, std::initializer_list<LogField> fields = {}) const;
  void Debug(std::string_view message, std::initializer_list<LogField> fields = {}) const;
  void Error(std::string_view message, const std::exception& error, std::initializer_list<LogField> fields = {}) const;
  void Error(std::string_view message, std::initializer_list<LogField> fields = {}) const;

 private:
  void Write(spdlog::level::level_enum level, std::string_view message, std::string_view error,
             std::initializer_list<LogField> fields) const;

  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace rollback::observability

#define ROLLBACK_LOG_INFO(message, ...) ::rollback::observability::LogInfo((message), ##__VA_ARGS__)
#define ROLLBACK_LOG_WARN(message, ...) ::rollback::observability::LogWarn((message), ##__VA_ARGS__)
#define ROLLBACK_LOG_ERROR(message, ...) ::rollback::observability::LogError((message), ##__VA_ARGS__)
