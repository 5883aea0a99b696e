#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace recon::runtime::config {
class RuntimeConfig;
}

namespace recon::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField CentsField(std::string_view key, std::int64_t cents);
LogField DoubleField(std::string_view key, double value);

// key=value pairs joined by spaces; values with blanks or quotes are quoted
std::string FormatFields(std::initializer_list<LogField> fields);

void InitializeLogging(const recon::runtime::config::RuntimeConfig& config);
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

} // namespace recon::observability

#define RECON_LOG_INFO(message, ...) ::recon::observability::LogInfo((message), ##__VA_ARGS__)
#define RECON_LOG_WARN(message, ...) ::recon::observability::LogWarn((message), ##__VA_ARGS__)
#define RECON_LOG_ERROR(message, ...) ::recon::observability::LogError((message), ##__VA_ARGS__)
