#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/money.hpp"

namespace recon::observability {
namespace {

std::string ResolveLevel(const recon::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("RECON_LOG_LEVEL")) {
    return level;
  }
  return config.logging().level().empty() ? "info" : config.logging().level();
}

std::string ResolvePattern(const recon::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("RECON_LOG_PATTERN")) {
    return pattern;
  }
  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }
  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

// bank descriptions and file names carry spaces
bool NeedsQuotes(const std::string& value) {
  return value.empty() || value.find_first_of(" \t=\"") != std::string::npos;
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField CentsField(std::string_view key, std::int64_t cents) {
  return {std::string(key), util::FormatCents(cents)};
}

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;

    out << field.key << '=';
    if (!NeedsQuotes(field.value)) {
      out << field.value;
      continue;
    }
    out << '"';
    for (char c : field.value) {
      if (c == '"' || c == '\\') {
        out << '\\';
      }
      out << c;
    }
    out << '"';
  }
  return out.str();
}

void InitializeLogging(const recon::runtime::config::RuntimeConfig& config) {
  // stdout carries the JSON report; logs go to stderr
  spdlog::drop("recon");
  auto logger = spdlog::stderr_color_mt("recon");
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (fields.size() == 0) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, FormatFields(fields));
}

} // namespace recon::observability
