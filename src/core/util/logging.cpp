#include "core/util/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace fieldops::util {
namespace {

constexpr const char* kLoggerName = "fieldops";
constexpr std::string_view kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string resolve_level(std::string_view configured) {
  if (const char* level = std::getenv("FIELDOPS_LOG_LEVEL")) {
    return level;
  }
  if (!configured.empty()) {
    return std::string{configured};
  }
  return "info";
}

std::string resolve_pattern(std::string_view configured) {
  if (const char* pattern = std::getenv("FIELDOPS_LOG_PATTERN")) {
    return pattern;
  }
  if (!configured.empty()) {
    return std::string{configured};
  }
  return std::string{kDefaultPattern};
}

std::string serialize_fields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

}  // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void initialize_logging(std::string_view level, std::string_view pattern) {
  // Several engines may share one process; the registry holds a single named logger.
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(resolve_pattern(pattern));
  logger->set_level(spdlog::level::from_str(resolve_level(level)));
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
}

void shutdown_logging() {
  spdlog::shutdown();
}

void log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  const auto serialized_fields = serialize_fields(fields);
  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

}  // namespace fieldops::util
