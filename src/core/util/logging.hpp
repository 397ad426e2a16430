#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace fieldops::util {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Environment overrides (FIELDOPS_LOG_LEVEL, FIELDOPS_LOG_PATTERN) take precedence over the arguments.
void initialize_logging(std::string_view level, std::string_view pattern);
void shutdown_logging();

void log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void log_debug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::debug, message, fields);
}

inline void log_info(std::string_view message, std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::info, message, fields);
}

inline void log_warn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::warn, message, fields);
}

inline void log_error(std::string_view message, std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::err, message, fields);
}

}  // namespace fieldops::util

#define FIELDOPS_LOG_DEBUG(message, ...) ::fieldops::util::log_debug((message), ##__VA_ARGS__)
#define FIELDOPS_LOG_INFO(message, ...) ::fieldops::util::log_info((message), ##__VA_ARGS__)
#define FIELDOPS_LOG_WARN(message, ...) ::fieldops::util::log_warn((message), ##__VA_ARGS__)
#define FIELDOPS_LOG_ERROR(message, ...) ::fieldops::util::log_error((message), ##__VA_ARGS__)
