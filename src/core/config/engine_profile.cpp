#include "core/config/engine_profile.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "core/event/event_kind.hpp"
#include "core/resolve/conflict_policy.hpp"
#include "core/util/canonical.hpp"
#include "core/util/logging.hpp"

namespace fieldops {
namespace {

constexpr std::string_view kProfileHeader = "# fieldops engine profile";
constexpr std::string_view kPolicyPrefix = "policy.";

Result bad_value(const std::string& key, const std::string& value) {
  return Result::failure(ErrorCode::Configuration, "Invalid value for " + key + ": '" + value + "'.", key);
}

template <typename T>
Result read_unsigned(const std::map<std::string, std::string>& fields, const std::string& key, T& out) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return Result::success();
  }
  std::uint64_t parsed = 0;
  if (!util::parse_uint64(it->second, parsed)) {
    return bad_value(key, it->second);
  }
  out = static_cast<T>(parsed);
  return Result::success();
}

Result read_millis(const std::map<std::string, std::string>& fields, const std::string& key, std::int64_t& out) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return Result::success();
  }
  std::int64_t parsed = 0;
  if (!util::parse_int64(it->second, parsed) || parsed < 0) {
    return bad_value(key, it->second);
  }
  out = parsed;
  return Result::success();
}

}  // namespace

Result load_engine_profile(std::string_view path, EngineConfig& config) {
  std::ifstream in(std::string{path});
  if (!in) {
    return Result::failure(ErrorCode::Configuration, "Engine profile not found: " + std::string{path});
  }

  std::map<std::string, std::string> fields;
  std::vector<std::pair<std::string, std::string>> policies;
  std::string line;
  while (std::getline(in, line)) {
    const std::string trimmed = util::trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    const auto split = trimmed.find('=');
    if (split == std::string::npos) {
      return Result::failure(ErrorCode::Configuration, "Profile line without '=': " + trimmed);
    }

    const std::string key = util::trim_copy(trimmed.substr(0, split));
    const std::string value = util::trim_copy(trimmed.substr(split + 1));
    if (key.starts_with(kPolicyPrefix)) {
      const std::string kind_name = key.substr(kPolicyPrefix.size());
      if (!event_kind_from_name(kind_name).has_value()) {
        return Result::failure(ErrorCode::Configuration, "Unknown event kind in policy override: " + kind_name,
                               key);
      }
      PolicyEntry entry;
      if (!parse_policy_spec(value, entry).ok) {
        return bad_value(key, value);
      }
      policies.emplace_back(kind_name, value);
      continue;
    }
    fields[key] = value;
  }

  EngineConfig loaded = config;
  if (const auto it = fields.find("data_dir"); it != fields.end()) {
    loaded.data_dir = it->second;
  }
  if (const auto it = fields.find("device_id"); it != fields.end()) {
    loaded.device_id = it->second;
  }
  if (const auto it = fields.find("log_level"); it != fields.end()) {
    loaded.log_level = util::lowercase_copy(it->second);
  }
  if (const auto it = fields.find("log_pattern"); it != fields.end()) {
    loaded.log_pattern = it->second;
  }

  for (const Result read : {read_millis(fields, "debounce_ms", loaded.sync.debounce_ms),
                            read_unsigned(fields, "batch_size", loaded.sync.batch_size),
                            read_unsigned(fields, "max_sync_attempts", loaded.sync.max_attempts),
                            read_millis(fields, "backoff_base_ms", loaded.sync.backoff_base_ms),
                            read_millis(fields, "backoff_cap_ms", loaded.sync.backoff_cap_ms),
                            read_unsigned(fields, "awaiting_parent_capacity", loaded.awaiting_parent_capacity),
                            read_millis(fields, "awaiting_parent_timeout_ms", loaded.awaiting_parent_timeout_ms),
                            read_unsigned(fields, "conflict_queue_capacity", loaded.conflict_queue_capacity),
                            read_unsigned(fields, "self_test_interval_events", loaded.self_test_interval_events)}) {
    if (!read.ok) {
      return read;
    }
  }

  if (loaded.sync.batch_size == 0) {
    return bad_value("batch_size", "0");
  }
  if (loaded.sync.max_attempts == 0) {
    return bad_value("max_sync_attempts", "0");
  }
  if (loaded.sync.backoff_cap_ms < loaded.sync.backoff_base_ms) {
    return Result::failure(ErrorCode::Configuration, "backoff_cap_ms is smaller than backoff_base_ms.",
                           "backoff_cap_ms");
  }

  static const std::set<std::string, std::less<>> kKnownKeys{
      "data_dir", "device_id", "debounce_ms", "batch_size", "max_sync_attempts", "backoff_base_ms",
      "backoff_cap_ms", "awaiting_parent_capacity", "awaiting_parent_timeout_ms", "conflict_queue_capacity",
      "self_test_interval_events", "log_level", "log_pattern"};
  for (const auto& [key, value] : fields) {
    if (!kKnownKeys.contains(key)) {
      FIELDOPS_LOG_WARN("Ignoring unknown profile key", {util::StringField("key", key)});
    }
  }

  for (auto& policy : policies) {
    loaded.policy_overrides.push_back(std::move(policy));
  }
  config = std::move(loaded);
  return Result::success("Engine profile loaded.", std::string{path});
}

Result write_engine_profile(std::string_view path, const EngineConfig& config) {
  if (path.empty()) {
    return Result::failure(ErrorCode::Configuration, "Engine profile write failed: empty path.");
  }

  std::error_code ec;
  const std::filesystem::path file_path{std::string{path}};
  if (file_path.has_parent_path()) {
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
      return Result::failure(ErrorCode::Storage, "Unable to create profile directory: " + ec.message());
    }
  }

  std::ofstream out(file_path, std::ios::out | std::ios::trunc);
  if (!out) {
    return Result::failure(ErrorCode::Storage, "Unable to write engine profile: " + std::string{path});
  }

  out << kProfileHeader << '\n';
  out << "data_dir=" << config.data_dir << '\n';
  out << "device_id=" << config.device_id << '\n';
  out << "debounce_ms=" << config.sync.debounce_ms << '\n';
  out << "batch_size=" << config.sync.batch_size << '\n';
  out << "max_sync_attempts=" << config.sync.max_attempts << '\n';
  out << "backoff_base_ms=" << config.sync.backoff_base_ms << '\n';
  out << "backoff_cap_ms=" << config.sync.backoff_cap_ms << '\n';
  out << "awaiting_parent_capacity=" << config.awaiting_parent_capacity << '\n';
  out << "awaiting_parent_timeout_ms=" << config.awaiting_parent_timeout_ms << '\n';
  out << "conflict_queue_capacity=" << config.conflict_queue_capacity << '\n';
  out << "self_test_interval_events=" << config.self_test_interval_events << '\n';
  out << "log_level=" << config.log_level << '\n';
  if (!config.log_pattern.empty()) {
    out << "log_pattern=" << config.log_pattern << '\n';
  }
  for (const auto& [kind, spec] : config.policy_overrides) {
    out << kPolicyPrefix << kind << '=' << spec << '\n';
  }

  if (!out.good()) {
    return Result::failure(ErrorCode::Storage, "Failed writing engine profile: " + std::string{path});
  }
  return Result::success("Engine profile written.");
}

}  // namespace fieldops
