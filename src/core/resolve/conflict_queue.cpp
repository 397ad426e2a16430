#include "core/resolve/conflict_queue.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <ranges>
#include <system_error>
#include <utility>

#include "core/event/event_kind.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"
#include "core/util/logging.hpp"

namespace fieldops {
namespace {

constexpr std::string_view kConflictFile = "conflicts.dat";
constexpr std::string_view kConflictHeader = "# fieldops manual conflicts";

bool parse_conflict_line(std::string_view line, ManualConflict& out) {
  const auto fields = util::split_tabs(line);
  if (fields.size() != 6U) {
    return false;
  }
  const auto kind = event_kind_from_name(fields[2]);
  std::string entity_key;
  std::int64_t detected_at = 0;
  if (!kind.has_value() || !util::from_hex(fields[3], entity_key) || !util::parse_int64(fields[5], detected_at)) {
    return false;
  }

  out.conflict_id = std::string{fields[0]};
  out.operation_id = std::string{fields[1]};
  out.kind = *kind;
  out.entity_key = std::move(entity_key);
  out.candidate_event_ids = util::split_csv(fields[4]);
  out.detected_at = detected_at;
  return !out.conflict_id.empty();
}

}  // namespace

std::string conflict_id_for(const std::string& entity_key, std::vector<std::string> candidate_event_ids) {
  std::ranges::sort(candidate_event_ids);
  return util::uuid_from_seed("conflict|" + entity_key + "|" + util::join_csv(candidate_event_ids));
}

ConflictQueue::ConflictQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void ConflictQueue::set_capacity(std::size_t capacity) {
  capacity_ = capacity == 0 ? 1 : capacity;
}

Result ConflictQueue::open(std::string_view data_dir) {
  conflicts_.clear();
  if (data_dir.empty()) {
    path_.clear();
    return Result::success("Conflict queue kept in memory.");
  }

  std::error_code ec;
  std::filesystem::create_directories(std::string{data_dir}, ec);
  if (ec) {
    return Result::failure(ErrorCode::Storage, "Failed to create conflict queue directory: " + ec.message());
  }
  path_ = (std::filesystem::path{std::string{data_dir}} / std::string{kConflictFile}).string();

  std::ifstream in(path_);
  if (!in) {
    return Result::success("Conflict queue will be created on first conflict.");
  }

  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line.front() == '#') {
      continue;
    }
    ManualConflict conflict;
    if (!parse_conflict_line(line, conflict)) {
      FIELDOPS_LOG_WARN("Skipping unreadable conflict queue line", {util::StringField("file", path_)});
      continue;
    }
    conflicts_.emplace(conflict.conflict_id, std::move(conflict));
  }
  return Result::success("Conflict queue loaded.", std::to_string(conflicts_.size()));
}

Result ConflictQueue::enqueue(ManualConflict conflict, std::string& conflict_id_out) {
  for (auto& [id, existing] : conflicts_) {
    if (existing.operation_id != conflict.operation_id || existing.entity_key != conflict.entity_key) {
      continue;
    }
    for (const auto& candidate : conflict.candidate_event_ids) {
      if (std::ranges::find(existing.candidate_event_ids, candidate) == existing.candidate_event_ids.end()) {
        existing.candidate_event_ids.push_back(candidate);
      }
    }
    conflict_id_out = id;
    return persist();
  }

  if (conflicts_.size() >= capacity_) {
    return Result::failure(ErrorCode::ConflictUnresolved,
                           "Manual conflict queue is full (" + std::to_string(capacity_) + " entries).",
                           conflict.entity_key);
  }

  if (conflict.conflict_id.empty()) {
    conflict.conflict_id = conflict_id_for(conflict.entity_key, conflict.candidate_event_ids);
  }
  conflict_id_out = conflict.conflict_id;
  conflicts_.emplace(conflict.conflict_id, std::move(conflict));
  return persist();
}

Result ConflictQueue::remove(const std::string& conflict_id) {
  if (conflicts_.erase(conflict_id) == 0) {
    return Result::failure(ErrorCode::NotFound, "Unknown manual conflict: " + conflict_id);
  }
  return persist();
}

std::optional<ManualConflict> ConflictQueue::find(const std::string& conflict_id) const {
  const auto it = conflicts_.find(conflict_id);
  if (it == conflicts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<ManualConflict> ConflictQueue::pending(const std::string& operation_id) const {
  std::vector<ManualConflict> out;
  for (const auto& [id, conflict] : conflicts_) {
    if (operation_id.empty() || conflict.operation_id == operation_id) {
      out.push_back(conflict);
    }
  }
  return out;
}

bool ConflictQueue::holds_event(const std::string& event_id) const {
  return std::ranges::any_of(conflicts_, [&event_id](const auto& entry) {
    return std::ranges::find(entry.second.candidate_event_ids, event_id) != entry.second.candidate_event_ids.end();
  });
}

Result ConflictQueue::persist() const {
  if (path_.empty()) {
    return Result::success();
  }

  std::ofstream out(path_, std::ios::out | std::ios::trunc);
  if (!out) {
    return Result::failure(ErrorCode::Storage, "Failed to write conflict queue file.");
  }

  out << kConflictHeader << '\n';
  for (const auto& [id, conflict] : conflicts_) {
    out << conflict.conflict_id << '\t' << conflict.operation_id << '\t' << event_kind_name(conflict.kind) << '\t'
        << util::to_hex(conflict.entity_key) << '\t' << util::join_csv(conflict.candidate_event_ids) << '\t'
        << conflict.detected_at << '\n';
  }

  if (!out.good()) {
    return Result::failure(ErrorCode::Storage, "Failed to flush conflict queue file.");
  }
  return Result::success();
}

}  // namespace fieldops
