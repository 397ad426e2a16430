#include "core/storage/persistence.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "core/event/event_kind.hpp"
#include "core/event/payload_codec.hpp"
#include "core/util/canonical.hpp"
#include "core/util/logging.hpp"

namespace fieldops {
namespace {

constexpr std::string_view kEventLogFile = "events.log";
constexpr std::string_view kEventLogHeader = "# fieldops event log v1";
constexpr std::size_t kEventLineFields = 16;

}  // namespace

std::string serialize_event_line(const Event& event) {
  std::ostringstream out;
  out << event.id << '\t' << event_kind_name(event.kind) << '\t' << event.schema_version << '\t' << event.actor_id
      << '\t' << event.device_id << '\t' << event.session_id << '\t' << event.operation_id << '\t'
      << event.timestamp << '\t' << event.sequence << '\t' << util::to_hex(encode_payload(event.payload)) << '\t'
      << event.causation_id.value_or(std::string{}) << '\t' << event.correlation_id << '\t' << event.hash << '\t'
      << event.previous_hash << '\t' << sync_status_name(event.sync_status) << '\t' << event.migrated_from << '\n';
  return out.str();
}

bool parse_event_line(std::string_view line, Event& out) {
  const auto fields = util::split_tabs(line);
  if (fields.size() != kEventLineFields) {
    return false;
  }

  const auto kind = event_kind_from_name(fields[1]);
  const auto status = sync_status_from_name(fields[14]);
  if (!kind.has_value() || !status.has_value()) {
    return false;
  }

  std::uint64_t schema_version = 0;
  std::uint64_t sequence = 0;
  std::uint64_t migrated_from = 0;
  std::int64_t timestamp = 0;
  if (!util::parse_uint64(fields[2], schema_version) || !util::parse_int64(fields[7], timestamp) ||
      !util::parse_uint64(fields[8], sequence) || !util::parse_uint64(fields[15], migrated_from)) {
    return false;
  }

  std::string canonical_payload;
  if (!util::from_hex(fields[9], canonical_payload)) {
    return false;
  }

  Event event;
  event.id = std::string{fields[0]};
  event.kind = *kind;
  event.schema_version = static_cast<std::uint32_t>(schema_version);
  event.actor_id = std::string{fields[3]};
  event.device_id = std::string{fields[4]};
  event.session_id = std::string{fields[5]};
  event.operation_id = std::string{fields[6]};
  event.timestamp = timestamp;
  event.sequence = static_cast<std::uint32_t>(sequence);
  if (!decode_payload(*kind, canonical_payload, event.payload).ok) {
    return false;
  }
  if (!fields[10].empty()) {
    event.causation_id = std::string{fields[10]};
  }
  event.correlation_id = std::string{fields[11]};
  event.hash = std::string{fields[12]};
  event.previous_hash = std::string{fields[13]};
  event.sync_status = *status;
  event.migrated_from = static_cast<std::uint32_t>(migrated_from);

  if (event.id.empty() || event.operation_id.empty()) {
    return false;
  }
  out = std::move(event);
  return true;
}

Result MemoryEventPersistence::open() {
  return Result::success("In-memory event persistence ready.");
}

Result MemoryEventPersistence::append_raw(const Event& event) {
  auto it = streams_.find(event.operation_id);
  if (it == streams_.end()) {
    it = streams_.emplace(event.operation_id, std::vector<Event>{}).first;
  }
  it->second.push_back(event);
  return Result::success();
}

Result MemoryEventPersistence::read_range(std::string_view operation_id, std::uint64_t from_position,
                                          std::uint64_t to_position, std::vector<Event>& out) const {
  out.clear();
  const auto it = streams_.find(operation_id);
  if (it == streams_.end()) {
    return Result::success("Stream is empty.");
  }

  const auto& events = it->second;
  const std::uint64_t first = from_position == 0 ? 1 : from_position;
  const std::uint64_t last = (to_position == 0 || to_position > events.size()) ? events.size() : to_position;
  for (std::uint64_t position = first; position <= last; ++position) {
    out.push_back(events[position - 1U]);
  }
  return Result::success();
}

Result MemoryEventPersistence::read_tail(std::string_view operation_id, std::optional<Event>& out) const {
  out.reset();
  const auto it = streams_.find(operation_id);
  if (it != streams_.end() && !it->second.empty()) {
    out = it->second.back();
  }
  return Result::success();
}

std::vector<std::string> MemoryEventPersistence::operations() const {
  std::vector<std::string> ids;
  ids.reserve(streams_.size());
  for (const auto& [operation_id, events] : streams_) {
    ids.push_back(operation_id);
  }
  return ids;
}

FileEventLog::FileEventLog(std::string data_dir) : data_dir_(std::move(data_dir)) {}

Result FileEventLog::open() {
  std::error_code ec;
  std::filesystem::create_directories(data_dir_, ec);
  if (ec) {
    return Result::failure(ErrorCode::Storage, "Failed to create data directory: " + ec.message());
  }

  event_log_path_ = (std::filesystem::path{data_dir_} / std::string{kEventLogFile}).string();
  streams_.clear();
  invalid_lines_ = 0;

  std::ifstream in(event_log_path_);
  if (!in) {
    return Result::success("Event log will be created on first write.");
  }

  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line.front() == '#') {
      continue;
    }

    Event event;
    if (!parse_event_line(line, event)) {
      ++invalid_lines_;
      FIELDOPS_LOG_WARN("Skipping unreadable event log line", {util::StringField("file", event_log_path_)});
      continue;
    }
    const Result appended = MemoryEventPersistence::append_raw(event);
    if (!appended.ok) {
      return appended;
    }
  }

  return Result::success("Event log loaded.");
}

Result FileEventLog::append_raw(const Event& event) {
  std::error_code ec;
  const bool fresh = !std::filesystem::exists(event_log_path_, ec);

  std::ofstream out(event_log_path_, std::ios::out | std::ios::app);
  if (!out) {
    return Result::failure(ErrorCode::Storage, "Failed to write event log file.");
  }

  if (fresh) {
    out << kEventLogHeader << '\n';
  }
  out << serialize_event_line(event);
  if (!out.good()) {
    return Result::failure(ErrorCode::Storage, "Failed to flush event log file.");
  }

  return MemoryEventPersistence::append_raw(event);
}

}  // namespace fieldops
