#include "core/storage/event_store.hpp"

#include <algorithm>
#include <ranges>

#include "core/event/envelope.hpp"
#include "core/util/logging.hpp"

namespace fieldops {

EventStore::EventStore(std::unique_ptr<IEventPersistence> persistence) : persistence_(std::move(persistence)) {}

Result EventStore::open() {
  if (!persistence_) {
    return Result::failure(ErrorCode::Configuration, "Event store has no persistence adapter.");
  }

  const Result opened = persistence_->open();
  if (!opened.ok) {
    return opened;
  }

  streams_.clear();
  index_.clear();
  overlay_.clear();
  device_stamps_.clear();

  for (const auto& operation_id : persistence_->operations()) {
    std::vector<Event> events;
    const Result read = persistence_->read_range(operation_id, 1, 0, events);
    if (!read.ok) {
      return read;
    }

    StreamState& state = streams_[operation_id];
    for (const auto& event : events) {
      ++state.length;
      state.tail_hash = event.hash;
      index_event(event, state.length);
      overlay_[event.id] = {event.sync_status, event.sync_attempts, event.sync_error};
    }

    const ChainVerification verification = verify_chain(operation_id);
    if (!verification.intact) {
      state.halted = true;
      state.halt_reason = verification.reason;
      FIELDOPS_LOG_ERROR("Event chain broken on load",
                         {util::StringField("operation", operation_id),
                          util::IntField("position", static_cast<std::int64_t>(verification.break_position)),
                          util::StringField("reason", verification.reason)});
    }
  }

  return Result::success("Event store opened.", std::to_string(index_.size()));
}

void EventStore::index_event(const Event& event, std::uint64_t position) {
  index_.emplace(event.id, Location{event.operation_id, position});
  device_stamps_[event.device_id].emplace(event.timestamp, event.sequence);
}

Result EventStore::append(const Event& event) {
  const auto existing = streams_.find(event.operation_id);
  if (existing != streams_.end() && existing->second.halted) {
    return Result::failure(ErrorCode::ChainIntegrity,
                           "Stream " + event.operation_id + " is halted until reconciled: " +
                               existing->second.halt_reason,
                           event.id);
  }

  if (has_event(event.id)) {
    return Result::success("Event already exists (idempotent append).", event.id);
  }

  const Result envelope = validate_envelope(event);
  if (!envelope.ok) {
    return envelope;
  }

  StreamState& state = streams_[event.operation_id];
  const std::string expected_previous = state.length == 0 ? std::string{kGenesisHash} : state.tail_hash;
  if (event.previous_hash != expected_previous) {
    state.halted = true;
    state.halt_reason = "previous hash mismatch at position " + std::to_string(state.length + 1U);
    FIELDOPS_LOG_ERROR("Rejected append with stale previous hash",
                       {util::StringField("operation", event.operation_id), util::StringField("event", event.id),
                        util::IntField("position", static_cast<std::int64_t>(state.length + 1U))});
    return Result::failure(ErrorCode::ChainIntegrity, "Previous hash does not match the stream tail.", event.id);
  }

  const auto stamps = device_stamps_.find(event.device_id);
  if (stamps != device_stamps_.end() && stamps->second.contains({event.timestamp, event.sequence})) {
    return Result::failure(ErrorCode::Validation,
                           "Device " + event.device_id + " already used this timestamp and sequence.", "sequence");
  }

  const Result persisted = persistence_->append_raw(event);
  if (!persisted.ok) {
    return persisted;
  }

  ++state.length;
  state.tail_hash = event.hash;
  index_event(event, state.length);
  overlay_[event.id] = {event.sync_status, event.sync_attempts, event.sync_error};
  return Result::success("Event appended.", event.id);
}

Result EventStore::read_range(const std::string& operation_id, std::uint64_t from_position, std::vector<Event>& out,
                              std::uint64_t to_position) const {
  const Result read = persistence_->read_range(operation_id, from_position, to_position, out);
  if (!read.ok) {
    return read;
  }
  for (auto& event : out) {
    apply_overlay(event);
  }
  return read;
}

ChainVerification EventStore::verify_chain(const std::string& operation_id) const {
  ChainVerification report;
  std::vector<Event> events;
  if (!persistence_->read_range(operation_id, 1, 0, events).ok) {
    report.intact = false;
    report.reason = "stream could not be read";
    return report;
  }

  std::string expected_previous{kGenesisHash};
  for (const auto& event : events) {
    ++report.checked;
    if (event.previous_hash != expected_previous) {
      report.intact = false;
      report.reason = "previous hash mismatch";
    } else if (content_hash(event) != event.hash) {
      report.intact = false;
      report.reason = "content hash mismatch";
    }
    if (!report.intact) {
      report.break_position = report.checked;
      report.event_id = event.id;
      return report;
    }
    expected_previous = event.hash;
  }
  return report;
}

ChainVerification EventStore::verify_batch(const std::vector<Event>& events, std::string_view expected_previous,
                                           std::string_view tail_digest) {
  ChainVerification report;
  std::string previous{expected_previous.empty() ? kGenesisHash : expected_previous};
  for (const auto& event : events) {
    ++report.checked;
    if (event.previous_hash != previous) {
      report.intact = false;
      report.reason = "batch does not link to the previous digest";
    } else if (content_hash(event) != event.hash) {
      report.intact = false;
      report.reason = "content hash mismatch";
    }
    if (!report.intact) {
      report.break_position = report.checked;
      report.event_id = event.id;
      return report;
    }
    previous = event.hash;
  }

  if (!events.empty() && events.back().hash != tail_digest) {
    report.intact = false;
    report.break_position = report.checked;
    report.event_id = events.back().id;
    report.reason = "batch tail digest mismatch";
  }
  return report;
}

Result EventStore::reconcile(const std::string& operation_id) {
  const auto it = streams_.find(operation_id);
  if (it == streams_.end()) {
    return Result::failure(ErrorCode::NotFound, "Unknown stream: " + operation_id);
  }

  const ChainVerification verification = verify_chain(operation_id);
  if (!verification.intact) {
    return Result::failure(ErrorCode::ChainIntegrity,
                           "Stream " + operation_id + " is broken at position " +
                               std::to_string(verification.break_position) + " (" + verification.reason +
                               "); a full resync is required.",
                           verification.event_id);
  }

  it->second.halted = false;
  it->second.halt_reason.clear();
  FIELDOPS_LOG_INFO("Stream reconciled", {util::StringField("operation", operation_id)});
  return Result::success("Stream reconciled.");
}

bool EventStore::is_halted(const std::string& operation_id) const {
  const auto it = streams_.find(operation_id);
  return it != streams_.end() && it->second.halted;
}

std::string EventStore::tail_hash(const std::string& operation_id) const {
  const auto it = streams_.find(operation_id);
  if (it == streams_.end() || it->second.length == 0) {
    return std::string{kGenesisHash};
  }
  return it->second.tail_hash;
}

std::uint64_t EventStore::tail_position(const std::string& operation_id) const {
  const auto it = streams_.find(operation_id);
  return it == streams_.end() ? 0 : it->second.length;
}

bool EventStore::has_event(const std::string& event_id) const {
  return index_.contains(event_id);
}

std::optional<Event> EventStore::find_event(const std::string& event_id) const {
  const auto it = index_.find(event_id);
  if (it == index_.end()) {
    return std::nullopt;
  }

  std::vector<Event> events;
  const Result read = read_range(it->second.operation_id, it->second.position, events, it->second.position);
  if (!read.ok || events.empty()) {
    return std::nullopt;
  }
  return events.front();
}

std::uint64_t EventStore::position_of(const std::string& event_id) const {
  const auto it = index_.find(event_id);
  return it == index_.end() ? 0 : it->second.position;
}

std::vector<std::string> EventStore::operations() const {
  std::vector<std::string> ids;
  for (const auto& [operation_id, state] : streams_) {
    if (state.length > 0) {
      ids.push_back(operation_id);
    }
  }
  std::ranges::sort(ids);
  return ids;
}

std::vector<Event> EventStore::unsynced_events(const std::string& operation_id) const {
  std::vector<Event> events;
  if (!read_range(operation_id, 1, events).ok) {
    return {};
  }
  std::erase_if(events, [](const Event& event) { return event.sync_status == SyncStatus::Synced; });
  return events;
}

StoreHealthReport EventStore::health_report() const {
  StoreHealthReport report;
  report.event_count = index_.size();
  report.operation_count = operations().size();
  report.invalid_lines = persistence_->invalid_line_count();
  report.events_file = persistence_->location();
  report.halted_streams = static_cast<std::size_t>(
      std::ranges::count_if(streams_, [](const auto& entry) { return entry.second.halted; }));
  report.healthy = report.halted_streams == 0 && report.invalid_lines == 0;
  return report;
}

Result EventStore::update_sync_state(const std::string& event_id, SyncStatus status, std::uint32_t attempts,
                                     std::optional<std::string> error) {
  const auto it = overlay_.find(event_id);
  if (it == overlay_.end()) {
    return Result::failure(ErrorCode::NotFound, "Unknown event: " + event_id);
  }
  it->second = {status, attempts, std::move(error)};
  return Result::success();
}

void EventStore::apply_overlay(Event& event) const {
  const auto it = overlay_.find(event.id);
  if (it == overlay_.end()) {
    return;
  }
  event.sync_status = it->second.status;
  event.sync_attempts = it->second.attempts;
  event.sync_error = it->second.error;
}

}  // namespace fieldops
