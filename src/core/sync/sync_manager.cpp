#include "core/sync/sync_manager.hpp"

#include <algorithm>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <memory>
#include <ranges>
#include <set>
#include <system_error>
#include <utility>

#include "core/event/event_kind.hpp"
#include "core/storage/persistence.hpp"
#include "core/util/canonical.hpp"
#include "core/util/logging.hpp"

namespace fieldops {
namespace {

constexpr std::string_view kSyncStateFile = "sync-state.dat";
constexpr std::string_view kSyncStateHeader = "# fieldops sync state";
constexpr std::string_view kOrphanPrefix = "orphan\t";

bool parse_cursor_line(const std::vector<std::string_view>& fields, const std::string& device_id, SyncCursor& out) {
  if (fields.size() != 5U) {
    return false;
  }
  out.operation_id = std::string{fields[1]};
  out.device_id = device_id;
  out.last_hash = std::string{fields[4]};
  return !out.operation_id.empty() && util::parse_uint64(fields[2], out.last_position) &&
         util::parse_int64(fields[3], out.last_timestamp);
}

bool parse_outbox_line(const std::vector<std::string_view>& fields, OutboxRecord& out) {
  if (fields.size() != 9U) {
    return false;
  }
  const auto status = sync_status_from_name(fields[3]);
  std::uint64_t attempts = 0;
  if (!status.has_value() || !util::parse_uint64(fields[4], attempts) ||
      !util::parse_int64(fields[5], out.created_at) || !util::parse_int64(fields[6], out.next_attempt_at) ||
      !util::from_hex(fields[8], out.last_error)) {
    return false;
  }
  out.event_id = std::string{fields[1]};
  out.operation_id = std::string{fields[2]};
  out.status = *status;
  out.attempts = static_cast<std::uint32_t>(attempts);
  out.terminal = fields[7] == "1";
  return !out.event_id.empty() && !out.operation_id.empty();
}

}  // namespace

std::int64_t backoff_delay_ms(const SyncSettings& settings, std::uint32_t attempts) {
  if (attempts == 0 || settings.backoff_base_ms <= 0) {
    return 0;
  }
  std::int64_t delay = settings.backoff_base_ms;
  for (std::uint32_t i = 1; i < attempts && delay < settings.backoff_cap_ms; ++i) {
    delay *= 2;
  }
  return std::min(delay, settings.backoff_cap_ms);
}

SyncManager::SyncManager(EventStore& store, Projector& projector, CausalityTracker& tracker,
                         ConflictResolver& resolver, ConflictQueue& queue, IRemoteAuthority& remote,
                         std::mutex& engine_mutex, SyncSettings settings, std::string device_id, Clock clock)
    : store_(store),
      projector_(projector),
      tracker_(tracker),
      resolver_(resolver),
      queue_(queue),
      remote_(remote),
      engine_mutex_(engine_mutex),
      settings_(settings),
      device_id_(std::move(device_id)),
      clock_(clock ? std::move(clock) : Clock{util::unix_millis_now}) {}

SyncManager::~SyncManager() {
  cancel();
  wait_for_cycles();
}

Result SyncManager::open(std::string_view data_dir) {
  cursors_.clear();
  outbox_.clear();
  orphans_.clear();
  state_path_.clear();

  if (!data_dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(std::string{data_dir}, ec);
    if (ec) {
      return Result::failure(ErrorCode::Storage, "Failed to create sync state directory: " + ec.message());
    }
    state_path_ = (std::filesystem::path{std::string{data_dir}} / std::string{kSyncStateFile}).string();

    std::ifstream in(state_path_);
    std::string line;
    while (in && std::getline(in, line)) {
      if (line.empty() || line.front() == '#') {
        continue;
      }
      const auto fields = util::split_tabs(line);
      bool parsed = false;
      if (line.starts_with(kOrphanPrefix)) {
        Event orphan;
        parsed = parse_event_line(std::string_view{line}.substr(kOrphanPrefix.size()), orphan);
        if (parsed) {
          orphans_[orphan.id] = std::move(orphan);
        }
      } else if (!fields.empty() && fields[0] == "cursor") {
        SyncCursor cursor;
        parsed = parse_cursor_line(fields, device_id_, cursor);
        if (parsed) {
          cursors_[cursor.operation_id] = std::move(cursor);
        }
      } else if (!fields.empty() && fields[0] == "outbox") {
        OutboxRecord record;
        parsed = parse_outbox_line(fields, record);
        if (parsed) {
          outbox_[record.event_id] = std::move(record);
        }
      }
      if (!parsed) {
        FIELDOPS_LOG_WARN("Skipping unreadable sync state line", {util::StringField("file", state_path_)});
      }
    }
  }

  for (const auto& [event_id, record] : outbox_) {
    if (store_.has_event(event_id)) {
      const Result mirrored = mirror_to_store(record);
      if (!mirrored.ok) {
        return mirrored;
      }
    }
  }

  // Local events appended after the last state write have no outbox record yet.
  const std::int64_t now = clock_();
  for (const auto& operation_id : store_.operations()) {
    for (const auto& event : store_.unsynced_events(operation_id)) {
      if (!outbox_.contains(event.id)) {
        outbox_[event.id] = OutboxRecord{.event_id = event.id,
                                         .operation_id = operation_id,
                                         .status = SyncStatus::Local,
                                         .created_at = now,
                                         .next_attempt_at = now + settings_.debounce_ms};
      }
    }
  }

  return Result::success("Sync state loaded.", std::to_string(outbox_.size()));
}

Result SyncManager::track_local(const Event& event) {
  const std::int64_t now = clock_();
  OutboxRecord record{.event_id = event.id,
                      .operation_id = event.operation_id,
                      .status = SyncStatus::Local,
                      .created_at = now,
                      .next_attempt_at = now + settings_.debounce_ms};
  const Result mirrored = mirror_to_store(record);
  if (!mirrored.ok) {
    return mirrored;
  }
  outbox_[event.id] = std::move(record);
  return persist();
}

Result SyncManager::flush() {
  const std::int64_t now = clock_();
  std::size_t promoted = 0;
  for (auto& [event_id, record] : outbox_) {
    if (record.status != SyncStatus::Local) {
      continue;
    }
    record.status = SyncStatus::Pending;
    record.next_attempt_at = now;
    const Result mirrored = mirror_to_store(record);
    if (!mirrored.ok) {
      return mirrored;
    }
    ++promoted;
  }
  const Result persisted = persist();
  if (!persisted.ok) {
    return persisted;
  }
  return Result::success("Outbox flushed.", std::to_string(promoted));
}

void SyncManager::watch(const std::string& operation_id) {
  if (operation_id.empty() || cursors_.contains(operation_id)) {
    return;
  }
  cursors_[operation_id] = SyncCursor{.operation_id = operation_id, .device_id = device_id_};
}

std::vector<OutboxRecord> SyncManager::stuck() const {
  std::vector<OutboxRecord> out;
  for (const auto& [event_id, record] : outbox_) {
    if (record.terminal) {
      out.push_back(record);
    }
  }
  return out;
}

std::vector<OutboxRecord> SyncManager::outbox() const {
  std::vector<OutboxRecord> out;
  out.reserve(outbox_.size());
  for (const auto& [event_id, record] : outbox_) {
    out.push_back(record);
  }
  return out;
}

std::vector<Event> SyncManager::orphans() const {
  std::vector<Event> out;
  out.reserve(orphans_.size());
  for (const auto& [event_id, event] : orphans_) {
    out.push_back(event);
  }
  return out;
}

SyncCursor SyncManager::cursor(const std::string& operation_id) const {
  const auto it = cursors_.find(operation_id);
  if (it == cursors_.end()) {
    return SyncCursor{.operation_id = operation_id, .device_id = device_id_};
  }
  return it->second;
}

SyncStatusReport SyncManager::status() const {
  SyncStatusReport report;
  for (const auto& [event_id, record] : outbox_) {
    switch (record.status) {
      case SyncStatus::Local:
        ++report.local;
        break;
      case SyncStatus::Pending:
        ++report.pending;
        break;
      case SyncStatus::Synced:
        ++report.synced;
        break;
      case SyncStatus::Failed:
        ++report.failed;
        break;
    }
    if (record.terminal) {
      ++report.stuck;
    }
  }
  report.orphaned = orphans_.size();
  report.cursor_count = cursors_.size();
  report.completed_cycles = completed_cycles_;
  report.state_file = state_path_.empty() ? ":memory:" : state_path_;
  return report;
}

Result SyncManager::run_cycle(SyncCycleReport& out) {
  out = SyncCycleReport{};
  const std::uint64_t generation = generation_.load();

  std::vector<std::string> operations;
  std::vector<Event> expired;
  {
    std::lock_guard<std::mutex> lock(engine_mutex_);
    expired = expire_awaiting(out);
    operations = known_operations();
  }

  Result outcome = Result::success("Sync cycle completed.");
  for (const auto& operation_id : operations) {
    const Result pulled = pull_operation(operation_id, generation, out);
    if (!pulled.ok && pulled.code == ErrorCode::Cancelled) {
      out.cancelled = true;
      FIELDOPS_LOG_INFO("Sync cycle cancelled", {util::StringField("operation", operation_id)});
      return pulled;
    }
    if (!pulled.ok) {
      FIELDOPS_LOG_WARN("Pull failed", {util::StringField("operation", operation_id),
                                        util::StringField("code", error_code_name(pulled.code)),
                                        util::StringField("reason", pulled.message)});
      if (outcome.ok) {
        outcome = pulled;
      }
    }

    const Result pushed = push_operation(operation_id, pulled, out);
    if (!pushed.ok && outcome.ok) {
      outcome = pushed;
    }
  }

  if (!expired.empty() && outcome.ok) {
    outcome = Result::failure(ErrorCode::CausalityTimeout,
                              std::to_string(expired.size()) + " event(s) timed out waiting for their parent.",
                              expired.front().id);
  }

  std::lock_guard<std::mutex> lock(engine_mutex_);
  ++completed_cycles_;
  const Result persisted = persist();
  FIELDOPS_LOG_DEBUG("Sync cycle finished",
                     {util::IntField("pulled", static_cast<std::int64_t>(out.pulled)),
                      util::IntField("merged", static_cast<std::int64_t>(out.merged)),
                      util::IntField("pushed", static_cast<std::int64_t>(out.pushed)),
                      util::IntField("acknowledged", static_cast<std::int64_t>(out.acknowledged)),
                      util::IntField("failed", static_cast<std::int64_t>(out.failed)),
                      util::IntField("conflicts", static_cast<std::int64_t>(out.conflicts))});
  if (!persisted.ok) {
    return persisted;
  }
  return outcome;
}

std::future<Result> SyncManager::start_cycle(SyncCycleReport& out) {
  auto task = std::make_shared<std::packaged_task<Result()>>([this, &out]() { return run_cycle(out); });
  std::future<Result> result = task->get_future();

  std::lock_guard<std::mutex> lock(workers_mutex_);
  std::erase_if(workers_, [](const std::future<void>& worker) {
    return worker.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
  });
  workers_.push_back(std::async(std::launch::async, [task]() { (*task)(); }));
  return result;
}

void SyncManager::cancel() {
  ++generation_;
}

void SyncManager::wait_for_cycles() {
  std::vector<std::future<void>> pending;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    pending.swap(workers_);
  }
  for (auto& worker : pending) {
    worker.wait();
  }
}

bool SyncManager::cancelled(std::uint64_t generation) const {
  return generation_.load() != generation;
}

Result SyncManager::pull_operation(const std::string& operation_id, std::uint64_t generation,
                                   SyncCycleReport& report) {
  // The fetch position runs ahead of the cursor while buffered events hold the cursor back.
  std::uint64_t fetched_position = 0;
  std::string fetched_hash;
  {
    std::lock_guard<std::mutex> lock(engine_mutex_);
    const SyncCursor start = cursor(operation_id);
    fetched_position = start.last_position;
    fetched_hash = start.last_hash;
  }

  for (;;) {
    const PullRequest request{
        .operation_id = operation_id, .since_position = fetched_position, .limit = settings_.batch_size};

    PullBatch batch;
    const Result pulled = remote_.pull(request, batch);
    if (!pulled.ok) {
      return pulled;
    }

    std::lock_guard<std::mutex> lock(engine_mutex_);
    if (cancelled(generation)) {
      return Result::failure(ErrorCode::Cancelled, "Pulled batch discarded after cancellation.", operation_id);
    }

    const Result merged = merge_batch(operation_id, batch, fetched_position, fetched_hash, report);
    if (!merged.ok) {
      return merged;
    }
    if (!batch.has_more || batch.events.empty()) {
      return Result::success("Pull complete.");
    }
    fetched_position = batch.first_position + batch.events.size() - 1;
    fetched_hash = batch.events.back().hash;
  }
}

Result SyncManager::merge_batch(const std::string& operation_id, const PullBatch& batch,
                                std::uint64_t fetched_position, const std::string& fetched_hash,
                                SyncCycleReport& report) {
  if (batch.events.empty()) {
    return Result::success("Nothing new.");
  }

  SyncCursor& cursor = cursors_[operation_id];
  cursor.operation_id = operation_id;
  cursor.device_id = device_id_;
  if (batch.first_position != fetched_position + 1) {
    return Result::failure(ErrorCode::ChainIntegrity, "Pulled batch does not start after the last pulled event.",
                           operation_id);
  }

  const std::string expected_previous = fetched_position == 0 ? std::string{kGenesisHash} : fetched_hash;
  const ChainVerification verification = EventStore::verify_batch(batch.events, expected_previous,
                                                                   batch.tail_digest);
  if (!verification.intact) {
    FIELDOPS_LOG_ERROR("Pulled batch failed chain verification",
                       {util::StringField("operation", operation_id),
                        util::IntField("position", static_cast<std::int64_t>(batch.first_position +
                                                                              verification.break_position - 1)),
                        util::StringField("reason", verification.reason)});
    return Result::failure(ErrorCode::ChainIntegrity, "Pulled batch failed verification: " + verification.reason,
                           verification.event_id);
  }

  for (std::size_t i = 0; i < batch.events.size(); ++i) {
    const Event& event = batch.events[i];
    const std::uint64_t position = batch.first_position + i;
    ++report.pulled;

    bool settled = false;
    const Result ingested = ingest_remote(event, report, settled);
    if (!ingested.ok) {
      if (ingested.code == ErrorCode::CausalityTimeout) {
        reset_cursor(operation_id);
      }
      return ingested;
    }

    // Only a settled prefix moves the cursor.
    if (settled && cursor.last_position + 1 == position) {
      cursor.last_position = position;
      cursor.last_hash = event.hash;
      cursor.last_timestamp = event.timestamp;
    }
  }
  return Result::success("Batch merged.");
}

Result SyncManager::ingest_remote(const Event& event, SyncCycleReport& report, bool& settled) {
  settled = false;
  if (store_.has_event(event.id)) {
    const auto record = outbox_.find(event.id);
    if (record != outbox_.end() && record->second.status != SyncStatus::Synced) {
      record->second.status = SyncStatus::Synced;
      record->second.terminal = false;
      record->second.last_error.clear();
      const Result mirrored = mirror_to_store(record->second);
      if (!mirrored.ok) {
        return mirrored;
      }
    }
    settled = true;
    return Result::success("Already present.", event.id);
  }

  if (orphans_.contains(event.id) && event.causation_id.has_value() && !tracker_.known(*event.causation_id)) {
    settled = true;
    return Result::success("Parent still missing after a full resync.", event.id);
  }

  Admission admission = Admission::Ready;
  const Result admitted = tracker_.admit(event, clock_(), admission);
  if (!admitted.ok) {
    FIELDOPS_LOG_WARN("Awaiting-parent buffer overflow", {util::StringField("event", event.id)});
    return admitted;
  }
  if (admission == Admission::Buffered) {
    ++report.buffered;
    return Result::success("Awaiting parent.", event.id);
  }

  const Result appended = append_with_descendants(event, report);
  if (!appended.ok) {
    return appended;
  }
  settled = true;
  return Result::success("Merged.", event.id);
}

// Appends `event`, then every buffered or orphaned descendant it unblocks.
Result SyncManager::append_with_descendants(const Event& event, SyncCycleReport& report) {
  std::deque<Event> pending{event};
  while (!pending.empty()) {
    Event next = std::move(pending.front());
    pending.pop_front();
    orphans_.erase(next.id);
    if (store_.has_event(next.id)) {
      continue;
    }

    const Result appended = append_remote(next, report);
    if (!appended.ok) {
      return appended;
    }
    for (auto& child : tracker_.release_ready(next.id)) {
      pending.push_back(std::move(child));
    }
    for (auto it = orphans_.begin(); it != orphans_.end();) {
      if (it->second.causation_id == next.id) {
        FIELDOPS_LOG_INFO("Orphaned event adopted by its late parent",
                          {util::StringField("event", it->first), util::StringField("parent", next.id)});
        pending.push_back(std::move(it->second));
        it = orphans_.erase(it);
      } else {
        ++it;
      }
    }
  }
  return Result::success("Appended.", event.id);
}

Result SyncManager::append_remote(const Event& event, SyncCycleReport& report) {
  Event local = event;
  local.previous_hash = store_.tail_hash(event.operation_id);
  local.sync_status = SyncStatus::Synced;
  local.sync_attempts = 0;
  local.sync_error.reset();

  const Result appended = store_.append(local);
  if (!appended.ok) {
    FIELDOPS_LOG_ERROR("Pulled event rejected by the local store",
                       {util::StringField("event", event.id), util::StringField("reason", appended.message)});
    return appended;
  }
  tracker_.record(local);
  projector_.apply(local);
  ++report.merged;

  const Result resolved = resolve_against_local(local, report);
  if (!resolved.ok) {
    FIELDOPS_LOG_WARN("Concurrent edit left unresolved",
                      {util::StringField("event", event.id), util::StringField("reason", resolved.message)});
  }
  return Result::success("Appended.", event.id);
}

Result SyncManager::resolve_against_local(const Event& remote, SyncCycleReport& report) {
  const std::string key = entity_key(remote);
  std::vector<Event> candidates{remote};
  for (const auto& local : store_.unsynced_events(remote.operation_id)) {
    if (local.id != remote.id && entity_key(local) == key && tracker_.concurrent(local.id, remote.id)) {
      candidates.push_back(local);
    }
  }
  if (candidates.size() < 2U) {
    return Result::success();
  }

  ++report.conflicts;
  ResolutionOutcome outcome;
  const Result resolved = resolver_.resolve(candidates, outcome);
  if (!resolved.ok) {
    return resolved;
  }
  for (const auto& compensation : outcome.compensations) {
    const Result appended = append_compensation(compensation, report);
    if (!appended.ok) {
      return appended;
    }
  }
  return resolved;
}

Result SyncManager::append_compensation(const Event& compensation, SyncCycleReport& report) {
  if (store_.has_event(compensation.id)) {
    return Result::success("Compensation already present.", compensation.id);
  }

  Event local = compensation;
  local.previous_hash = store_.tail_hash(compensation.operation_id);
  const Result appended = store_.append(local);
  if (!appended.ok) {
    return appended;
  }
  tracker_.record(local);
  projector_.apply(local);
  ++report.compensations;
  return track_local(local);
}

std::vector<std::string> SyncManager::due_records(const std::string& operation_id, std::int64_t now) {
  std::vector<std::string> due;
  for (auto& [event_id, record] : outbox_) {
    if (record.operation_id != operation_id || record.terminal || record.status == SyncStatus::Synced) {
      continue;
    }
    if (record.status == SyncStatus::Local && record.created_at + settings_.debounce_ms <= now) {
      record.status = SyncStatus::Pending;
      if (!mirror_to_store(record).ok) {
        FIELDOPS_LOG_WARN("Sync state of a missing event", {util::StringField("event", event_id)});
      }
    }
    if (record.status == SyncStatus::Local || record.next_attempt_at > now || queue_.holds_event(event_id)) {
      continue;
    }
    due.push_back(event_id);
  }
  std::ranges::sort(due, {}, [this](const std::string& id) { return store_.position_of(id); });
  if (due.size() > settings_.batch_size && settings_.batch_size > 0) {
    due.resize(settings_.batch_size);
  }
  return due;
}

Result SyncManager::push_operation(const std::string& operation_id, const Result& pull_result,
                                   SyncCycleReport& report) {
  for (;;) {
    PushBatch batch{.operation_id = operation_id};
    {
      std::lock_guard<std::mutex> lock(engine_mutex_);
      const std::int64_t now = clock_();
      const std::vector<std::string> due = due_records(operation_id, now);
      if (due.empty()) {
        return Result::success("Outbox drained.");
      }

      // Local events are not published before divergence from the authority is merged.
      if (!pull_result.ok) {
        for (const auto& event_id : due) {
          record_failure(outbox_[event_id], pull_result, false, now);
          ++report.failed;
        }
        return pull_result;
      }

      for (const auto& event_id : due) {
        OutboxRecord& record = outbox_[event_id];
        record.status = SyncStatus::Pending;
        const Result mirrored = mirror_to_store(record);
        if (!mirrored.ok) {
          return mirrored;
        }
        auto event = store_.find_event(event_id);
        if (!event.has_value()) {
          record_failure(record, Result::failure(ErrorCode::NotFound, "Event missing from the store."), true, now);
          ++report.failed;
          continue;
        }
        batch.events.push_back(std::move(*event));
      }
      if (batch.events.empty()) {
        continue;
      }
      batch.tail_digest = batch.events.back().hash;
    }

    PushAck ack;
    const Result pushed = remote_.push(batch, ack);

    std::lock_guard<std::mutex> lock(engine_mutex_);
    const std::int64_t now = clock_();
    report.pushed += batch.events.size();
    if (!pushed.ok) {
      const bool terminal = pushed.code == ErrorCode::Validation || pushed.code == ErrorCode::ChainIntegrity;
      for (const auto& event : batch.events) {
        record_failure(outbox_[event.id], pushed, terminal, now);
        ++report.failed;
      }
      return pushed;
    }

    for (const auto& event_id : ack.accepted_ids) {
      const auto record = outbox_.find(event_id);
      if (record == outbox_.end()) {
        continue;
      }
      record->second.status = SyncStatus::Synced;
      record->second.last_error.clear();
      const Result mirrored = mirror_to_store(record->second);
      if (!mirrored.ok) {
        return mirrored;
      }
      ++report.acknowledged;
    }
    for (const auto& [event_id, rejection] : ack.rejected) {
      const auto record = outbox_.find(event_id);
      if (record != outbox_.end()) {
        record_failure(record->second, rejection, true, now);
        ++report.failed;
      }
    }
  }
}

void SyncManager::record_failure(OutboxRecord& record, const Result& failure, bool terminal, std::int64_t now) {
  ++record.attempts;
  record.status = SyncStatus::Failed;
  record.last_error = std::string{error_code_name(failure.code)} + ": " + failure.message;
  if (terminal || record.attempts >= settings_.max_attempts) {
    record.terminal = true;
    FIELDOPS_LOG_ERROR("Sync gave up on event",
                       {util::StringField("event", record.event_id), util::StringField("error", record.last_error),
                        util::IntField("attempts", record.attempts)});
  } else {
    record.next_attempt_at = now + backoff_delay_ms(settings_, record.attempts);
  }

  const Result mirrored = mirror_to_store(record);
  if (!mirrored.ok) {
    FIELDOPS_LOG_WARN("Sync state of a missing event", {util::StringField("event", record.event_id)});
  }
}

// Expired events become orphans: the full resync scheduled here re-pulls them without buffering
// again, and they stay listed until their parent shows up.
std::vector<Event> SyncManager::expire_awaiting(SyncCycleReport& report) {
  std::vector<Event> expired = tracker_.expire(clock_());
  std::set<std::string> operations;
  for (const auto& event : expired) {
    ++report.expired;
    operations.insert(event.operation_id);
    orphans_[event.id] = event;
    FIELDOPS_LOG_WARN("Parent never arrived; scheduling full resync",
                      {util::StringField("event", event.id),
                       util::StringField("parent", event.causation_id.value_or(""))});
  }
  for (const auto& operation_id : operations) {
    reset_cursor(operation_id);
  }
  return expired;
}

void SyncManager::reset_cursor(const std::string& operation_id) {
  cursors_[operation_id] = SyncCursor{.operation_id = operation_id, .device_id = device_id_};
}

Result SyncManager::mirror_to_store(const OutboxRecord& record) {
  std::optional<std::string> error;
  if (!record.last_error.empty()) {
    error = record.last_error;
  }
  return store_.update_sync_state(record.event_id, record.status, record.attempts, std::move(error));
}

std::vector<std::string> SyncManager::known_operations() const {
  std::set<std::string> ids;
  for (const auto& operation_id : store_.operations()) {
    ids.insert(operation_id);
  }
  for (const auto& [operation_id, cursor] : cursors_) {
    ids.insert(operation_id);
  }
  return {ids.begin(), ids.end()};
}

Result SyncManager::persist() const {
  if (state_path_.empty()) {
    return Result::success();
  }

  std::ofstream out(state_path_, std::ios::out | std::ios::trunc);
  if (!out) {
    return Result::failure(ErrorCode::Storage, "Failed to write sync state file.");
  }

  out << kSyncStateHeader << '\n';
  for (const auto& [operation_id, cursor] : cursors_) {
    out << "cursor\t" << operation_id << '\t' << cursor.last_position << '\t' << cursor.last_timestamp << '\t'
        << cursor.last_hash << '\n';
  }
  for (const auto& [event_id, record] : outbox_) {
    out << "outbox\t" << event_id << '\t' << record.operation_id << '\t' << sync_status_name(record.status) << '\t'
        << record.attempts << '\t' << record.created_at << '\t' << record.next_attempt_at << '\t'
        << (record.terminal ? "1" : "0") << '\t' << util::to_hex(record.last_error) << '\n';
  }
  for (const auto& [event_id, orphan] : orphans_) {
    out << kOrphanPrefix << serialize_event_line(orphan);
  }

  if (!out.good()) {
    return Result::failure(ErrorCode::Storage, "Failed to flush sync state file.");
  }
  return Result::success();
}

}  // namespace fieldops
