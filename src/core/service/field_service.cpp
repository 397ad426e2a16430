#include "core/service/field_service.hpp"

#include <algorithm>
#include <filesystem>
#include <ranges>
#include <system_error>
#include <utility>

#include "core/event/event_kind.hpp"
#include "core/resolve/conflict_policy.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"
#include "core/util/logging.hpp"

namespace fieldops {

FieldService::~FieldService() {
  if (sync_) {
    sync_->cancel();
    sync_->wait_for_cycles();
  }
}

Result FieldService::init(const EngineConfig& config, IRemoteAuthority& remote, Clock clock) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (initialized_) {
    return Result::failure(ErrorCode::Configuration, "Service already initialized.");
  }

  config_ = config;
  if (config_.device_id.empty()) {
    return Result::failure(ErrorCode::Configuration, "Init failed: device_id is required.", "device_id");
  }
  clock_ = clock ? std::move(clock) : Clock{util::unix_millis_now};

  if (!util::crypto_ready()) {
    return Result::failure(ErrorCode::Configuration, "Init failed: libsodium could not be initialized.");
  }

  if (!config_.data_dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(config_.data_dir, ec);
    if (ec) {
      return Result::failure(ErrorCode::Storage, "Init failed: unable to create data_dir: " + ec.message());
    }
  }

  ConflictPolicyTable policies = ConflictPolicyTable::defaults();
  for (const auto& [kind_name, spec] : config_.policy_overrides) {
    const Result applied = policies.apply_override(kind_name, spec);
    if (!applied.ok) {
      return applied;
    }
  }

  queue_.set_capacity(config_.conflict_queue_capacity);
  const Result queue_opened = queue_.open(config_.data_dir);
  if (!queue_opened.ok) {
    return queue_opened;
  }

  resolver_ = std::make_unique<ConflictResolver>(std::move(policies), queue_);
  for (const auto& [name, function] : domain_functions_) {
    resolver_->register_domain_function(name, function);
  }
  const Result policy_check = resolver_->validate_configuration();
  if (!policy_check.ok) {
    FIELDOPS_LOG_ERROR("Conflict policy table rejected", {util::StringField("reason", policy_check.message)});
    return policy_check;
  }

  std::unique_ptr<IEventPersistence> persistence;
  if (config_.data_dir.empty()) {
    persistence = std::make_unique<MemoryEventPersistence>();
  } else {
    persistence = std::make_unique<FileEventLog>(config_.data_dir);
  }
  store_ = std::make_unique<EventStore>(std::move(persistence));
  const Result store_opened = store_->open();
  if (!store_opened.ok) {
    return store_opened;
  }

  factory_ = std::make_unique<EventFactory>(clock_);
  tracker_.configure(config_.awaiting_parent_capacity, config_.awaiting_parent_timeout_ms);
  tracker_.reset();
  projector_.reset();

  for (const auto& operation_id : store_->operations()) {
    std::vector<Event> stream;
    const Result read = store_->read_range(operation_id, 1, stream);
    if (!read.ok) {
      return read;
    }
    for (const auto& event : stream) {
      tracker_.record(event);
      factory_->observe(event);
    }
    const Result rebuilt = projector_.rebuild(operation_id, stream);
    if (!rebuilt.ok) {
      return rebuilt;
    }
  }

  sync_ = std::make_unique<SyncManager>(*store_, projector_, tracker_, *resolver_, queue_, remote, mutex_,
                                        config_.sync, config_.device_id, clock_);
  const Result sync_opened = sync_->open(config_.data_dir);
  if (!sync_opened.ok) {
    return sync_opened;
  }

  const StoreHealthReport health = store_->health_report();
  FIELDOPS_LOG_INFO("Field service initialized",
                    {util::StringField("device", config_.device_id),
                     util::StringField("events_file", health.events_file),
                     util::IntField("events", static_cast<std::int64_t>(health.event_count)),
                     util::IntField("halted_streams", static_cast<std::int64_t>(health.halted_streams))});

  initialized_ = true;
  return Result::success("Field service initialized.", config_.device_id);
}

void FieldService::register_domain_function(std::string name, DomainMergeFunction function) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (resolver_) {
    resolver_->register_domain_function(name, function);
  }
  domain_functions_[std::move(name)] = std::move(function);
}

void FieldService::register_migration(EventKind kind, std::uint32_t from_version, Migration migration) {
  std::lock_guard<std::mutex> lock(mutex_);
  projector_.register_migration(kind, from_version, std::move(migration));
}

Result FieldService::retry_schema_backlog() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return ready;
  }
  return projector_.retry_backlog();
}

Result FieldService::submit(EventKind kind, Payload payload, const ActorContext& context,
                            const std::optional<std::string>& causation_id,
                            const std::optional<std::string>& correlation_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return ready;
  }

  Event event;
  const Result submitted = submit_locked(kind, std::move(payload), context, causation_id, correlation_id, event);
  if (!submitted.ok) {
    return submitted;
  }
  maybe_self_test(event.operation_id);
  return submitted;
}

Result FieldService::submit_locked(EventKind kind, Payload payload, const ActorContext& context,
                                   const std::optional<std::string>& causation_id,
                                   const std::optional<std::string>& correlation_id, Event& out) {
  Event event;
  const Result built = factory_->build(kind, std::move(payload), context, causation_id, correlation_id, event);
  if (!built.ok) {
    return built;
  }

  const Result stamped = tracker_.stamp(event);
  if (!stamped.ok) {
    return stamped;
  }
  event.previous_hash = store_->tail_hash(event.operation_id);

  const Result appended = store_->append(event);
  if (!appended.ok) {
    return appended;
  }
  tracker_.record(event);

  const Result projected = projector_.apply(event);
  if (!projected.ok) {
    FIELDOPS_LOG_WARN("Appended event not projected",
                      {util::StringField("event", event.id), util::StringField("reason", projected.message)});
  }

  const Result tracked = sync_->track_local(event);
  if (!tracked.ok) {
    return tracked;
  }
  ++events_since_self_test_;
  out = std::move(event);
  return Result::success("Event appended.", out.id);
}

Result FieldService::resolve_manual_conflict(const std::string& conflict_id, const std::string& winner_event_id,
                                             const ActorContext& context, std::string_view note) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return ready;
  }

  const auto conflict = queue_.find(conflict_id);
  if (!conflict.has_value()) {
    return Result::failure(ErrorCode::NotFound, "Unknown manual conflict: " + conflict_id, "conflict_id");
  }
  if (std::ranges::find(conflict->candidate_event_ids, winner_event_id) == conflict->candidate_event_ids.end()) {
    return Result::failure(ErrorCode::Validation, "Winner is not one of the conflicting events.",
                           "winner_event_id");
  }

  ActorContext resolver_context = context;
  if (resolver_context.operation_id.empty()) {
    resolver_context.operation_id = conflict->operation_id;
  }
  if (resolver_context.operation_id != conflict->operation_id) {
    return Result::failure(ErrorCode::Validation, "Conflict belongs to another operation.", "operation_id");
  }

  ConflictResolvedPayload payload{.conflict_id = conflict_id,
                                  .winner_event_id = winner_event_id,
                                  .candidate_event_ids = conflict->candidate_event_ids,
                                  .note = std::string{note}};
  Event resolution;
  const Result submitted = submit_locked(EventKind::ConflictResolved, std::move(payload), resolver_context,
                                         winner_event_id, std::nullopt, resolution);
  if (!submitted.ok) {
    return submitted;
  }

  const Result removed = queue_.remove(conflict_id);
  if (!removed.ok) {
    return removed;
  }
  FIELDOPS_LOG_INFO("Manual conflict resolved",
                    {util::StringField("conflict", conflict_id), util::StringField("winner", winner_event_id),
                     util::StringField("actor", resolver_context.actor_id)});
  return Result::success("Conflict resolved.", resolution.id);
}

std::shared_ptr<const OperationView> FieldService::snapshot(const std::string& operation_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return projector_.snapshot(operation_id);
}

std::uint64_t FieldService::subscribe(const std::string& operation_id, const std::string& view_key,
                                      ViewCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  return projector_.subscribe(operation_id, view_key, std::move(callback));
}

bool FieldService::unsubscribe(std::uint64_t subscription_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return projector_.unsubscribe(subscription_id);
}

Result FieldService::project(const std::string& operation_id, OperationView& out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return ready;
  }
  std::vector<Event> stream;
  const Result read = store_->read_range(operation_id, 1, stream);
  if (!read.ok) {
    return read;
  }
  return projector_.project(operation_id, stream, out);
}

Result FieldService::self_test(const std::string& operation_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return ready;
  }
  return self_test_locked(operation_id);
}

Result FieldService::self_test_locked(const std::string& operation_id) {
  std::vector<Event> stream;
  const Result read = store_->read_range(operation_id, 1, stream);
  if (!read.ok) {
    return read;
  }
  events_since_self_test_ = 0;
  return projector_.self_test(operation_id, stream);
}

void FieldService::maybe_self_test(const std::string& operation_id) {
  if (config_.self_test_interval_events == 0 || events_since_self_test_ < config_.self_test_interval_events) {
    return;
  }
  const Result checked = self_test_locked(operation_id);
  if (!checked.ok) {
    FIELDOPS_LOG_WARN("Periodic projection self test failed",
                      {util::StringField("operation", operation_id), util::StringField("reason", checked.message)});
  }
}

ChainVerification FieldService::verify_chain(const std::string& operation_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!store_) {
    return ChainVerification{.intact = false, .reason = "service not initialized"};
  }
  return store_->verify_chain(operation_id);
}

Result FieldService::reconcile(const std::string& operation_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return ready;
  }
  return store_->reconcile(operation_id);
}

std::optional<Event> FieldService::find_event(const std::string& event_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!store_) {
    return std::nullopt;
  }
  return store_->find_event(event_id);
}

Result FieldService::read_stream(const std::string& operation_id, std::vector<Event>& out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return ready;
  }
  return store_->read_range(operation_id, 1, out);
}

Result FieldService::sync_now(SyncCycleReport& out) {
  if (!sync_) {
    return Result::failure(ErrorCode::Configuration, "Service not initialized.");
  }
  return sync_->run_cycle(out);
}

std::future<Result> FieldService::start_sync(SyncCycleReport& out) {
  if (!sync_) {
    std::promise<Result> failed;
    failed.set_value(Result::failure(ErrorCode::Configuration, "Service not initialized."));
    return failed.get_future();
  }
  return sync_->start_cycle(out);
}

void FieldService::cancel_sync() {
  if (sync_) {
    sync_->cancel();
  }
}

Result FieldService::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return ready;
  }
  return sync_->flush();
}

Result FieldService::switch_operation(const std::string& operation_id) {
  if (operation_id.empty()) {
    return Result::failure(ErrorCode::Validation, "Operation id is required.", "operation_id");
  }
  cancel_sync();

  std::lock_guard<std::mutex> lock(mutex_);
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return ready;
  }
  active_operation_ = operation_id;
  sync_->watch(operation_id);
  return Result::success("Active operation switched.", operation_id);
}

std::vector<ManualConflict> FieldService::pending_conflicts(const std::string& operation_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.pending(operation_id);
}

std::vector<OutboxRecord> FieldService::stuck_events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!sync_) {
    return {};
  }
  return sync_->stuck();
}

std::vector<Event> FieldService::orphaned_events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!sync_) {
    return {};
  }
  return sync_->orphans();
}

SyncCursor FieldService::sync_cursor(const std::string& operation_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!sync_) {
    return SyncCursor{.operation_id = operation_id};
  }
  return sync_->cursor(operation_id);
}

EngineStatusReport FieldService::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  EngineStatusReport report;
  report.device_id = config_.device_id;
  report.data_dir = config_.data_dir.empty() ? ":memory:" : config_.data_dir;
  report.active_operation = active_operation_;
  if (store_) {
    report.store = store_->health_report();
  }
  if (sync_) {
    report.sync = sync_->status();
  }
  report.open_conflicts = queue_.size();
  report.awaiting_parent = tracker_.awaiting_count();
  report.schema_backlog = projector_.schema_backlog().size();
  return report;
}

Result FieldService::ensure_initialized() const {
  if (!initialized_) {
    return Result::failure(ErrorCode::Configuration, "Service not initialized.");
  }
  return Result::success();
}

}  // namespace fieldops
