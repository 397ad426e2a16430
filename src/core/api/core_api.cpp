#include "core/api/core_api.hpp"

#include <utility>

#include "core/config/engine_profile.hpp"
#include "core/event/event_kind.hpp"
#include "core/util/logging.hpp"

namespace fieldops {

Result CoreApi::init(const EngineConfig& config, IRemoteAuthority& remote, Clock clock) {
  util::initialize_logging(config.log_level, config.log_pattern);
  return service_.init(config, remote, std::move(clock));
}

Result CoreApi::init_from_profile(std::string_view profile_path, const EngineConfig& defaults,
                                  IRemoteAuthority& remote, Clock clock) {
  EngineConfig config = defaults;
  const Result loaded = load_engine_profile(profile_path, config);
  if (!loaded.ok) {
    return loaded;
  }
  return init(config, remote, std::move(clock));
}

Result CoreApi::submit(EventKind kind, Payload payload, const ActorContext& context,
                       const std::optional<std::string>& causation_id,
                       const std::optional<std::string>& correlation_id) {
  return service_.submit(kind, std::move(payload), context, causation_id, correlation_id);
}

Result CoreApi::submit(Payload payload, const ActorContext& context, const std::optional<std::string>& causation_id) {
  const EventKind kind = payload_kind(payload);
  return service_.submit(kind, std::move(payload), context, causation_id);
}

Result CoreApi::resolve_manual_conflict(const std::string& conflict_id, const std::string& winner_event_id,
                                        const ActorContext& context, std::string_view note) {
  return service_.resolve_manual_conflict(conflict_id, winner_event_id, context, note);
}

std::shared_ptr<const OperationView> CoreApi::snapshot(const std::string& operation_id) const {
  return service_.snapshot(operation_id);
}

std::uint64_t CoreApi::subscribe(const std::string& operation_id, const std::string& view_key,
                                 ViewCallback callback) {
  return service_.subscribe(operation_id, view_key, std::move(callback));
}

bool CoreApi::unsubscribe(std::uint64_t subscription_id) {
  return service_.unsubscribe(subscription_id);
}

Result CoreApi::sync_now(SyncCycleReport& out) {
  return service_.sync_now(out);
}

std::future<Result> CoreApi::start_sync(SyncCycleReport& out) {
  return service_.start_sync(out);
}

void CoreApi::cancel_sync() {
  service_.cancel_sync();
}

Result CoreApi::flush() {
  return service_.flush();
}

Result CoreApi::switch_operation(const std::string& operation_id) {
  return service_.switch_operation(operation_id);
}

ChainVerification CoreApi::verify_chain(const std::string& operation_id) const {
  return service_.verify_chain(operation_id);
}

Result CoreApi::reconcile(const std::string& operation_id) {
  return service_.reconcile(operation_id);
}

Result CoreApi::self_test(const std::string& operation_id) {
  return service_.self_test(operation_id);
}

std::vector<ManualConflict> CoreApi::pending_conflicts(const std::string& operation_id) const {
  return service_.pending_conflicts(operation_id);
}

std::vector<OutboxRecord> CoreApi::stuck_events() const {
  return service_.stuck_events();
}

std::vector<Event> CoreApi::orphaned_events() const {
  return service_.orphaned_events();
}

EngineStatusReport CoreApi::status() const {
  return service_.status();
}

}  // namespace fieldops
