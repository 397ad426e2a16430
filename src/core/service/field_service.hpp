#pragma once

#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/event/causality.hpp"
#include "core/event/envelope.hpp"
#include "core/model/types.hpp"
#include "core/projection/projector.hpp"
#include "core/resolve/conflict_queue.hpp"
#include "core/resolve/conflict_resolver.hpp"
#include "core/storage/event_store.hpp"
#include "core/sync/remote_authority.hpp"
#include "core/sync/sync_manager.hpp"

namespace fieldops {

// One replica. A single mutex serializes validate, stamp, append and project; sync cycles take it
// only around local work.
class FieldService {
public:
  FieldService() = default;
  FieldService(const FieldService&) = delete;
  FieldService& operator=(const FieldService&) = delete;
  ~FieldService();

  // An empty data_dir keeps everything in memory.
  Result init(const EngineConfig& config, IRemoteAuthority& remote, Clock clock = {});

  // Must be called before init() for functions named by policy overrides.
  void register_domain_function(std::string name, DomainMergeFunction function);
  void register_migration(EventKind kind, std::uint32_t from_version, Migration migration);
  Result retry_schema_backlog();

  // On success `data` is the new event id.
  Result submit(EventKind kind, Payload payload, const ActorContext& context,
                const std::optional<std::string>& causation_id = std::nullopt,
                const std::optional<std::string>& correlation_id = std::nullopt);
  Result resolve_manual_conflict(const std::string& conflict_id, const std::string& winner_event_id,
                                 const ActorContext& context, std::string_view note);

  [[nodiscard]] std::shared_ptr<const OperationView> snapshot(const std::string& operation_id) const;
  std::uint64_t subscribe(const std::string& operation_id, const std::string& view_key, ViewCallback callback);
  bool unsubscribe(std::uint64_t subscription_id);
  Result project(const std::string& operation_id, OperationView& out) const;
  Result self_test(const std::string& operation_id);

  [[nodiscard]] ChainVerification verify_chain(const std::string& operation_id) const;
  Result reconcile(const std::string& operation_id);
  [[nodiscard]] std::optional<Event> find_event(const std::string& event_id) const;
  Result read_stream(const std::string& operation_id, std::vector<Event>& out) const;

  Result sync_now(SyncCycleReport& out);
  // `out` must outlive the future. Destroying the service cancels the cycle and waits for it.
  std::future<Result> start_sync(SyncCycleReport& out);
  void cancel_sync();
  Result flush();

  // Cancels an in-flight cycle; the new scope is pulled on the next one.
  Result switch_operation(const std::string& operation_id);

  [[nodiscard]] std::vector<ManualConflict> pending_conflicts(const std::string& operation_id) const;
  [[nodiscard]] std::vector<OutboxRecord> stuck_events() const;
  [[nodiscard]] std::vector<Event> orphaned_events() const;
  [[nodiscard]] SyncCursor sync_cursor(const std::string& operation_id) const;
  [[nodiscard]] EngineStatusReport status() const;
  [[nodiscard]] const EngineConfig& config() const { return config_; }

private:
  Result ensure_initialized() const;
  Result submit_locked(EventKind kind, Payload payload, const ActorContext& context,
                       const std::optional<std::string>& causation_id,
                       const std::optional<std::string>& correlation_id, Event& out);
  void maybe_self_test(const std::string& operation_id);
  Result self_test_locked(const std::string& operation_id);

  EngineConfig config_;
  Clock clock_;
  bool initialized_ = false;
  std::string active_operation_;
  std::uint64_t events_since_self_test_ = 0;

  mutable std::mutex mutex_;
  std::unique_ptr<EventStore> store_;
  std::unique_ptr<EventFactory> factory_;
  CausalityTracker tracker_;
  ConflictQueue queue_;
  std::unique_ptr<ConflictResolver> resolver_;
  Projector projector_;
  std::unique_ptr<SyncManager> sync_;
  std::map<std::string, DomainMergeFunction, std::less<>> domain_functions_;
};

}  // namespace fieldops
