#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/service/field_service.hpp"

namespace fieldops {

class CoreApi {
public:
  // Configures logging from the config, then opens the replica.
  Result init(const EngineConfig& config, IRemoteAuthority& remote, Clock clock = {});
  // Profile values override `defaults`.
  Result init_from_profile(std::string_view profile_path, const EngineConfig& defaults, IRemoteAuthority& remote,
                           Clock clock = {});

  Result submit(EventKind kind, Payload payload, const ActorContext& context,
                const std::optional<std::string>& causation_id = std::nullopt,
                const std::optional<std::string>& correlation_id = std::nullopt);
  // Kind taken from the payload alternative.
  Result submit(Payload payload, const ActorContext& context,
                const std::optional<std::string>& causation_id = std::nullopt);
  Result resolve_manual_conflict(const std::string& conflict_id, const std::string& winner_event_id,
                                 const ActorContext& context, std::string_view note);

  std::shared_ptr<const OperationView> snapshot(const std::string& operation_id) const;
  std::uint64_t subscribe(const std::string& operation_id, const std::string& view_key, ViewCallback callback);
  bool unsubscribe(std::uint64_t subscription_id);

  Result sync_now(SyncCycleReport& out);
  std::future<Result> start_sync(SyncCycleReport& out);
  void cancel_sync();
  Result flush();
  Result switch_operation(const std::string& operation_id);

  ChainVerification verify_chain(const std::string& operation_id) const;
  Result reconcile(const std::string& operation_id);
  Result self_test(const std::string& operation_id);

  std::vector<ManualConflict> pending_conflicts(const std::string& operation_id) const;
  std::vector<OutboxRecord> stuck_events() const;
  std::vector<Event> orphaned_events() const;
  EngineStatusReport status() const;

  FieldService& service() { return service_; }

private:
  FieldService service_;
};

}  // namespace fieldops
