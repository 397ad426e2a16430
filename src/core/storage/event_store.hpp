#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/model/types.hpp"
#include "core/storage/persistence.hpp"

namespace fieldops {

struct ChainVerification {
  bool intact = true;
  std::uint64_t checked = 0;
  std::uint64_t break_position = 0;
  std::string event_id;
  std::string reason;
};

class EventStore {
public:
  explicit EventStore(std::unique_ptr<IEventPersistence> persistence);

  Result open();

  // Idempotent by event id. A previous-hash mismatch halts the stream until reconcile().
  Result append(const Event& event);

  Result read_range(const std::string& operation_id, std::uint64_t from_position, std::vector<Event>& out,
                    std::uint64_t to_position = 0) const;
  [[nodiscard]] ChainVerification verify_chain(const std::string& operation_id) const;
  [[nodiscard]] static ChainVerification verify_batch(const std::vector<Event>& events,
                                                      std::string_view expected_previous,
                                                      std::string_view tail_digest);
  Result reconcile(const std::string& operation_id);

  [[nodiscard]] bool is_halted(const std::string& operation_id) const;
  [[nodiscard]] std::string tail_hash(const std::string& operation_id) const;
  [[nodiscard]] std::uint64_t tail_position(const std::string& operation_id) const;
  [[nodiscard]] bool has_event(const std::string& event_id) const;
  [[nodiscard]] std::optional<Event> find_event(const std::string& event_id) const;
  [[nodiscard]] std::uint64_t position_of(const std::string& event_id) const;
  [[nodiscard]] std::vector<std::string> operations() const;
  [[nodiscard]] std::vector<Event> unsynced_events(const std::string& operation_id) const;
  [[nodiscard]] std::size_t event_count() const { return index_.size(); }
  [[nodiscard]] StoreHealthReport health_report() const;

private:
  friend class SyncManager;

  struct StreamState {
    bool halted = false;
    std::string halt_reason;
    std::string tail_hash;
    std::uint64_t length = 0;
  };

  struct SyncOverlay {
    SyncStatus status = SyncStatus::Local;
    std::uint32_t attempts = 0;
    std::optional<std::string> error;
  };

  struct Location {
    std::string operation_id;
    std::uint64_t position = 0;
  };

  Result update_sync_state(const std::string& event_id, SyncStatus status, std::uint32_t attempts,
                           std::optional<std::string> error);
  void apply_overlay(Event& event) const;
  void index_event(const Event& event, std::uint64_t position);

  std::unique_ptr<IEventPersistence> persistence_;
  std::unordered_map<std::string, StreamState> streams_;
  std::unordered_map<std::string, Location> index_;
  std::unordered_map<std::string, SyncOverlay> overlay_;
  std::unordered_map<std::string, std::set<std::pair<std::int64_t, std::uint32_t>>> device_stamps_;
};

}  // namespace fieldops
