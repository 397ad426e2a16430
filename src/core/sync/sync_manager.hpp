#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "core/event/causality.hpp"
#include "core/model/types.hpp"
#include "core/projection/projector.hpp"
#include "core/resolve/conflict_resolver.hpp"
#include "core/storage/event_store.hpp"
#include "core/sync/remote_authority.hpp"

namespace fieldops {

struct OutboxRecord {
  std::string event_id;
  std::string operation_id;
  SyncStatus status = SyncStatus::Local;
  std::uint32_t attempts = 0;
  std::int64_t created_at = 0;
  std::int64_t next_attempt_at = 0;
  bool terminal = false;
  std::string last_error;
};

struct SyncCycleReport {
  std::size_t pushed = 0;
  std::size_t acknowledged = 0;
  std::size_t failed = 0;
  std::size_t pulled = 0;
  std::size_t merged = 0;
  std::size_t buffered = 0;
  std::size_t expired = 0;
  std::size_t conflicts = 0;
  std::size_t compensations = 0;
  bool cancelled = false;
};

std::int64_t backoff_delay_ms(const SyncSettings& settings, std::uint32_t attempts);

class SyncManager {
public:
  SyncManager(EventStore& store, Projector& projector, CausalityTracker& tracker, ConflictResolver& resolver,
              ConflictQueue& queue, IRemoteAuthority& remote, std::mutex& engine_mutex, SyncSettings settings,
              std::string device_id, Clock clock);

  // The methods below, up to run_cycle(), expect the caller to hold the engine mutex.
  Result open(std::string_view data_dir);
  Result track_local(const Event& event);
  Result flush();
  void watch(const std::string& operation_id);

  [[nodiscard]] std::vector<OutboxRecord> stuck() const;
  // Remote events whose parent was still missing after the full resync their expiry triggered.
  [[nodiscard]] std::vector<Event> orphans() const;
  [[nodiscard]] std::vector<OutboxRecord> outbox() const;
  [[nodiscard]] SyncCursor cursor(const std::string& operation_id) const;
  [[nodiscard]] SyncStatusReport status() const;

  // Pull then push for every known operation. Takes the engine mutex around local work only.
  // Fails with CausalityTimeout when a buffered event expired during the cycle.
  Result run_cycle(SyncCycleReport& out);
  // `out` must outlive the returned future. The manager waits for its cycles on destruction.
  std::future<Result> start_cycle(SyncCycleReport& out);
  void cancel();
  void wait_for_cycles();

  ~SyncManager();

private:
  Result pull_operation(const std::string& operation_id, std::uint64_t generation, SyncCycleReport& report);
  Result merge_batch(const std::string& operation_id, const PullBatch& batch, std::uint64_t fetched_position,
                     const std::string& fetched_hash, SyncCycleReport& report);
  Result ingest_remote(const Event& event, SyncCycleReport& report, bool& settled);
  Result append_with_descendants(const Event& event, SyncCycleReport& report);
  Result append_remote(const Event& event, SyncCycleReport& report);
  Result resolve_against_local(const Event& remote, SyncCycleReport& report);
  Result append_compensation(const Event& compensation, SyncCycleReport& report);
  Result push_operation(const std::string& operation_id, const Result& pull_result, SyncCycleReport& report);
  std::vector<std::string> due_records(const std::string& operation_id, std::int64_t now);
  void record_failure(OutboxRecord& record, const Result& failure, bool terminal, std::int64_t now);
  std::vector<Event> expire_awaiting(SyncCycleReport& report);
  void reset_cursor(const std::string& operation_id);
  Result mirror_to_store(const OutboxRecord& record);
  [[nodiscard]] std::vector<std::string> known_operations() const;
  [[nodiscard]] bool cancelled(std::uint64_t generation) const;
  Result persist() const;

  EventStore& store_;
  Projector& projector_;
  CausalityTracker& tracker_;
  ConflictResolver& resolver_;
  ConflictQueue& queue_;
  IRemoteAuthority& remote_;
  std::mutex& engine_mutex_;
  SyncSettings settings_;
  std::string device_id_;
  Clock clock_;

  std::string state_path_;
  std::map<std::string, SyncCursor> cursors_;
  std::map<std::string, OutboxRecord> outbox_;
  std::map<std::string, Event> orphans_;
  std::atomic<std::uint64_t> generation_{0};
  std::uint64_t completed_cycles_ = 0;

  std::mutex workers_mutex_;
  std::vector<std::future<void>> workers_;
};

}  // namespace fieldops
