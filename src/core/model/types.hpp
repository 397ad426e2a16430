#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/model/app_meta.hpp"
#include "core/model/payloads.hpp"

namespace fieldops {

enum class ErrorCode {
  None,
  Validation,
  ChainIntegrity,
  ConflictUnresolved,
  SyncTransport,
  SchemaVersionMismatch,
  Configuration,
  Storage,
  NotFound,
  Cancelled,
  CausalityTimeout,
  ProjectionDivergence,
};

inline std::string_view error_code_name(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:
      return "none";
    case ErrorCode::Validation:
      return "validation";
    case ErrorCode::ChainIntegrity:
      return "chain-integrity";
    case ErrorCode::ConflictUnresolved:
      return "conflict-unresolved";
    case ErrorCode::SyncTransport:
      return "sync-transport";
    case ErrorCode::SchemaVersionMismatch:
      return "schema-version-mismatch";
    case ErrorCode::Configuration:
      return "configuration";
    case ErrorCode::Storage:
      return "storage";
    case ErrorCode::NotFound:
      return "not-found";
    case ErrorCode::Cancelled:
      return "cancelled";
    case ErrorCode::CausalityTimeout:
      return "causality-timeout";
    case ErrorCode::ProjectionDivergence:
      return "projection-divergence";
  }
  return "none";
}

// For validation failures `data` names the offending field.
struct Result {
  bool ok = false;
  ErrorCode code = ErrorCode::None;
  std::string message;
  std::string data;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, ErrorCode::None, std::move(msg), std::move(payload)};
  }

  static Result failure(ErrorCode code, std::string msg, std::string payload = {}) {
    return {false, code, std::move(msg), std::move(payload)};
  }
};

using Clock = std::function<std::int64_t()>;

enum class EventKind {
  OperationCreated,
  OperationUpdated,
  OperationClosed,
  CountyAdded,
  CountyRemoved,
  PersonAssigned,
  PersonUnassigned,
  FacilityCreated,
  FacilityUpdated,
  FacilityStatusChanged,
  FacilityResourceAdded,
  MealsServedIncrement,
  ShelteredCountSet,
  WorkAssignmentCreated,
  WorkAssignmentUpdated,
  WorkAssignmentCompleted,
  IapSectionUpdated,
  ConflictResolved,
};

enum class SyncStatus {
  Local,
  Pending,
  Synced,
  Failed,
};

enum class ConflictStrategy {
  Lww,
  Fww,
  Crdt,
  Domain,
  Manual,
};

struct ActorContext {
  std::string actor_id;
  std::string device_id;
  std::string session_id;
  std::string operation_id;
};

struct Event {
  std::string id;
  EventKind kind = EventKind::OperationCreated;
  std::uint32_t schema_version = kCurrentSchemaVersion;
  std::string actor_id;
  std::string device_id;
  std::string session_id;
  std::string operation_id;
  std::int64_t timestamp = 0;
  std::uint32_t sequence = 0;
  Payload payload;
  std::optional<std::string> causation_id;
  std::string correlation_id;
  std::string hash;
  std::string previous_hash;
  SyncStatus sync_status = SyncStatus::Local;
  std::uint32_t sync_attempts = 0;
  std::optional<std::string> sync_error;
  std::uint32_t migrated_from = 0;
};

struct SyncCursor {
  std::string operation_id;
  std::string device_id;
  std::uint64_t last_position = 0;
  std::int64_t last_timestamp = 0;
  std::string last_hash;
};

struct SyncSettings {
  std::int64_t debounce_ms = 2000;
  std::size_t batch_size = 100;
  std::uint32_t max_attempts = 5;
  std::int64_t backoff_base_ms = 1000;
  std::int64_t backoff_cap_ms = 60000;
};

struct EngineConfig {
  std::string data_dir;
  std::string device_id;
  SyncSettings sync;
  std::size_t awaiting_parent_capacity = 1024;
  std::int64_t awaiting_parent_timeout_ms = 300000;
  std::size_t conflict_queue_capacity = 256;
  std::uint64_t self_test_interval_events = 500;
  std::string log_level = "info";
  std::string log_pattern;
  std::vector<std::pair<std::string, std::string>> policy_overrides;
};

struct StoreHealthReport {
  bool healthy = true;
  std::size_t event_count = 0;
  std::size_t operation_count = 0;
  std::size_t halted_streams = 0;
  std::size_t invalid_lines = 0;
  std::string events_file;
};

struct SyncStatusReport {
  std::size_t local = 0;
  std::size_t pending = 0;
  std::size_t synced = 0;
  std::size_t failed = 0;
  std::size_t stuck = 0;
  std::size_t orphaned = 0;
  std::size_t cursor_count = 0;
  std::uint64_t completed_cycles = 0;
  std::string state_file;
};

struct EngineStatusReport {
  std::string device_id;
  std::string data_dir;
  std::string active_operation;
  StoreHealthReport store;
  SyncStatusReport sync;
  std::size_t open_conflicts = 0;
  std::size_t awaiting_parent = 0;
  std::size_t schema_backlog = 0;
};

}  // namespace fieldops
