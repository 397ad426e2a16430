#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/model/types.hpp"
#include "core/storage/event_store.hpp"

namespace fieldops {

// Events of one operation, chained from `previous_hash` of the first one to `tail_digest`.
struct PushBatch {
  std::string operation_id;
  std::vector<Event> events;
  std::string tail_digest;
};

struct PushAck {
  std::vector<std::string> accepted_ids;
  std::map<std::string, Result> rejected;
};

struct PullRequest {
  std::string operation_id;
  std::uint64_t since_position = 0;
  std::size_t limit = 100;
};

// `events` sit at positions first_position.. of the authority's stream.
struct PullBatch {
  std::vector<Event> events;
  std::uint64_t first_position = 0;
  std::string tail_digest;
  std::uint64_t tail_position = 0;
  bool has_more = false;
};

class IRemoteAuthority {
public:
  virtual ~IRemoteAuthority() = default;

  virtual Result push(const PushBatch& batch, PushAck& out) = 0;
  virtual Result pull(const PullRequest& request, PullBatch& out) = 0;
};

// Process-local authority shared by several replicas. Accepted events are relinked onto its own
// chain so every puller sees one linear, verifiable stream per operation.
class InMemoryRemoteAuthority final : public IRemoteAuthority {
public:
  Result push(const PushBatch& batch, PushAck& out) override;
  Result pull(const PullRequest& request, PullBatch& out) override;

  void set_reachable(bool reachable);
  // The next `count` pushes fail with `code` before touching any state.
  void inject_push_failure(ErrorCode code, std::size_t count);

  [[nodiscard]] std::size_t event_count(const std::string& operation_id) const;
  [[nodiscard]] ChainVerification verify_chain(const std::string& operation_id) const;

private:
  Result check_reachable() const;

  mutable std::mutex mutex_;
  bool reachable_ = true;
  ErrorCode injected_code_ = ErrorCode::SyncTransport;
  std::size_t injected_remaining_ = 0;
  std::unordered_map<std::string, std::vector<Event>> streams_;
  std::unordered_map<std::string, std::string> operation_by_event_;
};

}  // namespace fieldops
