#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include "core/model/types.hpp"

namespace fieldops {

// SHA-256 over the canonical form of (id, kind, actor_id, timestamp, payload).
std::string content_hash(const Event& event);

// Re-checks a received envelope: identity fields, payload shape for the current schema version,
// and the content hash.
Result validate_envelope(const Event& event);

class EventFactory {
public:
  explicit EventFactory(Clock clock = {});

  Result build(EventKind kind, Payload payload, const ActorContext& context,
               const std::optional<std::string>& causation_id, const std::optional<std::string>& correlation_id,
               Event& out);

  // Seeds the per-device stamp after events are reloaded from storage.
  void observe(const Event& event);

  [[nodiscard]] std::int64_t now() const;

private:
  struct Stamp {
    std::int64_t timestamp = 0;
    std::uint32_t sequence = 0;
  };

  Clock clock_;
  std::unordered_map<std::string, Stamp> last_stamp_by_device_;
};

}  // namespace fieldops
