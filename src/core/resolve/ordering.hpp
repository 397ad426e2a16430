#pragma once

#include <compare>
#include <cstdint>
#include <map>
#include <string>

#include "core/model/types.hpp"

namespace fieldops {

// Greater key wins. The event id only breaks exact ties.
struct LwwKey {
  std::int64_t timestamp = 0;
  std::string actor_id;
  std::string event_id;

  auto operator<=>(const LwwKey&) const = default;
};

// Smaller key wins.
struct FwwKey {
  std::int64_t timestamp = 0;
  std::uint32_t sequence = 0;
  std::string device_id;
  std::string event_id;

  auto operator<=>(const FwwKey&) const = default;
};

inline LwwKey lww_key(const Event& event) {
  return {event.timestamp, event.actor_id, event.id};
}

inline FwwKey fww_key(const Event& event) {
  return {event.timestamp, event.sequence, event.device_id, event.id};
}

// Every write to one field, keyed by event id. Unless a resolution picks otherwise the field
// shows the greatest LwwKey, or the smallest FwwKey when FirstWrite is set.
template <typename T, bool FirstWrite = false>
struct FieldRegister {
  struct Write {
    T value{};
    LwwKey lww;
    FwwKey fww;
  };

  std::map<std::string, Write> writes;

  bool offer(const T& candidate, const Event& event) {
    return writes.emplace(event.id, Write{candidate, lww_key(event), fww_key(event)}).second;
  }

  [[nodiscard]] bool set() const { return !writes.empty(); }

  [[nodiscard]] const Write* default_write() const {
    const Write* pick = nullptr;
    for (const auto& [event_id, write] : writes) {
      if (pick == nullptr || (FirstWrite ? write.fww < pick->fww : pick->lww < write.lww)) {
        pick = &write;
      }
    }
    return pick;
  }

  [[nodiscard]] LwwKey newest() const {
    LwwKey key;
    for (const auto& [event_id, write] : writes) {
      if (key < write.lww) {
        key = write.lww;
      }
    }
    return key;
  }
};

template <typename T>
using FirstWriteRegister = FieldRegister<T, true>;

// Keeps the first offer by FwwKey.
template <typename T>
struct FwwRegister {
  T value{};
  FwwKey key;
  bool set = false;

  bool offer(const T& candidate, const FwwKey& candidate_key) {
    if (set && !(candidate_key < key)) {
      return false;
    }
    value = candidate;
    key = candidate_key;
    set = true;
    return true;
  }
};

// Grow-only sum keyed by contributing event, so re-applying an event never double counts.
struct SumCounter {
  std::map<std::string, std::int64_t> contributions;

  bool add(const std::string& event_id, std::int64_t delta) { return contributions.emplace(event_id, delta).second; }

  [[nodiscard]] std::int64_t total() const {
    std::int64_t sum = 0;
    for (const auto& [event_id, delta] : contributions) {
      sum += delta;
    }
    return sum;
  }
};

}  // namespace fieldops
