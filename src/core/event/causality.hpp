#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/model/types.hpp"

namespace fieldops {

enum class Admission {
  Ready,
  Buffered,
};

class CausalityTracker {
public:
  CausalityTracker(std::size_t awaiting_capacity = 1024, std::int64_t awaiting_timeout_ms = 300000);

  void configure(std::size_t awaiting_capacity, std::int64_t awaiting_timeout_ms);

  // Fills the correlation id of a locally built event: the parent's correlation when a causation
  // is given, otherwise the event's own id. The parent must already be known.
  Result stamp(Event& event) const;

  void record(const Event& event);
  [[nodiscard]] bool known(const std::string& event_id) const;

  [[nodiscard]] bool happened_before(const std::string& earlier_id, const std::string& later_id) const;
  [[nodiscard]] bool concurrent(const std::string& a_id, const std::string& b_id) const;
  [[nodiscard]] std::vector<std::string> correlation_members(const std::string& correlation_id) const;

  // Remote events whose parent is not yet known wait here until it arrives or they time out.
  Result admit(const Event& event, std::int64_t now_ms, Admission& out);
  std::vector<Event> release_ready(const std::string& parent_id);
  std::vector<Event> expire(std::int64_t now_ms);
  [[nodiscard]] bool is_awaiting(const std::string& event_id) const;
  [[nodiscard]] std::size_t awaiting_count() const { return awaiting_.size(); }

  void reset();

private:
  struct Node {
    std::optional<std::string> causation_id;
    std::string correlation_id;
    std::string device_id;
    std::int64_t timestamp = 0;
    std::uint32_t sequence = 0;
  };

  struct Awaiting {
    Event event;
    std::int64_t admitted_at = 0;
  };

  [[nodiscard]] bool device_order_before(const Node& a, const Node& b) const;
  [[nodiscard]] const std::string* device_predecessor(const Node& node) const;

  std::size_t awaiting_capacity_;
  std::int64_t awaiting_timeout_ms_;
  std::unordered_map<std::string, Node> nodes_;
  std::unordered_map<std::string, std::vector<std::string>> correlation_index_;
  // Per device, event ids in (timestamp, sequence) order.
  std::unordered_map<std::string, std::map<std::pair<std::int64_t, std::uint32_t>, std::string>> device_index_;
  std::map<std::string, Awaiting> awaiting_;
};

}  // namespace fieldops
