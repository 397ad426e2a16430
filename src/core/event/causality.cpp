#include "core/event/causality.hpp"

#include <deque>
#include <iterator>
#include <unordered_set>
#include <utility>

namespace fieldops {

CausalityTracker::CausalityTracker(std::size_t awaiting_capacity, std::int64_t awaiting_timeout_ms)
    : awaiting_capacity_(awaiting_capacity == 0 ? 1 : awaiting_capacity),
      awaiting_timeout_ms_(awaiting_timeout_ms) {}

void CausalityTracker::configure(std::size_t awaiting_capacity, std::int64_t awaiting_timeout_ms) {
  awaiting_capacity_ = awaiting_capacity == 0 ? 1 : awaiting_capacity;
  awaiting_timeout_ms_ = awaiting_timeout_ms;
}

Result CausalityTracker::stamp(Event& event) const {
  if (!event.causation_id.has_value()) {
    if (event.correlation_id.empty()) {
      event.correlation_id = event.id;
    }
    return Result::success();
  }

  const auto parent = nodes_.find(*event.causation_id);
  if (parent == nodes_.end()) {
    return Result::failure(ErrorCode::Validation, "Causation parent is unknown: " + *event.causation_id,
                           "causation_id");
  }
  if (event.correlation_id.empty()) {
    event.correlation_id = parent->second.correlation_id;
  }
  return Result::success();
}

void CausalityTracker::record(const Event& event) {
  if (nodes_.contains(event.id)) {
    return;
  }
  const std::string correlation = event.correlation_id.empty() ? event.id : event.correlation_id;
  nodes_.emplace(event.id, Node{event.causation_id, correlation, event.device_id, event.timestamp, event.sequence});
  correlation_index_[correlation].push_back(event.id);
  device_index_[event.device_id].emplace(std::make_pair(event.timestamp, event.sequence), event.id);
}

bool CausalityTracker::known(const std::string& event_id) const {
  return nodes_.contains(event_id);
}

bool CausalityTracker::device_order_before(const Node& a, const Node& b) const {
  if (a.device_id != b.device_id) {
    return false;
  }
  if (a.timestamp != b.timestamp) {
    return a.timestamp < b.timestamp;
  }
  return a.sequence < b.sequence;
}

const std::string* CausalityTracker::device_predecessor(const Node& node) const {
  const auto lane = device_index_.find(node.device_id);
  if (lane == device_index_.end()) {
    return nullptr;
  }
  const auto self = lane->second.find({node.timestamp, node.sequence});
  if (self == lane->second.end() || self == lane->second.begin()) {
    return nullptr;
  }
  return &std::prev(self)->second;
}

// Walks back from `later` over causation links and same-device predecessors.
bool CausalityTracker::happened_before(const std::string& earlier_id, const std::string& later_id) const {
  if (earlier_id == later_id) {
    return false;
  }
  const auto earlier = nodes_.find(earlier_id);
  if (earlier == nodes_.end() || !nodes_.contains(later_id)) {
    return false;
  }

  std::deque<std::string> frontier{later_id};
  std::unordered_set<std::string> visited;
  while (!frontier.empty()) {
    const std::string current = std::move(frontier.front());
    frontier.pop_front();
    if (!visited.insert(current).second) {
      continue;
    }

    const auto node = nodes_.find(current);
    if (node == nodes_.end()) {
      continue;
    }
    if (current != later_id && current == earlier_id) {
      return true;
    }
    if (device_order_before(earlier->second, node->second)) {
      return true;
    }
    if (node->second.causation_id.has_value()) {
      frontier.push_back(*node->second.causation_id);
    }
    if (const std::string* previous = device_predecessor(node->second)) {
      frontier.push_back(*previous);
    }
  }
  return false;
}

bool CausalityTracker::concurrent(const std::string& a_id, const std::string& b_id) const {
  if (a_id == b_id) {
    return false;
  }
  return !happened_before(a_id, b_id) && !happened_before(b_id, a_id);
}

std::vector<std::string> CausalityTracker::correlation_members(const std::string& correlation_id) const {
  const auto it = correlation_index_.find(correlation_id);
  if (it == correlation_index_.end()) {
    return {};
  }
  return it->second;
}

Result CausalityTracker::admit(const Event& event, std::int64_t now_ms, Admission& out) {
  if (!event.causation_id.has_value() || known(*event.causation_id)) {
    out = Admission::Ready;
    return Result::success();
  }

  out = Admission::Buffered;
  if (awaiting_.contains(event.id)) {
    return Result::success("Event already awaiting its parent.");
  }
  if (awaiting_.size() >= awaiting_capacity_) {
    return Result::failure(ErrorCode::CausalityTimeout,
                           "Awaiting-parent buffer is full; a full sync is required.", event.id);
  }
  awaiting_.emplace(event.id, Awaiting{event, now_ms});
  return Result::success("Event buffered until its parent arrives.", event.id);
}

std::vector<Event> CausalityTracker::release_ready(const std::string& parent_id) {
  std::vector<Event> released;
  std::deque<std::string> parents{parent_id};
  while (!parents.empty()) {
    const std::string parent = std::move(parents.front());
    parents.pop_front();
    for (auto it = awaiting_.begin(); it != awaiting_.end();) {
      if (it->second.event.causation_id == parent) {
        parents.push_back(it->first);
        released.push_back(std::move(it->second.event));
        it = awaiting_.erase(it);
      } else {
        ++it;
      }
    }
  }
  return released;
}

std::vector<Event> CausalityTracker::expire(std::int64_t now_ms) {
  std::vector<Event> expired;
  for (auto it = awaiting_.begin(); it != awaiting_.end();) {
    if (now_ms - it->second.admitted_at >= awaiting_timeout_ms_) {
      expired.push_back(std::move(it->second.event));
      it = awaiting_.erase(it);
    } else {
      ++it;
    }
  }
  return expired;
}

bool CausalityTracker::is_awaiting(const std::string& event_id) const {
  return awaiting_.contains(event_id);
}

void CausalityTracker::reset() {
  nodes_.clear();
  correlation_index_.clear();
  device_index_.clear();
  awaiting_.clear();
}

}  // namespace fieldops
