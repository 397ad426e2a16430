#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace fieldops {

struct ManualConflict {
  std::string conflict_id;
  std::string operation_id;
  EventKind kind = EventKind::IapSectionUpdated;
  std::string entity_key;
  std::vector<std::string> candidate_event_ids;
  std::int64_t detected_at = 0;
};

// Bounded queue of conflicts awaiting a human decision, persisted to conflicts.dat.
class ConflictQueue {
public:
  explicit ConflictQueue(std::size_t capacity = 256);

  void set_capacity(std::size_t capacity);
  Result open(std::string_view data_dir);

  // A second conflict on an entity that already waits joins the existing entry.
  Result enqueue(ManualConflict conflict, std::string& conflict_id_out);
  Result remove(const std::string& conflict_id);

  [[nodiscard]] std::optional<ManualConflict> find(const std::string& conflict_id) const;
  [[nodiscard]] std::vector<ManualConflict> pending(const std::string& operation_id) const;
  [[nodiscard]] bool holds_event(const std::string& event_id) const;
  [[nodiscard]] std::size_t size() const { return conflicts_.size(); }
  [[nodiscard]] std::size_t capacity() const { return capacity_; }

private:
  Result persist() const;

  std::size_t capacity_;
  std::string path_;
  std::map<std::string, ManualConflict> conflicts_;
};

std::string conflict_id_for(const std::string& entity_key, std::vector<std::string> candidate_event_ids);

}  // namespace fieldops
