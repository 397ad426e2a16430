#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "core/model/types.hpp"
#include "core/projection/views.hpp"

namespace fieldops {

struct ViewChange {
  std::string operation_id;
  std::string view_key;
  std::string event_id;
};

using ViewCallback = std::function<void(const ViewChange&)>;

// Upgrades an event by exactly one schema version.
using Migration = std::function<Result(Event&)>;

class Projector {
public:
  // Pure fold step. The registers make the result independent of arrival order.
  static void apply_one(OperationView& view, const Event& event);

  // Parents before children, then (timestamp, sequence, device, id). A missing parent makes a root.
  static std::vector<Event> causal_order(std::vector<Event> events);

  void register_migration(EventKind kind, std::uint32_t from_version, Migration migration);
  Result migrate(Event& event) const;

  // Full replay into a fresh view. Events without a migration path are skipped.
  Result project(const std::string& operation_id, const std::vector<Event>& stream, OperationView& out) const;

  // Incremental hot path on the owned view; notifies subscribers.
  Result apply(const Event& event);
  Result rebuild(const std::string& operation_id, const std::vector<Event>& stream);
  Result self_test(const std::string& operation_id, const std::vector<Event>& stream);

  [[nodiscard]] std::shared_ptr<const OperationView> snapshot(const std::string& operation_id) const;

  // `view_key` of "*" receives every change of the operation. Callbacks run inside the engine's
  // critical section and must not call back into it.
  std::uint64_t subscribe(const std::string& operation_id, const std::string& view_key, ViewCallback callback);
  bool unsubscribe(std::uint64_t subscription_id);

  [[nodiscard]] const std::vector<Event>& schema_backlog() const { return backlog_; }
  Result retry_backlog();

  void reset();

private:
  struct Subscription {
    std::string operation_id;
    std::string view_key;
    ViewCallback callback;
  };

  void notify(const ViewChange& change) const;

  std::map<std::string, OperationView> views_;
  std::map<std::pair<EventKind, std::uint32_t>, Migration> migrations_;
  std::vector<Event> backlog_;
  std::map<std::uint64_t, Subscription> subscriptions_;
  std::uint64_t next_subscription_id_ = 1;
};

}  // namespace fieldops
