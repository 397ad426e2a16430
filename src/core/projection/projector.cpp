#include "core/projection/projector.hpp"

#include <algorithm>
#include <queue>
#include <unordered_map>
#include <unordered_set>

#include "core/event/event_kind.hpp"
#include "core/resolve/ordering.hpp"
#include "core/util/logging.hpp"

namespace fieldops {
namespace {

void reduce(OperationView& view, const Event& event, const OperationCreatedPayload& p) {
  view.operation.created.offer(p, event);
}

void reduce(OperationView& view, const Event& event, const OperationUpdatedPayload& p) {
  if (p.name) {
    view.operation.name.offer(*p.name, event);
  }
  if (p.director) {
    view.operation.director.offer(*p.director, event);
  }
  if (p.region) {
    view.operation.region.offer(*p.region, event);
  }
}

void reduce(OperationView& view, const Event& event, const OperationClosedPayload& p) {
  view.operation.closed_reason.offer(p.reason, event);
}

void reduce(OperationView& view, const Event& event, const CountyAddedPayload& p) {
  CountyEntry& county = view.counties[p.county_id];
  county.present.offer(true, event);
  county.name.offer(p.name, event);
  county.state.offer(p.state, event);
}

void reduce(OperationView& view, const Event& event, const CountyRemovedPayload& p) {
  view.counties[p.county_id].present.offer(false, event);
}

void reduce(OperationView& view, const Event& event, const PersonAssignedPayload& p) {
  PersonEntry& person = view.roster[p.person_id];
  if (!p.person_name.empty()) {
    person.name.offer(p.person_name, event);
  }
  person.positions[p.position_code].offer(true, event);
}

void reduce(OperationView& view, const Event& event, const PersonUnassignedPayload& p) {
  view.roster[p.person_id].positions[p.position_code].offer(false, event);
}

void reduce(OperationView& view, const Event& event, const FacilityCreatedPayload& p) {
  view.facilities[p.facility_id].created.offer(p, event);
}

void reduce(OperationView& view, const Event& event, const FacilityUpdatedPayload& p) {
  FacilityEntry& facility = view.facilities[p.facility_id];
  if (p.name) {
    facility.name.offer(*p.name, event);
  }
  if (p.address) {
    facility.address.offer(*p.address, event);
  }
  if (p.capacity) {
    facility.capacity.offer(*p.capacity, event);
  }
}

void reduce(OperationView& view, const Event& event, const FacilityStatusChangedPayload& p) {
  view.facilities[p.facility_id].status.offer(p.status, event);
}

void reduce(OperationView& view, const Event& event, const FacilityResourceAddedPayload& p) {
  view.facilities[p.facility_id].resources[p.resource].add(event.id, p.quantity);
}

void reduce(OperationView& view, const Event& event, const MealsServedIncrementPayload& p) {
  view.meals[{p.location_id, p.meal_type}].add(event.id, p.count);
}

void reduce(OperationView& view, const Event& event, const ShelteredCountSetPayload& p) {
  view.sheltered[p.facility_id].offer(p.count, event);
}

void reduce(OperationView& view, const Event& event, const WorkAssignmentCreatedPayload& p) {
  view.work_assignments[p.assignment_id].created.offer(p, event);
}

void reduce(OperationView& view, const Event& event, const WorkAssignmentUpdatedPayload& p) {
  WorkAssignmentEntry& work = view.work_assignments[p.assignment_id];
  if (p.title) {
    work.title.offer(*p.title, event);
  }
  if (p.assignee_id) {
    work.assignee_id.offer(*p.assignee_id, event);
  }
  if (p.priority) {
    work.priority.offer(*p.priority, event);
  }
}

void reduce(OperationView& view, const Event& event, const WorkAssignmentCompletedPayload& p) {
  view.work_assignments[p.assignment_id].completed_note.offer(p.note, event);
}

void reduce(OperationView& view, const Event& event, const IapSectionUpdatedPayload& p) {
  view.iap_sections[{p.iap_id, p.section}].offer(p.content, event);
}

void reduce(OperationView& view, const Event& event, const ConflictResolvedPayload& p) {
  ResolvedConflictEntry entry{p.winner_event_id, p.candidate_event_ids, event.actor_id, lww_key(event)};
  view.resolved_conflicts[p.conflict_id].offer(entry, fww_key(event));
}

struct LaterFirst {
  bool operator()(const std::pair<FwwKey, std::size_t>& lhs, const std::pair<FwwKey, std::size_t>& rhs) const {
    return rhs.first < lhs.first;
  }
};

}  // namespace

void Projector::apply_one(OperationView& view, const Event& event) {
  if (view.operation_id.empty()) {
    view.operation_id = event.operation_id;
  }
  std::visit([&view, &event](const auto& payload) { reduce(view, event, payload); }, event.payload);
  ++view.applied_events;
}

std::vector<Event> Projector::causal_order(std::vector<Event> events) {
  std::unordered_map<std::string, std::size_t> index_by_id;
  for (std::size_t i = 0; i < events.size(); ++i) {
    index_by_id.emplace(events[i].id, i);
  }

  std::vector<std::vector<std::size_t>> children(events.size());
  std::vector<std::size_t> waiting_on(events.size(), 0);
  for (std::size_t i = 0; i < events.size(); ++i) {
    if (!events[i].causation_id.has_value()) {
      continue;
    }
    const auto parent = index_by_id.find(*events[i].causation_id);
    if (parent != index_by_id.end() && parent->second != i) {
      children[parent->second].push_back(i);
      ++waiting_on[i];
    }
  }

  std::priority_queue<std::pair<FwwKey, std::size_t>, std::vector<std::pair<FwwKey, std::size_t>>, LaterFirst> ready;
  for (std::size_t i = 0; i < events.size(); ++i) {
    if (waiting_on[i] == 0) {
      ready.emplace(fww_key(events[i]), i);
    }
  }

  std::vector<Event> ordered;
  ordered.reserve(events.size());
  std::vector<bool> emitted(events.size(), false);
  while (!ready.empty()) {
    const std::size_t next = ready.top().second;
    ready.pop();
    emitted[next] = true;
    ordered.push_back(events[next]);
    for (const std::size_t child : children[next]) {
      if (--waiting_on[child] == 0) {
        ready.emplace(fww_key(events[child]), child);
      }
    }
  }

  // Only a causation cycle leaves events behind; keep them in key order.
  if (ordered.size() < events.size()) {
    std::vector<std::size_t> rest;
    for (std::size_t i = 0; i < events.size(); ++i) {
      if (!emitted[i]) {
        rest.push_back(i);
      }
    }
    std::ranges::sort(rest, [&events](std::size_t lhs, std::size_t rhs) {
      return fww_key(events[lhs]) < fww_key(events[rhs]);
    });
    for (const std::size_t i : rest) {
      ordered.push_back(events[i]);
    }
  }
  return ordered;
}

void Projector::register_migration(EventKind kind, std::uint32_t from_version, Migration migration) {
  migrations_[{kind, from_version}] = std::move(migration);
}

Result Projector::migrate(Event& event) const {
  if (event.schema_version > kCurrentSchemaVersion) {
    return Result::failure(ErrorCode::SchemaVersionMismatch,
                           "Event " + event.id + " uses newer schema version " +
                               std::to_string(event.schema_version) + ".",
                           event.id);
  }

  const std::uint32_t original = event.schema_version;
  while (event.schema_version < kCurrentSchemaVersion) {
    const auto it = migrations_.find({event.kind, event.schema_version});
    if (it == migrations_.end()) {
      return Result::failure(ErrorCode::SchemaVersionMismatch,
                             "No migration for " + std::string{event_kind_name(event.kind)} + " from version " +
                                 std::to_string(event.schema_version) + ".",
                             event.id);
    }
    const Result migrated = it->second(event);
    if (!migrated.ok) {
      return Result::failure(ErrorCode::SchemaVersionMismatch, migrated.message, event.id);
    }
    ++event.schema_version;
    event.migrated_from = original;
  }
  return Result::success();
}

Result Projector::project(const std::string& operation_id, const std::vector<Event>& stream,
                          OperationView& out) const {
  OperationView view;
  view.operation_id = operation_id;

  std::size_t skipped = 0;
  for (const auto& ordered : causal_order(stream)) {
    Event event = ordered;
    if (!migrate(event).ok) {
      ++skipped;
      continue;
    }
    apply_one(view, event);
  }

  out = std::move(view);
  if (skipped > 0) {
    return Result::success("Projected with events awaiting migration.", std::to_string(skipped));
  }
  return Result::success("Projected.");
}

Result Projector::apply(const Event& event) {
  Event migrated = event;
  const Result migration = migrate(migrated);
  if (!migration.ok) {
    if (std::ranges::none_of(backlog_, [&event](const Event& held) { return held.id == event.id; })) {
      backlog_.push_back(event);
    }
    FIELDOPS_LOG_WARN("Event held in schema backlog",
                      {util::StringField("event", event.id), util::StringField("reason", migration.message)});
    return migration;
  }

  OperationView& view = views_[event.operation_id];
  apply_one(view, migrated);
  notify({event.operation_id, std::string{view_key_for_kind(event.kind)}, event.id});
  return Result::success("Event projected.", event.id);
}

Result Projector::rebuild(const std::string& operation_id, const std::vector<Event>& stream) {
  OperationView view;
  const Result projected = project(operation_id, stream, view);
  if (!projected.ok) {
    return projected;
  }

  views_[operation_id] = std::move(view);
  std::erase_if(backlog_, [&operation_id](const Event& held) { return held.operation_id == operation_id; });
  for (const auto& event : stream) {
    Event probe = event;
    if (!migrate(probe).ok) {
      backlog_.push_back(event);
    }
  }

  for (const auto& key : all_view_keys()) {
    notify({operation_id, std::string{key}, {}});
  }
  return projected;
}

Result Projector::self_test(const std::string& operation_id, const std::vector<Event>& stream) {
  OperationView replayed;
  const Result projected = project(operation_id, stream, replayed);
  if (!projected.ok) {
    return projected;
  }

  const auto current = views_.find(operation_id);
  const std::string incremental_digest =
      current == views_.end() ? view_digest(OperationView{}) : view_digest(current->second);
  const std::string replay_digest = view_digest(replayed);
  if (stream.empty() && current == views_.end()) {
    return Result::success("Nothing projected yet.");
  }
  if (incremental_digest == replay_digest) {
    return Result::success("Incremental view matches full replay.", replay_digest);
  }

  FIELDOPS_LOG_ERROR("Projection diverged from replay; rebuilding",
                     {util::StringField("operation", operation_id),
                      util::StringField("incremental", incremental_digest),
                      util::StringField("replay", replay_digest)});
  const Result rebuilt = rebuild(operation_id, stream);
  if (!rebuilt.ok) {
    return rebuilt;
  }
  return Result::failure(ErrorCode::ProjectionDivergence, "Projection diverged and was rebuilt.", operation_id);
}

std::shared_ptr<const OperationView> Projector::snapshot(const std::string& operation_id) const {
  const auto it = views_.find(operation_id);
  if (it == views_.end()) {
    OperationView empty;
    empty.operation_id = operation_id;
    return std::make_shared<const OperationView>(std::move(empty));
  }
  return std::make_shared<const OperationView>(it->second);
}

std::uint64_t Projector::subscribe(const std::string& operation_id, const std::string& view_key,
                                   ViewCallback callback) {
  const std::uint64_t id = next_subscription_id_++;
  subscriptions_.emplace(id, Subscription{operation_id, view_key, std::move(callback)});
  return id;
}

bool Projector::unsubscribe(std::uint64_t subscription_id) {
  return subscriptions_.erase(subscription_id) > 0;
}

Result Projector::retry_backlog() {
  std::vector<Event> held;
  held.swap(backlog_);

  std::size_t applied = 0;
  for (const auto& event : held) {
    if (apply(event).ok) {
      ++applied;
    }
  }
  if (!backlog_.empty()) {
    return Result::failure(ErrorCode::SchemaVersionMismatch,
                           std::to_string(backlog_.size()) + " events still await migration.",
                           std::to_string(applied));
  }
  return Result::success("Schema backlog drained.", std::to_string(applied));
}

void Projector::reset() {
  views_.clear();
  backlog_.clear();
}

void Projector::notify(const ViewChange& change) const {
  for (const auto& [id, subscription] : subscriptions_) {
    if (subscription.operation_id != change.operation_id) {
      continue;
    }
    if (subscription.view_key == "*" || subscription.view_key == change.view_key) {
      subscription.callback(change);
    }
  }
}

}  // namespace fieldops
