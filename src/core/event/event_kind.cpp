#include "core/event/event_kind.hpp"

#include <array>
#include <type_traits>
#include <utility>

namespace fieldops {
namespace {

struct KindEntry {
  EventKind kind;
  std::string_view name;
  std::string_view view_key;
};

constexpr std::array<KindEntry, 18> kKindTable = {{
    {EventKind::OperationCreated, "operation.created", "operation"},
    {EventKind::OperationUpdated, "operation.updated", "operation"},
    {EventKind::OperationClosed, "operation.closed", "operation"},
    {EventKind::CountyAdded, "geography.county_added", "geography"},
    {EventKind::CountyRemoved, "geography.county_removed", "geography"},
    {EventKind::PersonAssigned, "roster.person_assigned", "roster"},
    {EventKind::PersonUnassigned, "roster.person_unassigned", "roster"},
    {EventKind::FacilityCreated, "facility.created", "facilities"},
    {EventKind::FacilityUpdated, "facility.updated", "facilities"},
    {EventKind::FacilityStatusChanged, "facility.status_changed", "facilities"},
    {EventKind::FacilityResourceAdded, "facility.resource_added", "facilities"},
    {EventKind::MealsServedIncrement, "metrics.meals_served.increment", "metrics"},
    {EventKind::ShelteredCountSet, "metrics.sheltered_count.set", "metrics"},
    {EventKind::WorkAssignmentCreated, "work_assignment.created", "work_assignments"},
    {EventKind::WorkAssignmentUpdated, "work_assignment.updated", "work_assignments"},
    {EventKind::WorkAssignmentCompleted, "work_assignment.completed", "work_assignments"},
    {EventKind::IapSectionUpdated, "iap.section_updated", "iap"},
    {EventKind::ConflictResolved, "conflict.resolved", "conflicts"},
}};

const KindEntry& entry_for(EventKind kind) {
  return kKindTable[static_cast<std::size_t>(kind)];
}

std::string target_of(const Payload& payload, const std::string& operation_id) {
  return std::visit(
      [&operation_id](const auto& p) -> std::string {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, OperationCreatedPayload> || std::is_same_v<T, OperationUpdatedPayload> ||
                      std::is_same_v<T, OperationClosedPayload>) {
          return operation_id;
        } else if constexpr (std::is_same_v<T, CountyAddedPayload> || std::is_same_v<T, CountyRemovedPayload>) {
          return p.county_id;
        } else if constexpr (std::is_same_v<T, PersonAssignedPayload>) {
          return p.person_id;
        } else if constexpr (std::is_same_v<T, PersonUnassignedPayload>) {
          return p.person_id + "/" + p.position_code;
        } else if constexpr (std::is_same_v<T, FacilityResourceAddedPayload>) {
          return p.facility_id + "/" + p.resource;
        } else if constexpr (std::is_same_v<T, FacilityCreatedPayload> || std::is_same_v<T, FacilityUpdatedPayload> ||
                             std::is_same_v<T, FacilityStatusChangedPayload> ||
                             std::is_same_v<T, ShelteredCountSetPayload>) {
          return p.facility_id;
        } else if constexpr (std::is_same_v<T, MealsServedIncrementPayload>) {
          return p.location_id + "/" + p.meal_type;
        } else if constexpr (std::is_same_v<T, WorkAssignmentCreatedPayload> ||
                             std::is_same_v<T, WorkAssignmentUpdatedPayload> ||
                             std::is_same_v<T, WorkAssignmentCompletedPayload>) {
          return p.assignment_id;
        } else if constexpr (std::is_same_v<T, IapSectionUpdatedPayload>) {
          return p.iap_id + "/" + p.section;
        } else {
          return p.conflict_id;
        }
      },
      payload);
}

}  // namespace

bool first_write_kind(EventKind kind) {
  switch (kind) {
    case EventKind::OperationCreated:
    case EventKind::OperationClosed:
    case EventKind::FacilityCreated:
    case EventKind::WorkAssignmentCreated:
    case EventKind::WorkAssignmentCompleted:
    case EventKind::ConflictResolved:
      return true;
    default:
      return false;
  }
}

std::string_view event_kind_name(EventKind kind) {
  return entry_for(kind).name;
}

std::optional<EventKind> event_kind_from_name(std::string_view name) {
  for (const auto& entry : kKindTable) {
    if (entry.name == name) {
      return entry.kind;
    }
  }
  return std::nullopt;
}

const std::vector<EventKind>& all_event_kinds() {
  static const std::vector<EventKind> kinds = [] {
    std::vector<EventKind> out;
    out.reserve(kKindTable.size());
    for (const auto& entry : kKindTable) {
      out.push_back(entry.kind);
    }
    return out;
  }();
  return kinds;
}

EventKind payload_kind(const Payload& payload) {
  return static_cast<EventKind>(payload.index());
}

std::string_view view_key_for_kind(EventKind kind) {
  return entry_for(kind).view_key;
}

const std::vector<std::string_view>& all_view_keys() {
  static const std::vector<std::string_view> keys = {
      "operation", "geography", "roster", "facilities", "metrics", "work_assignments", "iap", "conflicts",
  };
  return keys;
}

std::string entity_key(const Event& event) {
  // County add and remove target the same set element.
  const std::string_view scope = (event.kind == EventKind::CountyAdded || event.kind == EventKind::CountyRemoved)
                                     ? std::string_view{"geography.county"}
                                     : event_kind_name(event.kind);
  return std::string{scope} + ":" + target_of(event.payload, event.operation_id);
}

std::string_view sync_status_name(SyncStatus status) {
  switch (status) {
    case SyncStatus::Local:
      return "local";
    case SyncStatus::Pending:
      return "pending";
    case SyncStatus::Synced:
      return "synced";
    case SyncStatus::Failed:
      return "failed";
  }
  return "local";
}

std::optional<SyncStatus> sync_status_from_name(std::string_view name) {
  if (name == "local") {
    return SyncStatus::Local;
  }
  if (name == "pending") {
    return SyncStatus::Pending;
  }
  if (name == "synced") {
    return SyncStatus::Synced;
  }
  if (name == "failed") {
    return SyncStatus::Failed;
  }
  return std::nullopt;
}

std::string_view strategy_name(ConflictStrategy strategy) {
  switch (strategy) {
    case ConflictStrategy::Lww:
      return "lww";
    case ConflictStrategy::Fww:
      return "fww";
    case ConflictStrategy::Crdt:
      return "crdt";
    case ConflictStrategy::Domain:
      return "domain";
    case ConflictStrategy::Manual:
      return "manual";
  }
  return "lww";
}

}  // namespace fieldops
