#include "core/resolve/conflict_policy.hpp"

#include <utility>

#include "core/event/event_kind.hpp"
#include "core/util/canonical.hpp"

namespace fieldops {

Result parse_policy_spec(std::string_view spec, PolicyEntry& out) {
  const std::string text = util::lowercase_copy(util::trim_copy(spec));
  if (text == "lww") {
    out = {ConflictStrategy::Lww, {}};
  } else if (text == "fww") {
    out = {ConflictStrategy::Fww, {}};
  } else if (text == "crdt") {
    out = {ConflictStrategy::Crdt, {}};
  } else if (text == "manual") {
    out = {ConflictStrategy::Manual, {}};
  } else if (text.starts_with("domain:") && text.size() > 7U) {
    out = {ConflictStrategy::Domain, text.substr(7)};
  } else {
    return Result::failure(ErrorCode::Configuration, "Unknown conflict strategy: " + std::string{spec}, "policy");
  }
  return Result::success();
}

std::string format_policy_spec(const PolicyEntry& entry) {
  if (entry.strategy == ConflictStrategy::Domain) {
    return "domain:" + entry.domain_function;
  }
  return std::string{strategy_name(entry.strategy)};
}

bool kind_supports_crdt(EventKind kind) {
  return kind == EventKind::CountyAdded || kind == EventKind::CountyRemoved ||
         kind == EventKind::FacilityResourceAdded || kind == EventKind::MealsServedIncrement;
}

bool kind_requires_crdt(EventKind kind) {
  return kind == EventKind::FacilityResourceAdded || kind == EventKind::MealsServedIncrement;
}

ConflictPolicyTable ConflictPolicyTable::defaults() {
  ConflictPolicyTable table;
  table.entries_ = {
      {EventKind::OperationCreated, {ConflictStrategy::Fww, {}}},
      {EventKind::OperationUpdated, {ConflictStrategy::Lww, {}}},
      {EventKind::OperationClosed, {ConflictStrategy::Fww, {}}},
      {EventKind::CountyAdded, {ConflictStrategy::Crdt, {}}},
      {EventKind::CountyRemoved, {ConflictStrategy::Crdt, {}}},
      {EventKind::PersonAssigned, {ConflictStrategy::Domain, std::string{kSingleActivePosition}}},
      {EventKind::PersonUnassigned, {ConflictStrategy::Lww, {}}},
      {EventKind::FacilityCreated, {ConflictStrategy::Fww, {}}},
      {EventKind::FacilityUpdated, {ConflictStrategy::Lww, {}}},
      {EventKind::FacilityStatusChanged, {ConflictStrategy::Lww, {}}},
      {EventKind::FacilityResourceAdded, {ConflictStrategy::Crdt, {}}},
      {EventKind::MealsServedIncrement, {ConflictStrategy::Crdt, {}}},
      {EventKind::ShelteredCountSet, {ConflictStrategy::Lww, {}}},
      {EventKind::WorkAssignmentCreated, {ConflictStrategy::Fww, {}}},
      {EventKind::WorkAssignmentUpdated, {ConflictStrategy::Lww, {}}},
      {EventKind::WorkAssignmentCompleted, {ConflictStrategy::Fww, {}}},
      {EventKind::IapSectionUpdated, {ConflictStrategy::Manual, {}}},
      {EventKind::ConflictResolved, {ConflictStrategy::Fww, {}}},
  };
  return table;
}

Result ConflictPolicyTable::set(EventKind kind, PolicyEntry entry) {
  if (entry.strategy == ConflictStrategy::Crdt && !kind_supports_crdt(kind)) {
    return Result::failure(ErrorCode::Configuration,
                           "Kind " + std::string{event_kind_name(kind)} + " has no CRDT combinator.",
                           std::string{event_kind_name(kind)});
  }
  if (entry.strategy != ConflictStrategy::Crdt && kind_requires_crdt(kind)) {
    return Result::failure(ErrorCode::Configuration,
                           "Kind " + std::string{event_kind_name(kind)} + " is a counter and only supports crdt.",
                           std::string{event_kind_name(kind)});
  }
  if (entry.strategy == ConflictStrategy::Domain && entry.domain_function.empty()) {
    return Result::failure(ErrorCode::Configuration, "Domain policy needs a function name.",
                           std::string{event_kind_name(kind)});
  }
  entries_[kind] = std::move(entry);
  return Result::success();
}

Result ConflictPolicyTable::apply_override(std::string_view kind_name, std::string_view spec) {
  const auto kind = event_kind_from_name(kind_name);
  if (!kind.has_value()) {
    return Result::failure(ErrorCode::Configuration, "Policy names an unknown event kind: " + std::string{kind_name},
                           std::string{kind_name});
  }

  PolicyEntry entry;
  const Result parsed = parse_policy_spec(spec, entry);
  if (!parsed.ok) {
    return parsed;
  }
  return set(*kind, std::move(entry));
}

void ConflictPolicyTable::erase(EventKind kind) {
  entries_.erase(kind);
}

Result ConflictPolicyTable::lookup(EventKind kind, PolicyEntry& out) const {
  const auto it = entries_.find(kind);
  if (it == entries_.end()) {
    return Result::failure(ErrorCode::Configuration,
                           "No conflict policy configured for " + std::string{event_kind_name(kind)} + ".",
                           std::string{event_kind_name(kind)});
  }
  out = it->second;
  return Result::success();
}

Result ConflictPolicyTable::validate(const std::set<std::string, std::less<>>& domain_functions) const {
  for (const EventKind kind : all_event_kinds()) {
    PolicyEntry entry;
    const Result found = lookup(kind, entry);
    if (!found.ok) {
      return found;
    }
    if (entry.strategy == ConflictStrategy::Domain && !domain_functions.contains(entry.domain_function)) {
      return Result::failure(ErrorCode::Configuration,
                             "Policy for " + std::string{event_kind_name(kind)} +
                                 " names an unregistered merge function: " + entry.domain_function,
                             std::string{event_kind_name(kind)});
    }
  }

  PolicyEntry added;
  PolicyEntry removed;
  if (lookup(EventKind::CountyAdded, added).ok && lookup(EventKind::CountyRemoved, removed).ok &&
      (added.strategy != removed.strategy || added.domain_function != removed.domain_function)) {
    return Result::failure(ErrorCode::Configuration,
                           "geography.county_added and geography.county_removed must share one policy.",
                           "geography.county_removed");
  }
  return Result::success("Conflict policy table complete.", std::to_string(entries_.size()));
}

}  // namespace fieldops
