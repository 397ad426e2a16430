#include "core/projection/views.hpp"


#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace fieldops {
namespace {

template <typename T>
const T* find_entry(const std::map<std::string, T>& entries, const std::string& key) {
  const auto it = entries.find(key);
  return it == entries.end() ? nullptr : &it->second;
}

// The write a field shows: the winner of the newest resolution that is newer than every write of
// the field and names one of them, otherwise the register's own pick.
template <typename T, bool FirstWrite>
const T* shown(const OperationView& view, const FieldRegister<T, FirstWrite>& field) {
  if (!field.set()) {
    return nullptr;
  }
  const LwwKey newest = field.newest();
  const ResolvedConflictEntry* best = nullptr;
  for (const auto& [conflict_id, resolution] : view.resolved_conflicts) {
    if (!resolution.set || !(newest < resolution.value.resolved_key) ||
        !field.writes.contains(resolution.value.winner_event_id)) {
      continue;
    }
    if (best == nullptr || best->resolved_key < resolution.value.resolved_key) {
      best = &resolution.value;
    }
  }
  if (best != nullptr) {
    return &field.writes.at(best->winner_event_id).value;
  }
  return &field.default_write()->value;
}

template <typename T, bool FirstWrite>
T shown_or(const OperationView& view, const FieldRegister<T, FirstWrite>& field, T fallback) {
  const T* value = shown(view, field);
  return value == nullptr ? fallback : *value;
}

std::string facility_address(const OperationView& view, const FacilityEntry& facility) {
  const auto* created = shown(view, facility.created);
  return shown_or(view, facility.address, created == nullptr ? std::string{} : created->address);
}

std::int64_t facility_capacity(const OperationView& view, const FacilityEntry& facility) {
  const auto* created = shown(view, facility.created);
  return shown_or(view, facility.capacity, created == nullptr ? std::int64_t{0} : created->capacity);
}

std::string entry_name(const OperationView& view, const FacilityEntry& facility) {
  const auto* created = shown(view, facility.created);
  return shown_or(view, facility.name, created == nullptr ? std::string{} : created->name);
}

std::string entry_status(const OperationView& view, const FacilityEntry& facility) {
  return shown_or(view, facility.status, facility.created.set() ? std::string{"open"} : std::string{});
}

std::string work_title(const OperationView& view, const WorkAssignmentEntry& work) {
  const auto* created = shown(view, work.created);
  return shown_or(view, work.title, created == nullptr ? std::string{} : created->title);
}

std::string work_priority(const OperationView& view, const WorkAssignmentEntry& work) {
  const auto* created = shown(view, work.created);
  return shown_or(view, work.priority, created == nullptr ? std::string{} : created->priority);
}

}  // namespace

std::string operation_name(const OperationView& view) {
  const auto* created = shown(view, view.operation.created);
  return shown_or(view, view.operation.name, created == nullptr ? std::string{} : created->name);
}

bool operation_closed(const OperationView& view) {
  return view.operation.closed_reason.set();
}

std::vector<std::string> active_counties(const OperationView& view) {
  std::vector<std::string> ids;
  for (const auto& [county_id, county] : view.counties) {
    if (shown_or(view, county.present, false)) {
      ids.push_back(county_id);
    }
  }
  return ids;
}

std::vector<std::string> active_positions(const OperationView& view, const std::string& person_id) {
  std::vector<std::string> positions;
  const PersonEntry* person = find_entry(view.roster, person_id);
  if (person == nullptr) {
    return positions;
  }
  for (const auto& [position, assigned] : person->positions) {
    if (shown_or(view, assigned, false)) {
      positions.push_back(position);
    }
  }
  return positions;
}

std::string facility_name(const OperationView& view, const std::string& facility_id) {
  const FacilityEntry* facility = find_entry(view.facilities, facility_id);
  return facility == nullptr ? std::string{} : entry_name(view, *facility);
}

std::string facility_status(const OperationView& view, const std::string& facility_id) {
  const FacilityEntry* facility = find_entry(view.facilities, facility_id);
  return facility == nullptr ? std::string{} : entry_status(view, *facility);
}

std::int64_t facility_resource(const OperationView& view, const std::string& facility_id,
                               const std::string& resource) {
  const FacilityEntry* facility = find_entry(view.facilities, facility_id);
  if (facility == nullptr) {
    return 0;
  }
  const SumCounter* counter = find_entry(facility->resources, resource);
  return counter == nullptr ? 0 : counter->total();
}

std::int64_t meals_served(const OperationView& view, const std::string& location_id) {
  std::int64_t total = 0;
  for (const auto& [key, counter] : view.meals) {
    if (key.first == location_id) {
      total += counter.total();
    }
  }
  return total;
}

std::int64_t total_meals_served(const OperationView& view) {
  std::int64_t total = 0;
  for (const auto& [key, counter] : view.meals) {
    total += counter.total();
  }
  return total;
}

std::int64_t sheltered_count(const OperationView& view, const std::string& facility_id) {
  const auto* count = find_entry(view.sheltered, facility_id);
  return count == nullptr ? 0 : shown_or(view, *count, std::int64_t{0});
}

bool work_assignment_completed(const OperationView& view, const std::string& assignment_id) {
  const WorkAssignmentEntry* work = find_entry(view.work_assignments, assignment_id);
  return work != nullptr && work->completed_note.set();
}

std::string iap_section_content(const OperationView& view, const std::string& iap_id, const std::string& section) {
  const auto field = view.iap_sections.find({iap_id, section});
  return field == view.iap_sections.end() ? std::string{} : shown_or(view, field->second, std::string{});
}

std::string serialize_view(const OperationView& view) {
  const auto* created = shown(view, view.operation.created);
  std::vector<std::pair<std::string, std::string>> fields;
  fields.emplace_back("operation.id", view.operation_id);
  fields.emplace_back("operation.name", operation_name(view));
  if (created != nullptr) {
    fields.emplace_back("operation.dr_number", created->dr_number);
  }
  fields.emplace_back("operation.region",
                      shown_or(view, view.operation.region, created == nullptr ? std::string{} : created->region));
  fields.emplace_back("operation.director", shown_or(view, view.operation.director, std::string{}));
  fields.emplace_back("operation.closed", operation_closed(view) ? "1" : "0");
  fields.emplace_back("operation.closed_reason", shown_or(view, view.operation.closed_reason, std::string{}));

  for (const auto& [county_id, county] : view.counties) {
    const std::string prefix = "county." + county_id;
    fields.emplace_back(prefix + ".present", shown_or(view, county.present, false) ? "1" : "0");
    fields.emplace_back(prefix + ".name", shown_or(view, county.name, std::string{}));
    fields.emplace_back(prefix + ".state", shown_or(view, county.state, std::string{}));
  }

  for (const auto& [person_id, person] : view.roster) {
    const std::string prefix = "roster." + person_id;
    fields.emplace_back(prefix + ".name", shown_or(view, person.name, std::string{}));
    for (const auto& [position, assigned] : person.positions) {
      fields.emplace_back(prefix + ".position." + position, shown_or(view, assigned, false) ? "1" : "0");
    }
  }

  for (const auto& [facility_id, facility] : view.facilities) {
    const std::string prefix = "facility." + facility_id;
    const auto* facility_created = shown(view, facility.created);
    fields.emplace_back(prefix + ".name", entry_name(view, facility));
    fields.emplace_back(prefix + ".type", facility_created == nullptr ? "" : facility_created->facility_type);
    fields.emplace_back(prefix + ".address", facility_address(view, facility));
    fields.emplace_back(prefix + ".capacity", std::to_string(facility_capacity(view, facility)));
    fields.emplace_back(prefix + ".status", entry_status(view, facility));
    for (const auto& [resource, counter] : facility.resources) {
      fields.emplace_back(prefix + ".resource." + resource, std::to_string(counter.total()));
    }
  }

  for (const auto& [key, counter] : view.meals) {
    fields.emplace_back("meals." + key.first + "." + key.second, std::to_string(counter.total()));
  }
  for (const auto& [facility_id, count] : view.sheltered) {
    fields.emplace_back("sheltered." + facility_id, std::to_string(shown_or(view, count, std::int64_t{0})));
  }

  for (const auto& [assignment_id, work] : view.work_assignments) {
    const std::string prefix = "work." + assignment_id;
    const auto* work_created = shown(view, work.created);
    fields.emplace_back(prefix + ".title", work_title(view, work));
    fields.emplace_back(prefix + ".priority", work_priority(view, work));
    fields.emplace_back(prefix + ".facility", work_created == nullptr ? "" : work_created->facility_id);
    fields.emplace_back(prefix + ".assignee", shown_or(view, work.assignee_id, std::string{}));
    fields.emplace_back(prefix + ".completed", work.completed_note.set() ? "1" : "0");
    fields.emplace_back(prefix + ".note", shown_or(view, work.completed_note, std::string{}));
  }

  for (const auto& [key, section] : view.iap_sections) {
    fields.emplace_back("iap." + key.first + "." + key.second, shown_or(view, section, std::string{}));
  }

  for (const auto& [conflict_id, resolution] : view.resolved_conflicts) {
    const std::string prefix = "conflict." + conflict_id;
    fields.emplace_back(prefix + ".winner", resolution.value.winner_event_id);
    fields.emplace_back(prefix + ".candidates", util::join_csv(resolution.value.candidate_event_ids));
    fields.emplace_back(prefix + ".resolved_by", resolution.value.resolved_by);
  }

  fields.emplace_back("applied_events", std::to_string(view.applied_events));
  return util::canonical_join(std::move(fields));
}

std::string view_digest(const OperationView& view) {
  return util::sha256_hex(serialize_view(view));
}

}  // namespace fieldops
