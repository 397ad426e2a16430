#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "core/model/types.hpp"
#include "core/resolve/ordering.hpp"

namespace fieldops {

struct OperationSection {
  FirstWriteRegister<OperationCreatedPayload> created;
  FieldRegister<std::string> name;
  FieldRegister<std::string> director;
  FieldRegister<std::string> region;
  FirstWriteRegister<std::string> closed_reason;
};

struct CountyEntry {
  FieldRegister<bool> present;
  FieldRegister<std::string> name;
  FieldRegister<std::string> state;
};

struct PersonEntry {
  FieldRegister<std::string> name;
  std::map<std::string, FieldRegister<bool>> positions;
};

struct FacilityEntry {
  FirstWriteRegister<FacilityCreatedPayload> created;
  FieldRegister<std::string> name;
  FieldRegister<std::string> address;
  FieldRegister<std::int64_t> capacity;
  FieldRegister<std::string> status;
  std::map<std::string, SumCounter> resources;
};

struct WorkAssignmentEntry {
  FirstWriteRegister<WorkAssignmentCreatedPayload> created;
  FieldRegister<std::string> title;
  FieldRegister<std::string> assignee_id;
  FieldRegister<std::string> priority;
  FirstWriteRegister<std::string> completed_note;
};

struct ResolvedConflictEntry {
  std::string winner_event_id;
  std::vector<std::string> candidate_event_ids;
  std::string resolved_by;
  LwwKey resolved_key;
};

struct OperationView {
  std::string operation_id;
  OperationSection operation;
  std::map<std::string, CountyEntry> counties;
  std::map<std::string, PersonEntry> roster;
  std::map<std::string, FacilityEntry> facilities;
  std::map<std::pair<std::string, std::string>, SumCounter> meals;
  std::map<std::string, FieldRegister<std::int64_t>> sheltered;
  std::map<std::string, WorkAssignmentEntry> work_assignments;
  std::map<std::pair<std::string, std::string>, FieldRegister<std::string>> iap_sections;
  // A resolution newer than every write of a field shows its winner in that field.
  std::map<std::string, FwwRegister<ResolvedConflictEntry>> resolved_conflicts;
  std::uint64_t applied_events = 0;
};

// Read helpers over the registers.
std::string operation_name(const OperationView& view);
bool operation_closed(const OperationView& view);
std::vector<std::string> active_counties(const OperationView& view);
std::vector<std::string> active_positions(const OperationView& view, const std::string& person_id);
std::string facility_name(const OperationView& view, const std::string& facility_id);
std::string facility_status(const OperationView& view, const std::string& facility_id);
std::int64_t facility_resource(const OperationView& view, const std::string& facility_id, const std::string& resource);
std::int64_t meals_served(const OperationView& view, const std::string& location_id);
std::int64_t total_meals_served(const OperationView& view);
std::int64_t sheltered_count(const OperationView& view, const std::string& facility_id);
bool work_assignment_completed(const OperationView& view, const std::string& assignment_id);
std::string iap_section_content(const OperationView& view, const std::string& iap_id, const std::string& section);

// Canonical text of the view; independent of the order events were applied in.
std::string serialize_view(const OperationView& view);
std::string view_digest(const OperationView& view);

}  // namespace fieldops
