#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fieldops {

struct OperationCreatedPayload {
  std::string name;
  std::string dr_number;
  std::string region;
};

struct OperationUpdatedPayload {
  std::optional<std::string> name;
  std::optional<std::string> director;
  std::optional<std::string> region;
};

struct OperationClosedPayload {
  std::string reason;
};

struct CountyAddedPayload {
  std::string county_id;
  std::string name;
  std::string state;
};

struct CountyRemovedPayload {
  std::string county_id;
};

struct PersonAssignedPayload {
  std::string person_id;
  std::string person_name;
  std::string position_code;
};

struct PersonUnassignedPayload {
  std::string person_id;
  std::string position_code;
  std::string reason;
};

struct FacilityCreatedPayload {
  std::string facility_id;
  std::string name;
  std::string facility_type;
  std::string address;
  std::int64_t capacity = 0;
};

struct FacilityUpdatedPayload {
  std::string facility_id;
  std::optional<std::string> name;
  std::optional<std::string> address;
  std::optional<std::int64_t> capacity;
};

struct FacilityStatusChangedPayload {
  std::string facility_id;
  std::string status;
};

struct FacilityResourceAddedPayload {
  std::string facility_id;
  std::string resource;
  std::int64_t quantity = 0;
};

struct MealsServedIncrementPayload {
  std::string location_id;
  std::string meal_type;
  std::int64_t count = 0;
};

struct ShelteredCountSetPayload {
  std::string facility_id;
  std::int64_t count = 0;
};

struct WorkAssignmentCreatedPayload {
  std::string assignment_id;
  std::string title;
  std::string facility_id;
  std::string priority;
};

struct WorkAssignmentUpdatedPayload {
  std::string assignment_id;
  std::optional<std::string> title;
  std::optional<std::string> assignee_id;
  std::optional<std::string> priority;
};

struct WorkAssignmentCompletedPayload {
  std::string assignment_id;
  std::string note;
};

struct IapSectionUpdatedPayload {
  std::string iap_id;
  std::string section;
  std::string content;
};

struct ConflictResolvedPayload {
  std::string conflict_id;
  std::string winner_event_id;
  std::vector<std::string> candidate_event_ids;
  std::string note;
};

// Alternatives are declared in EventKind order.
using Payload = std::variant<OperationCreatedPayload, OperationUpdatedPayload, OperationClosedPayload,
                             CountyAddedPayload, CountyRemovedPayload, PersonAssignedPayload,
                             PersonUnassignedPayload, FacilityCreatedPayload, FacilityUpdatedPayload,
                             FacilityStatusChangedPayload, FacilityResourceAddedPayload,
                             MealsServedIncrementPayload, ShelteredCountSetPayload,
                             WorkAssignmentCreatedPayload, WorkAssignmentUpdatedPayload,
                             WorkAssignmentCompletedPayload, IapSectionUpdatedPayload,
                             ConflictResolvedPayload>;

}  // namespace fieldops
