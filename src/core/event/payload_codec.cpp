#include "core/event/payload_codec.hpp"

#include <algorithm>
#include <array>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/util/canonical.hpp"

namespace fieldops {
namespace {

using Fields = std::vector<std::pair<std::string, std::string>>;
using FieldMap = std::unordered_map<std::string, std::string>;

constexpr std::array<std::string_view, 5> kFacilityTypes = {"shelter", "kitchen", "warehouse", "distribution",
                                                             "other"};
constexpr std::array<std::string_view, 4> kFacilityStatuses = {"open", "closed", "standby", "full"};
constexpr std::array<std::string_view, 4> kMealTypes = {"breakfast", "lunch", "dinner", "snack"};
constexpr std::array<std::string_view, 4> kPriorities = {"low", "normal", "high", "critical"};

template <std::size_t N>
bool one_of(const std::array<std::string_view, N>& allowed, std::string_view value) {
  return std::ranges::find(allowed, value) != allowed.end();
}

Result invalid(std::string_view field, std::string_view reason) {
  return Result::failure(ErrorCode::Validation, "Invalid payload field '" + std::string{field} + "': " +
                                                    std::string{reason},
                         std::string{field});
}

void put_optional(Fields& fields, std::string key, const std::optional<std::string>& value) {
  if (value.has_value()) {
    fields.emplace_back(std::move(key), *value);
  }
}

Fields encode_fields(const OperationCreatedPayload& p) {
  return {{"name", p.name}, {"dr_number", p.dr_number}, {"region", p.region}};
}

Fields encode_fields(const OperationUpdatedPayload& p) {
  Fields fields;
  put_optional(fields, "name", p.name);
  put_optional(fields, "director", p.director);
  put_optional(fields, "region", p.region);
  return fields;
}

Fields encode_fields(const OperationClosedPayload& p) {
  return {{"reason", p.reason}};
}

Fields encode_fields(const CountyAddedPayload& p) {
  return {{"county_id", p.county_id}, {"name", p.name}, {"state", p.state}};
}

Fields encode_fields(const CountyRemovedPayload& p) {
  return {{"county_id", p.county_id}};
}

Fields encode_fields(const PersonAssignedPayload& p) {
  return {{"person_id", p.person_id}, {"person_name", p.person_name}, {"position_code", p.position_code}};
}

Fields encode_fields(const PersonUnassignedPayload& p) {
  return {{"person_id", p.person_id}, {"position_code", p.position_code}, {"reason", p.reason}};
}

Fields encode_fields(const FacilityCreatedPayload& p) {
  return {{"facility_id", p.facility_id},
          {"name", p.name},
          {"facility_type", p.facility_type},
          {"address", p.address},
          {"capacity", std::to_string(p.capacity)}};
}

Fields encode_fields(const FacilityUpdatedPayload& p) {
  Fields fields{{"facility_id", p.facility_id}};
  put_optional(fields, "name", p.name);
  put_optional(fields, "address", p.address);
  if (p.capacity.has_value()) {
    fields.emplace_back("capacity", std::to_string(*p.capacity));
  }
  return fields;
}

Fields encode_fields(const FacilityStatusChangedPayload& p) {
  return {{"facility_id", p.facility_id}, {"status", p.status}};
}

Fields encode_fields(const FacilityResourceAddedPayload& p) {
  return {{"facility_id", p.facility_id}, {"resource", p.resource}, {"quantity", std::to_string(p.quantity)}};
}

Fields encode_fields(const MealsServedIncrementPayload& p) {
  return {{"location_id", p.location_id}, {"meal_type", p.meal_type}, {"count", std::to_string(p.count)}};
}

Fields encode_fields(const ShelteredCountSetPayload& p) {
  return {{"facility_id", p.facility_id}, {"count", std::to_string(p.count)}};
}

Fields encode_fields(const WorkAssignmentCreatedPayload& p) {
  return {{"assignment_id", p.assignment_id},
          {"title", p.title},
          {"facility_id", p.facility_id},
          {"priority", p.priority}};
}

Fields encode_fields(const WorkAssignmentUpdatedPayload& p) {
  Fields fields{{"assignment_id", p.assignment_id}};
  put_optional(fields, "title", p.title);
  put_optional(fields, "assignee_id", p.assignee_id);
  put_optional(fields, "priority", p.priority);
  return fields;
}

Fields encode_fields(const WorkAssignmentCompletedPayload& p) {
  return {{"assignment_id", p.assignment_id}, {"note", p.note}};
}

Fields encode_fields(const IapSectionUpdatedPayload& p) {
  return {{"iap_id", p.iap_id}, {"section", p.section}, {"content", p.content}};
}

Fields encode_fields(const ConflictResolvedPayload& p) {
  return {{"conflict_id", p.conflict_id},
          {"winner_event_id", p.winner_event_id},
          {"candidate_event_ids", util::join_csv(p.candidate_event_ids)},
          {"note", p.note}};
}

class FieldReader {
public:
  explicit FieldReader(std::string_view canonical) : fields_(util::parse_canonical_map(canonical)) {}

  [[nodiscard]] std::string text(const std::string& key) const {
    const auto it = fields_.find(key);
    return it == fields_.end() ? std::string{} : it->second;
  }

  [[nodiscard]] std::optional<std::string> optional_text(const std::string& key) const {
    const auto it = fields_.find(key);
    if (it == fields_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  bool integer(const std::string& key, std::int64_t& out) {
    const auto it = fields_.find(key);
    if (it == fields_.end() || !util::parse_int64(it->second, out)) {
      bad_field_ = key;
      return false;
    }
    return true;
  }

  bool optional_integer(const std::string& key, std::optional<std::int64_t>& out) {
    const auto it = fields_.find(key);
    if (it == fields_.end()) {
      out.reset();
      return true;
    }
    std::int64_t value = 0;
    if (!util::parse_int64(it->second, value)) {
      bad_field_ = key;
      return false;
    }
    out = value;
    return true;
  }

  [[nodiscard]] const std::string& bad_field() const { return bad_field_; }

private:
  FieldMap fields_;
  std::string bad_field_;
};

Result validate_fields(const OperationCreatedPayload& p) {
  if (p.name.empty()) {
    return invalid("name", "required");
  }
  if (p.dr_number.empty()) {
    return invalid("dr_number", "required");
  }
  return Result::success();
}

Result validate_fields(const OperationUpdatedPayload& p) {
  if (!p.name && !p.director && !p.region) {
    return invalid("name", "update carries no fields");
  }
  if (p.name && p.name->empty()) {
    return invalid("name", "must not be empty");
  }
  return Result::success();
}

Result validate_fields(const OperationClosedPayload&) {
  return Result::success();
}

Result validate_fields(const CountyAddedPayload& p) {
  if (p.county_id.empty()) {
    return invalid("county_id", "required");
  }
  if (p.name.empty()) {
    return invalid("name", "required");
  }
  return Result::success();
}

Result validate_fields(const CountyRemovedPayload& p) {
  if (p.county_id.empty()) {
    return invalid("county_id", "required");
  }
  return Result::success();
}

Result validate_fields(const PersonAssignedPayload& p) {
  if (p.person_id.empty()) {
    return invalid("person_id", "required");
  }
  if (p.position_code.empty()) {
    return invalid("position_code", "required");
  }
  return Result::success();
}

Result validate_fields(const PersonUnassignedPayload& p) {
  if (p.person_id.empty()) {
    return invalid("person_id", "required");
  }
  if (p.position_code.empty()) {
    return invalid("position_code", "required");
  }
  return Result::success();
}

Result validate_fields(const FacilityCreatedPayload& p) {
  if (p.facility_id.empty()) {
    return invalid("facility_id", "required");
  }
  if (p.name.empty()) {
    return invalid("name", "required");
  }
  if (!one_of(kFacilityTypes, p.facility_type)) {
    return invalid("facility_type", "unknown facility type");
  }
  if (p.capacity < 0) {
    return invalid("capacity", "must not be negative");
  }
  return Result::success();
}

Result validate_fields(const FacilityUpdatedPayload& p) {
  if (p.facility_id.empty()) {
    return invalid("facility_id", "required");
  }
  if (!p.name && !p.address && !p.capacity) {
    return invalid("name", "update carries no fields");
  }
  if (p.name && p.name->empty()) {
    return invalid("name", "must not be empty");
  }
  if (p.capacity && *p.capacity < 0) {
    return invalid("capacity", "must not be negative");
  }
  return Result::success();
}

Result validate_fields(const FacilityStatusChangedPayload& p) {
  if (p.facility_id.empty()) {
    return invalid("facility_id", "required");
  }
  if (!one_of(kFacilityStatuses, p.status)) {
    return invalid("status", "unknown facility status");
  }
  return Result::success();
}

Result validate_fields(const FacilityResourceAddedPayload& p) {
  if (p.facility_id.empty()) {
    return invalid("facility_id", "required");
  }
  if (p.resource.empty()) {
    return invalid("resource", "required");
  }
  if (p.quantity <= 0) {
    return invalid("quantity", "must be positive");
  }
  return Result::success();
}

Result validate_fields(const MealsServedIncrementPayload& p) {
  if (p.location_id.empty()) {
    return invalid("location_id", "required");
  }
  if (!one_of(kMealTypes, p.meal_type)) {
    return invalid("meal_type", "unknown meal type");
  }
  if (p.count <= 0) {
    return invalid("count", "must be positive");
  }
  return Result::success();
}

Result validate_fields(const ShelteredCountSetPayload& p) {
  if (p.facility_id.empty()) {
    return invalid("facility_id", "required");
  }
  if (p.count < 0) {
    return invalid("count", "must not be negative");
  }
  return Result::success();
}

Result validate_fields(const WorkAssignmentCreatedPayload& p) {
  if (p.assignment_id.empty()) {
    return invalid("assignment_id", "required");
  }
  if (p.title.empty()) {
    return invalid("title", "required");
  }
  if (!one_of(kPriorities, p.priority)) {
    return invalid("priority", "unknown priority");
  }
  return Result::success();
}

Result validate_fields(const WorkAssignmentUpdatedPayload& p) {
  if (p.assignment_id.empty()) {
    return invalid("assignment_id", "required");
  }
  if (!p.title && !p.assignee_id && !p.priority) {
    return invalid("title", "update carries no fields");
  }
  if (p.title && p.title->empty()) {
    return invalid("title", "must not be empty");
  }
  if (p.priority && !one_of(kPriorities, *p.priority)) {
    return invalid("priority", "unknown priority");
  }
  return Result::success();
}

Result validate_fields(const WorkAssignmentCompletedPayload& p) {
  if (p.assignment_id.empty()) {
    return invalid("assignment_id", "required");
  }
  return Result::success();
}

Result validate_fields(const IapSectionUpdatedPayload& p) {
  if (p.iap_id.empty()) {
    return invalid("iap_id", "required");
  }
  if (p.section.empty()) {
    return invalid("section", "required");
  }
  return Result::success();
}

Result validate_fields(const ConflictResolvedPayload& p) {
  if (p.conflict_id.empty()) {
    return invalid("conflict_id", "required");
  }
  if (p.winner_event_id.empty()) {
    return invalid("winner_event_id", "required");
  }
  if (p.candidate_event_ids.size() < 2U) {
    return invalid("candidate_event_ids", "a conflict names at least two events");
  }
  if (std::ranges::find(p.candidate_event_ids, p.winner_event_id) == p.candidate_event_ids.end()) {
    return invalid("winner_event_id", "winner is not one of the candidates");
  }
  return Result::success();
}

Result decode_failure(const std::string& field) {
  return Result::failure(ErrorCode::Validation, "Payload field '" + field + "' could not be decoded.", field);
}

}  // namespace

std::string encode_payload(const Payload& payload) {
  return std::visit([](const auto& p) { return util::canonical_join(encode_fields(p)); }, payload);
}

Result validate_payload(const Payload& payload) {
  return std::visit([](const auto& p) { return validate_fields(p); }, payload);
}

Result decode_payload(EventKind kind, std::string_view canonical, Payload& out) {
  FieldReader in(canonical);

  switch (kind) {
    case EventKind::OperationCreated:
      out = OperationCreatedPayload{.name = in.text("name"), .dr_number = in.text("dr_number"),
                                    .region = in.text("region")};
      break;
    case EventKind::OperationUpdated:
      out = OperationUpdatedPayload{.name = in.optional_text("name"), .director = in.optional_text("director"),
                                    .region = in.optional_text("region")};
      break;
    case EventKind::OperationClosed:
      out = OperationClosedPayload{.reason = in.text("reason")};
      break;
    case EventKind::CountyAdded:
      out = CountyAddedPayload{.county_id = in.text("county_id"), .name = in.text("name"),
                               .state = in.text("state")};
      break;
    case EventKind::CountyRemoved:
      out = CountyRemovedPayload{.county_id = in.text("county_id")};
      break;
    case EventKind::PersonAssigned:
      out = PersonAssignedPayload{.person_id = in.text("person_id"), .person_name = in.text("person_name"),
                                  .position_code = in.text("position_code")};
      break;
    case EventKind::PersonUnassigned:
      out = PersonUnassignedPayload{.person_id = in.text("person_id"), .position_code = in.text("position_code"),
                                    .reason = in.text("reason")};
      break;
    case EventKind::FacilityCreated: {
      FacilityCreatedPayload p{.facility_id = in.text("facility_id"), .name = in.text("name"),
                               .facility_type = in.text("facility_type"), .address = in.text("address")};
      if (!in.integer("capacity", p.capacity)) {
        return decode_failure(in.bad_field());
      }
      out = std::move(p);
      break;
    }
    case EventKind::FacilityUpdated: {
      FacilityUpdatedPayload p{.facility_id = in.text("facility_id"), .name = in.optional_text("name"),
                               .address = in.optional_text("address")};
      if (!in.optional_integer("capacity", p.capacity)) {
        return decode_failure(in.bad_field());
      }
      out = std::move(p);
      break;
    }
    case EventKind::FacilityStatusChanged:
      out = FacilityStatusChangedPayload{.facility_id = in.text("facility_id"), .status = in.text("status")};
      break;
    case EventKind::FacilityResourceAdded: {
      FacilityResourceAddedPayload p{.facility_id = in.text("facility_id"), .resource = in.text("resource")};
      if (!in.integer("quantity", p.quantity)) {
        return decode_failure(in.bad_field());
      }
      out = std::move(p);
      break;
    }
    case EventKind::MealsServedIncrement: {
      MealsServedIncrementPayload p{.location_id = in.text("location_id"), .meal_type = in.text("meal_type")};
      if (!in.integer("count", p.count)) {
        return decode_failure(in.bad_field());
      }
      out = std::move(p);
      break;
    }
    case EventKind::ShelteredCountSet: {
      ShelteredCountSetPayload p{.facility_id = in.text("facility_id")};
      if (!in.integer("count", p.count)) {
        return decode_failure(in.bad_field());
      }
      out = std::move(p);
      break;
    }
    case EventKind::WorkAssignmentCreated:
      out = WorkAssignmentCreatedPayload{.assignment_id = in.text("assignment_id"), .title = in.text("title"),
                                         .facility_id = in.text("facility_id"), .priority = in.text("priority")};
      break;
    case EventKind::WorkAssignmentUpdated:
      out = WorkAssignmentUpdatedPayload{.assignment_id = in.text("assignment_id"),
                                         .title = in.optional_text("title"),
                                         .assignee_id = in.optional_text("assignee_id"),
                                         .priority = in.optional_text("priority")};
      break;
    case EventKind::WorkAssignmentCompleted:
      out = WorkAssignmentCompletedPayload{.assignment_id = in.text("assignment_id"), .note = in.text("note")};
      break;
    case EventKind::IapSectionUpdated:
      out = IapSectionUpdatedPayload{.iap_id = in.text("iap_id"), .section = in.text("section"),
                                     .content = in.text("content")};
      break;
    case EventKind::ConflictResolved:
      out = ConflictResolvedPayload{.conflict_id = in.text("conflict_id"),
                                    .winner_event_id = in.text("winner_event_id"),
                                    .candidate_event_ids = util::split_csv(in.text("candidate_event_ids")),
                                    .note = in.text("note")};
      break;
  }

  return Result::success();
}

}  // namespace fieldops
