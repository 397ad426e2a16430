#include "core/resolve/conflict_resolver.hpp"

#include <algorithm>
#include <ranges>
#include <set>
#include <unordered_set>
#include <utility>

#include "core/event/envelope.hpp"
#include "core/event/event_kind.hpp"
#include "core/resolve/ordering.hpp"
#include "core/util/hash.hpp"
#include "core/util/logging.hpp"

namespace fieldops {
namespace {

std::vector<Event> distinct_by_id(const std::vector<Event>& events) {
  std::vector<Event> out;
  std::unordered_set<std::string> seen;
  for (const auto& event : events) {
    if (seen.insert(event.id).second) {
      out.push_back(event);
    }
  }
  return out;
}

const Event& lww_winner(const std::vector<Event>& events) {
  return *std::ranges::max_element(events, {}, [](const Event& event) { return lww_key(event); });
}

const Event& fww_winner(const std::vector<Event>& events) {
  return *std::ranges::min_element(events, {}, [](const Event& event) { return fww_key(event); });
}

void split_winner(const std::vector<Event>& events, const Event& winner, ResolutionOutcome& out) {
  out.winner_id = winner.id;
  out.loser_ids.clear();
  for (const auto& event : events) {
    if (event.id != winner.id) {
      out.loser_ids.push_back(event.id);
    }
  }
  std::ranges::sort(out.loser_ids);
}

Event make_unassignment(const Event& winner, const Event& loser) {
  const auto& lost = std::get<PersonAssignedPayload>(loser.payload);

  Event compensation;
  compensation.id = util::uuid_from_seed("compensation|" + winner.id + "|" + loser.id);
  compensation.kind = EventKind::PersonUnassigned;
  compensation.schema_version = kCurrentSchemaVersion;
  compensation.actor_id = std::string{kResolverActorId};
  compensation.device_id = std::string{kResolverSessionId} + "/" + compensation.id;
  compensation.session_id = std::string{kResolverSessionId};
  compensation.operation_id = loser.operation_id;
  compensation.timestamp = std::max(winner.timestamp, loser.timestamp) + 1;
  compensation.sequence = 0;
  compensation.payload = PersonUnassignedPayload{
      .person_id = lost.person_id, .position_code = lost.position_code, .reason = "conflict-resolution"};
  compensation.causation_id = loser.id;
  compensation.correlation_id = loser.correlation_id.empty() ? loser.id : loser.correlation_id;
  compensation.sync_status = SyncStatus::Local;
  compensation.hash = content_hash(compensation);
  return compensation;
}

// Records a winner the view would not pick on its own, so every replica shows the same write.
Event make_resolution_record(const std::vector<Event>& events, const Event& winner, const ResolutionOutcome& outcome) {
  std::vector<std::string> candidate_ids;
  std::int64_t latest = winner.timestamp;
  for (const auto& event : events) {
    candidate_ids.push_back(event.id);
    latest = std::max(latest, event.timestamp);
  }
  std::ranges::sort(candidate_ids);
  const std::string conflict_id = conflict_id_for(outcome.entity_key, candidate_ids);

  Event record;
  record.id = util::uuid_from_seed("resolution|" + conflict_id + "|" + winner.id);
  record.kind = EventKind::ConflictResolved;
  record.schema_version = kCurrentSchemaVersion;
  record.actor_id = std::string{kResolverActorId};
  record.device_id = std::string{kResolverSessionId} + "/" + record.id;
  record.session_id = std::string{kResolverSessionId};
  record.operation_id = winner.operation_id;
  record.timestamp = latest + 1;
  record.sequence = 0;
  record.payload = ConflictResolvedPayload{.conflict_id = conflict_id,
                                           .winner_event_id = winner.id,
                                           .candidate_event_ids = std::move(candidate_ids),
                                           .note = std::string{strategy_name(outcome.strategy)}};
  record.causation_id = winner.id;
  record.correlation_id = winner.correlation_id.empty() ? winner.id : winner.correlation_id;
  record.sync_status = SyncStatus::Local;
  record.hash = content_hash(record);
  return record;
}

const Event& view_pick(const std::vector<Event>& events) {
  return first_write_kind(events.front().kind) ? fww_winner(events) : lww_winner(events);
}

}  // namespace

Result merge_single_active_position(const std::vector<Event>& events, ResolutionOutcome& out) {
  for (const auto& event : events) {
    if (event.kind != EventKind::PersonAssigned) {
      return Result::failure(ErrorCode::Configuration,
                             "single_active_position only merges roster.person_assigned events.", event.id);
    }
  }

  const Event& winner = fww_winner(events);
  split_winner(events, winner, out);

  const auto& kept = std::get<PersonAssignedPayload>(winner.payload);
  out.compensations.clear();
  for (const auto& loser_id : out.loser_ids) {
    const auto loser = std::ranges::find(events, loser_id, &Event::id);
    const auto& lost = std::get<PersonAssignedPayload>(loser->payload);
    if (lost.position_code == kept.position_code) {
      continue;
    }
    out.compensations.push_back(make_unassignment(winner, *loser));
  }
  out.merged_payload = winner.payload;
  return Result::success("Kept the first assignment.", winner.id);
}

ConflictResolver::ConflictResolver(ConflictPolicyTable policies, ConflictQueue& queue)
    : policies_(std::move(policies)), queue_(queue) {
  register_domain_function(std::string{kSingleActivePosition}, merge_single_active_position);
}

void ConflictResolver::register_domain_function(std::string name, DomainMergeFunction function) {
  domain_functions_[std::move(name)] = std::move(function);
}

Result ConflictResolver::validate_configuration() const {
  std::set<std::string, std::less<>> names;
  for (const auto& [name, function] : domain_functions_) {
    names.insert(name);
  }
  return policies_.validate(names);
}

Result ConflictResolver::resolve(const std::vector<Event>& events, ResolutionOutcome& out) {
  out = ResolutionOutcome{};
  const std::vector<Event> candidates = distinct_by_id(events);
  if (candidates.empty()) {
    return Result::failure(ErrorCode::Validation, "No events to resolve.", "events");
  }

  out.entity_key = entity_key(candidates.front());
  PolicyEntry policy;
  const Result found = policies_.lookup(candidates.front().kind, policy);
  if (!found.ok) {
    return found;
  }
  out.strategy = policy.strategy;

  for (const auto& event : candidates) {
    if (entity_key(event) != out.entity_key) {
      return Result::failure(ErrorCode::Validation, "Events target different entities.", "entity_key");
    }
    PolicyEntry other;
    const Result other_found = policies_.lookup(event.kind, other);
    if (!other_found.ok) {
      return other_found;
    }
    if (other.strategy != policy.strategy || other.domain_function != policy.domain_function) {
      return Result::failure(ErrorCode::Configuration, "Events on one entity are governed by different policies.",
                             out.entity_key);
    }
  }

  if (candidates.size() == 1U) {
    out.winner_id = candidates.front().id;
    out.merged_payload = candidates.front().payload;
    return Result::success("Nothing to resolve.", out.winner_id);
  }

  Result resolved;
  switch (policy.strategy) {
    case ConflictStrategy::Lww:
    case ConflictStrategy::Fww: {
      const Event& winner = policy.strategy == ConflictStrategy::Lww ? lww_winner(candidates) : fww_winner(candidates);
      split_winner(candidates, winner, out);
      out.merged_payload = winner.payload;
      if (view_pick(candidates).id != winner.id) {
        out.compensations.push_back(make_resolution_record(candidates, winner, out));
      }
      resolved = Result::success(
          policy.strategy == ConflictStrategy::Lww ? "Last writer wins." : "First writer wins.", winner.id);
      break;
    }
    case ConflictStrategy::Crdt:
      resolved = resolve_crdt(candidates, out);
      break;
    case ConflictStrategy::Domain: {
      const auto function = domain_functions_.find(policy.domain_function);
      if (function == domain_functions_.end()) {
        return Result::failure(ErrorCode::Configuration,
                               "Unregistered merge function: " + policy.domain_function, out.entity_key);
      }
      resolved = function->second(candidates, out);
      break;
    }
    case ConflictStrategy::Manual:
      return queue_manual(candidates, out);
  }

  if (resolved.ok) {
    FIELDOPS_LOG_INFO("Conflict resolved automatically",
                      {util::StringField("entity", out.entity_key),
                       util::StringField("strategy", strategy_name(out.strategy)),
                       util::StringField("winner", out.winner_id),
                       util::IntField("losers", static_cast<std::int64_t>(out.loser_ids.size())),
                       util::IntField("compensations", static_cast<std::int64_t>(out.compensations.size()))});
  }
  return resolved;
}

Result ConflictResolver::resolve_crdt(const std::vector<Event>& events, ResolutionOutcome& out) const {
  const EventKind kind = events.front().kind;

  if (kind == EventKind::MealsServedIncrement) {
    auto merged = std::get<MealsServedIncrementPayload>(events.front().payload);
    merged.count = 0;
    for (const auto& event : events) {
      merged.count += std::get<MealsServedIncrementPayload>(event.payload).count;
    }
    out.merged_payload = merged;
    return Result::success("Summed meal increments.", std::to_string(merged.count));
  }

  if (kind == EventKind::FacilityResourceAdded) {
    auto merged = std::get<FacilityResourceAddedPayload>(events.front().payload);
    merged.quantity = 0;
    for (const auto& event : events) {
      merged.quantity += std::get<FacilityResourceAddedPayload>(event.payload).quantity;
    }
    out.merged_payload = merged;
    return Result::success("Summed resource additions.", std::to_string(merged.quantity));
  }

  if (kind == EventKind::CountyAdded || kind == EventKind::CountyRemoved) {
    // Last-writer-wins element set: the greatest add or remove decides membership.
    const Event& winner = lww_winner(events);
    split_winner(events, winner, out);
    out.merged_payload = winner.payload;
    return Result::success(winner.kind == EventKind::CountyAdded ? "County present." : "County removed.",
                           winner.id);
  }

  return Result::failure(ErrorCode::Configuration,
                         "Kind " + std::string{event_kind_name(kind)} + " has no CRDT combinator.", out.entity_key);
}

Result ConflictResolver::queue_manual(const std::vector<Event>& events, ResolutionOutcome& out) {
  ManualConflict conflict;
  conflict.operation_id = events.front().operation_id;
  conflict.kind = events.front().kind;
  conflict.entity_key = out.entity_key;
  for (const auto& event : events) {
    conflict.candidate_event_ids.push_back(event.id);
    conflict.detected_at = std::max(conflict.detected_at, event.timestamp);
  }
  std::ranges::sort(conflict.candidate_event_ids);

  std::string conflict_id;
  const Result queued = queue_.enqueue(std::move(conflict), conflict_id);
  if (!queued.ok) {
    FIELDOPS_LOG_ERROR("Manual conflict could not be queued",
                       {util::StringField("entity", out.entity_key), util::StringField("reason", queued.message)});
    return queued;
  }

  out.manual_conflict_id = conflict_id;
  FIELDOPS_LOG_WARN("Manual conflict awaiting decision",
                    {util::StringField("conflict", conflict_id), util::StringField("entity", out.entity_key),
                     util::IntField("candidates", static_cast<std::int64_t>(events.size()))});
  return Result::success("Conflict queued for manual resolution.", conflict_id);
}

}  // namespace fieldops
