#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/model/types.hpp"
#include "core/resolve/conflict_policy.hpp"
#include "core/resolve/conflict_queue.hpp"

namespace fieldops {

struct ResolutionOutcome {
  ConflictStrategy strategy = ConflictStrategy::Lww;
  std::string entity_key;
  std::string winner_id;
  std::vector<std::string> loser_ids;
  // Events to append: un-assignments, or a conflict.resolved record when the winner is not the
  // write the view shows by default.
  std::vector<Event> compensations;
  std::optional<Payload> merged_payload;
  std::string manual_conflict_id;
};

using DomainMergeFunction = std::function<Result(const std::vector<Event>&, ResolutionOutcome&)>;

// Keeps the first assignment of a person and un-assigns every concurrent loser on another position.
// Compensating events are derived from (winner, loser) only, so every replica mints identical ones.
Result merge_single_active_position(const std::vector<Event>& events, ResolutionOutcome& out);

class ConflictResolver {
public:
  ConflictResolver(ConflictPolicyTable policies, ConflictQueue& queue);

  void register_domain_function(std::string name, DomainMergeFunction function);
  Result validate_configuration() const;

  // `events` are concurrent and share one entity key.
  Result resolve(const std::vector<Event>& events, ResolutionOutcome& out);

  [[nodiscard]] const ConflictPolicyTable& policies() const { return policies_; }

private:
  Result resolve_crdt(const std::vector<Event>& events, ResolutionOutcome& out) const;
  Result queue_manual(const std::vector<Event>& events, ResolutionOutcome& out);

  ConflictPolicyTable policies_;
  ConflictQueue& queue_;
  std::map<std::string, DomainMergeFunction, std::less<>> domain_functions_;
};

}  // namespace fieldops
