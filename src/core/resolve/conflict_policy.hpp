#pragma once

#include <map>
#include <set>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace fieldops {

inline constexpr std::string_view kSingleActivePosition = "single_active_position";

struct PolicyEntry {
  ConflictStrategy strategy = ConflictStrategy::Lww;
  std::string domain_function;
};

// Accepts "lww", "fww", "crdt", "manual" or "domain:<function>".
Result parse_policy_spec(std::string_view spec, PolicyEntry& out);
std::string format_policy_spec(const PolicyEntry& entry);

// Kinds that have a commutative combinator and may therefore use the CRDT strategy.
bool kind_supports_crdt(EventKind kind);

// Counter kinds are only ever summed; no other strategy can be honored by the view.
bool kind_requires_crdt(EventKind kind);

class ConflictPolicyTable {
public:
  static ConflictPolicyTable defaults();

  Result set(EventKind kind, PolicyEntry entry);
  Result apply_override(std::string_view kind_name, std::string_view spec);
  void erase(EventKind kind);

  Result lookup(EventKind kind, PolicyEntry& out) const;

  // Every kind has exactly one policy and every domain function it names is registered.
  Result validate(const std::set<std::string, std::less<>>& domain_functions) const;

  [[nodiscard]] const std::map<EventKind, PolicyEntry>& entries() const { return entries_; }

private:
  std::map<EventKind, PolicyEntry> entries_;
};

}  // namespace fieldops
