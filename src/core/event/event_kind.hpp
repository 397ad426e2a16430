#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace fieldops {

std::string_view event_kind_name(EventKind kind);
std::optional<EventKind> event_kind_from_name(std::string_view name);
const std::vector<EventKind>& all_event_kinds();

EventKind payload_kind(const Payload& payload);

// View key a kind contributes to: operation, geography, roster, facilities, metrics,
// work_assignments, iap or conflicts.
std::string_view view_key_for_kind(EventKind kind);
const std::vector<std::string_view>& all_view_keys();

// Kinds whose view field keeps its first write when no resolution says otherwise.
bool first_write_kind(EventKind kind);

// Logical target of an event. Two events conflict only when their entity keys match.
std::string entity_key(const Event& event);

std::string_view sync_status_name(SyncStatus status);
std::optional<SyncStatus> sync_status_from_name(std::string_view name);

std::string_view strategy_name(ConflictStrategy strategy);

}  // namespace fieldops
