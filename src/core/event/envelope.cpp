#include "core/event/envelope.hpp"

#include <utility>

#include "core/event/event_kind.hpp"
#include "core/event/payload_codec.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace fieldops {
namespace {

Result missing(std::string_view field) {
  return Result::failure(ErrorCode::Validation, "Envelope field '" + std::string{field} + "' is required.",
                         std::string{field});
}

Result validate_context(const ActorContext& context) {
  if (context.actor_id.empty()) {
    return missing("actor_id");
  }
  if (context.device_id.empty()) {
    return missing("device_id");
  }
  if (context.session_id.empty()) {
    return missing("session_id");
  }
  if (context.operation_id.empty()) {
    return missing("operation_id");
  }
  return Result::success();
}

}  // namespace

std::string content_hash(const Event& event) {
  return util::sha256_hex(util::canonical_join({
      {"id", event.id},
      {"kind", std::string{event_kind_name(event.kind)}},
      {"actor_id", event.actor_id},
      {"timestamp", std::to_string(event.timestamp)},
      {"payload", encode_payload(event.payload)},
  }));
}

Result validate_envelope(const Event& event) {
  if (event.id.empty()) {
    return missing("id");
  }
  const Result context = validate_context({event.actor_id, event.device_id, event.session_id, event.operation_id});
  if (!context.ok) {
    return context;
  }
  if (event.timestamp <= 0) {
    return Result::failure(ErrorCode::Validation, "Envelope timestamp must be positive.", "timestamp");
  }
  if (payload_kind(event.payload) != event.kind) {
    return Result::failure(ErrorCode::Validation, "Payload does not match event kind.", "kind");
  }
  if (event.schema_version == kCurrentSchemaVersion) {
    const Result payload = validate_payload(event.payload);
    if (!payload.ok) {
      return payload;
    }
  }
  if (event.hash != content_hash(event)) {
    return Result::failure(ErrorCode::ChainIntegrity, "Event hash does not match its content: " + event.id, "hash");
  }
  return Result::success();
}

EventFactory::EventFactory(Clock clock) : clock_(std::move(clock)) {}

std::int64_t EventFactory::now() const {
  return clock_ ? clock_() : util::unix_millis_now();
}

Result EventFactory::build(EventKind kind, Payload payload, const ActorContext& context,
                           const std::optional<std::string>& causation_id,
                           const std::optional<std::string>& correlation_id, Event& out) {
  const Result context_check = validate_context(context);
  if (!context_check.ok) {
    return context_check;
  }
  if (payload_kind(payload) != kind) {
    return Result::failure(ErrorCode::Validation,
                           "Payload does not match event kind " + std::string{event_kind_name(kind)} + ".", "kind");
  }
  const Result payload_check = validate_payload(payload);
  if (!payload_check.ok) {
    return payload_check;
  }
  if (causation_id.has_value() && causation_id->empty()) {
    return missing("causation_id");
  }

  Event event;
  event.id = util::random_uuid();
  if (event.id.empty()) {
    return Result::failure(ErrorCode::Storage, "Random source unavailable; cannot mint event id.");
  }

  // A device never moves backwards in time; repeated milliseconds advance the sequence instead.
  Stamp& last = last_stamp_by_device_[context.device_id];
  const std::int64_t wall = now();
  if (last.timestamp != 0 && wall <= last.timestamp) {
    event.timestamp = last.timestamp;
    event.sequence = last.sequence + 1U;
  } else {
    event.timestamp = wall;
    event.sequence = 0;
  }
  last = {event.timestamp, event.sequence};

  event.kind = kind;
  event.schema_version = kCurrentSchemaVersion;
  event.actor_id = context.actor_id;
  event.device_id = context.device_id;
  event.session_id = context.session_id;
  event.operation_id = context.operation_id;
  event.payload = std::move(payload);
  event.causation_id = causation_id;
  event.correlation_id = correlation_id.value_or(std::string{});
  event.sync_status = SyncStatus::Local;
  event.hash = content_hash(event);

  out = std::move(event);
  return Result::success("Event built.", out.id);
}

void EventFactory::observe(const Event& event) {
  Stamp& last = last_stamp_by_device_[event.device_id];
  if (event.timestamp > last.timestamp || (event.timestamp == last.timestamp && event.sequence > last.sequence)) {
    last = {event.timestamp, event.sequence};
  }
}

}  // namespace fieldops
