#include <cassert>
#include <filesystem>
#include <functional>
#include <future>
#include <iostream>
#include <string>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/event/envelope.hpp"
#include "core/event/event_kind.hpp"
#include "core/projection/views.hpp"
#include "core/service/field_service.hpp"
#include "core/sync/remote_authority.hpp"
#include "core/sync/sync_manager.hpp"

namespace {

constexpr const char* kOperation = "DR-4242";

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "fieldops-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

struct ManualClock {
  std::int64_t now = 1'700'000'000'000;

  fieldops::Clock fn() {
    return [this]() { return now; };
  }
};

// Forwards to a shared authority and lets a test reach into each pulled batch.
class RelayAuthority final : public fieldops::IRemoteAuthority {
public:
  explicit RelayAuthority(fieldops::IRemoteAuthority& inner) : inner_(inner) {}

  fieldops::Result push(const fieldops::PushBatch& batch, fieldops::PushAck& out) override {
    return inner_.push(batch, out);
  }

  fieldops::Result pull(const fieldops::PullRequest& request, fieldops::PullBatch& out) override {
    const fieldops::Result pulled = inner_.pull(request, out);
    if (pulled.ok && after_pull) {
      auto hook = std::move(after_pull);
      after_pull = nullptr;
      hook(out);
    }
    return pulled;
  }

  std::function<void(fieldops::PullBatch&)> after_pull;

private:
  fieldops::IRemoteAuthority& inner_;
};

fieldops::EngineConfig node_config(const std::string& device_id, const std::string& data_dir = {}) {
  return {
      .data_dir = data_dir,
      .device_id = device_id,
      .sync = {.debounce_ms = 0, .batch_size = 100, .max_attempts = 5, .backoff_base_ms = 1000,
               .backoff_cap_ms = 60000},
      .log_level = "warn",
  };
}

fieldops::ActorContext context_for(const std::string& device_id, const std::string& actor_id) {
  return {.actor_id = actor_id, .device_id = device_id, .session_id = "shift-1", .operation_id = kOperation};
}

std::string submit_ok(fieldops::FieldService& node, fieldops::Payload payload, const fieldops::ActorContext& context,
                      const std::optional<std::string>& causation_id = std::nullopt) {
  const fieldops::EventKind kind = fieldops::payload_kind(payload);
  const fieldops::Result submitted = node.submit(kind, std::move(payload), context, causation_id);
  assert(submitted.ok);
  return submitted.data;
}

// Builds an event as another device would, for pushing straight to the authority.
fieldops::Event build_remote(fieldops::EventFactory& factory, fieldops::Payload payload,
                             const fieldops::ActorContext& context,
                             const std::optional<std::string>& causation_id = std::nullopt) {
  const fieldops::EventKind kind = fieldops::payload_kind(payload);
  fieldops::Event event;
  const fieldops::Result built = factory.build(kind, std::move(payload), context, causation_id, std::nullopt, event);
  assert(built.ok);
  return event;
}

void push_direct(fieldops::InMemoryRemoteAuthority& authority, const fieldops::Event& event) {
  fieldops::PushAck ack;
  const fieldops::Result pushed = authority.push(
      fieldops::PushBatch{.operation_id = event.operation_id, .events = {event}, .tail_digest = event.hash}, ack);
  assert(pushed.ok);
  assert(ack.accepted_ids.size() == 1U);
}

fieldops::SyncCycleReport sync_ok(fieldops::FieldService& node) {
  fieldops::SyncCycleReport report;
  const fieldops::Result synced = node.sync_now(report);
  assert(synced.ok);
  assert(!report.cancelled);
  return report;
}

fieldops::MealsServedIncrementPayload lunch(std::int64_t count) {
  return {.location_id = "shelter-1", .meal_type = "lunch", .count = count};
}

void test_backoff_schedule() {
  const fieldops::SyncSettings settings{.backoff_base_ms = 1000, .backoff_cap_ms = 60000};
  assert(fieldops::backoff_delay_ms(settings, 0) == 0);
  assert(fieldops::backoff_delay_ms(settings, 1) == 1000);
  assert(fieldops::backoff_delay_ms(settings, 2) == 2000);
  assert(fieldops::backoff_delay_ms(settings, 4) == 8000);
  assert(fieldops::backoff_delay_ms(settings, 7) == 60000);
  assert(fieldops::backoff_delay_ms(settings, 40) == 60000);

  const fieldops::SyncSettings immediate{.backoff_base_ms = 0, .backoff_cap_ms = 0};
  assert(fieldops::backoff_delay_ms(immediate, 3) == 0);
}

void test_shelter_rename_converges() {
  ManualClock clock;
  fieldops::InMemoryRemoteAuthority authority;
  fieldops::CoreApi field_a;
  fieldops::CoreApi field_b;
  assert(field_a.init(node_config("field-a"), authority, clock.fn()).ok);
  assert(field_b.init(node_config("field-b"), authority, clock.fn()).ok);
  assert(field_b.switch_operation(kOperation).ok);
  assert(field_b.status().active_operation == kOperation);

  const fieldops::ActorContext lead = context_for("field-a", "user:lead");
  const fieldops::ActorContext manager = context_for("field-b", "user:manager");

  const fieldops::Result created = field_a.submit(
      fieldops::FacilityCreatedPayload{
          .facility_id = "shelter-1", .name = "Shelter 1", .facility_type = "shelter", .capacity = 120},
      lead);
  assert(created.ok);

  fieldops::SyncCycleReport report;
  assert(field_a.sync_now(report).ok);
  assert(report.pushed == 1U);
  assert(report.acknowledged == 1U);
  assert(field_b.sync_now(report).ok);
  assert(report.merged == 1U);
  assert(fieldops::facility_name(*field_b.snapshot(kOperation), "shelter-1") == "Shelter 1");

  clock.now += 60'000;
  const fieldops::Result renamed = field_b.submit(
      fieldops::FacilityUpdatedPayload{.facility_id = "shelter-1", .name = "Shelter 1 Annex"}, manager, created.data);
  assert(renamed.ok);
  assert(field_b.sync_now(report).ok);
  assert(report.acknowledged == 1U);

  assert(field_a.sync_now(report).ok);
  assert(report.pulled == 2U);
  assert(report.merged == 1U);
  assert(report.conflicts == 0U);

  for (const fieldops::CoreApi* node : {&field_a, &field_b}) {
    const auto view = node->snapshot(kOperation);
    assert(fieldops::facility_name(*view, "shelter-1") == "Shelter 1 Annex");
    assert(node->verify_chain(kOperation).intact);
    assert(node->status().sync.stuck == 0U);
  }
  assert(fieldops::view_digest(*field_a.snapshot(kOperation)) ==
         fieldops::view_digest(*field_b.snapshot(kOperation)));

  const auto pulled = field_a.service().find_event(renamed.data);
  assert(pulled.has_value());
  assert(pulled->sync_status == fieldops::SyncStatus::Synced);
  assert(pulled->causation_id == created.data);
  assert(field_a.service().sync_cursor(kOperation).last_position == 2U);
  assert(authority.event_count(kOperation) == 2U);
  assert(authority.verify_chain(kOperation).intact);
}

void test_concurrent_meal_counts_sum() {
  ManualClock clock;
  fieldops::InMemoryRemoteAuthority authority;
  fieldops::FieldService field_a;
  fieldops::FieldService field_b;
  assert(field_a.init(node_config("field-a"), authority, clock.fn()).ok);
  assert(field_b.init(node_config("field-b"), authority, clock.fn()).ok);

  submit_ok(field_b, lunch(50), context_for("field-b", "user:feeder"));
  submit_ok(field_a, lunch(30), context_for("field-a", "user:lead"));

  fieldops::SyncCycleReport report = sync_ok(field_b);
  assert(report.acknowledged == 1U);

  report = sync_ok(field_a);
  assert(report.merged == 1U);
  assert(report.conflicts == 1U);
  assert(report.compensations == 0U);
  assert(report.acknowledged == 1U);

  fieldops::SyncCycleReport background;
  std::future<fieldops::Result> pending = field_b.start_sync(background);
  assert(pending.get().ok);
  assert(background.merged == 1U);

  assert(fieldops::total_meals_served(*field_a.snapshot(kOperation)) == 80);
  assert(fieldops::total_meals_served(*field_b.snapshot(kOperation)) == 80);
  assert(field_a.self_test(kOperation).ok);
  assert(field_b.self_test(kOperation).ok);
}

void test_concurrent_assignments_keep_one_position() {
  ManualClock clock;
  fieldops::InMemoryRemoteAuthority authority;
  fieldops::FieldService field_a;
  fieldops::FieldService field_b;
  assert(field_a.init(node_config("field-a"), authority, clock.fn()).ok);
  assert(field_b.init(node_config("field-b"), authority, clock.fn()).ok);

  submit_ok(field_a,
            fieldops::PersonAssignedPayload{
                .person_id = "p-1", .person_name = "Dana", .position_code = "SHELTER-MGR"},
            context_for("field-a", "user:lead"));
  clock.now += 5;
  const std::string losing = submit_ok(
      field_b,
      fieldops::PersonAssignedPayload{.person_id = "p-1", .person_name = "Dana", .position_code = "FEED-LEAD"},
      context_for("field-b", "user:feeder"));

  sync_ok(field_a);
  fieldops::SyncCycleReport report = sync_ok(field_b);
  assert(report.conflicts == 1U);
  assert(report.compensations == 1U);
  assert(report.acknowledged == 2U);

  report = sync_ok(field_a);
  assert(report.merged == 2U);
  assert(authority.event_count(kOperation) == 3U);

  const std::vector<std::string> expected{"SHELTER-MGR"};
  assert(fieldops::active_positions(*field_a.snapshot(kOperation), "p-1") == expected);
  assert(fieldops::active_positions(*field_b.snapshot(kOperation), "p-1") == expected);
  assert(fieldops::view_digest(*field_a.snapshot(kOperation)) ==
         fieldops::view_digest(*field_b.snapshot(kOperation)));

  std::vector<fieldops::Event> stream;
  assert(field_a.read_stream(kOperation, stream).ok);
  std::size_t unassignments = 0;
  for (const auto& event : stream) {
    if (event.kind == fieldops::EventKind::PersonUnassigned) {
      ++unassignments;
      assert(event.causation_id == losing);
      assert(event.actor_id == fieldops::kResolverActorId);
    }
  }
  assert(unassignments == 1U);
}

void test_retry_bound_marks_event_stuck() {
  ManualClock clock;
  fieldops::InMemoryRemoteAuthority authority;
  fieldops::EngineConfig config = node_config("field-a");
  config.sync.max_attempts = 3;
  config.sync.backoff_base_ms = 10;
  config.sync.backoff_cap_ms = 40;

  fieldops::FieldService node;
  assert(node.init(config, authority, clock.fn()).ok);
  authority.set_reachable(false);
  const std::string event_id = submit_ok(node, lunch(12), context_for("field-a", "user:lead"));

  fieldops::SyncCycleReport report;
  fieldops::Result synced = node.sync_now(report);
  assert(!synced.ok);
  assert(synced.code == fieldops::ErrorCode::SyncTransport);
  assert(report.failed == 1U);
  auto event = node.find_event(event_id);
  assert(event->sync_status == fieldops::SyncStatus::Failed);
  assert(event->sync_attempts == 1U);

  assert(!node.sync_now(report).ok);
  assert(report.failed == 0U);

  clock.now += 10;
  assert(!node.sync_now(report).ok);
  assert(report.failed == 1U);
  clock.now += 20;
  assert(!node.sync_now(report).ok);
  assert(report.failed == 1U);

  const auto stuck = node.stuck_events();
  assert(stuck.size() == 1U);
  assert(stuck.front().event_id == event_id);
  assert(stuck.front().attempts == 3U);
  assert(stuck.front().last_error.starts_with("sync-transport"));

  clock.now += 10'000;
  assert(!node.sync_now(report).ok);
  assert(report.failed == 0U);

  authority.set_reachable(true);
  report = sync_ok(node);
  assert(report.pushed == 0U);
  assert(authority.event_count(kOperation) == 0U);
  assert(node.status().sync.stuck == 1U);
  event = node.find_event(event_id);
  assert(event->sync_status == fieldops::SyncStatus::Failed);
  assert(event->sync_attempts == 3U);
  assert(event->sync_error.has_value());
}

void test_rejected_push_is_terminal() {
  ManualClock clock;
  fieldops::InMemoryRemoteAuthority authority;
  fieldops::FieldService node;
  assert(node.init(node_config("field-a"), authority, clock.fn()).ok);

  const std::string rejected_id = submit_ok(node, lunch(7), context_for("field-a", "user:lead"));
  authority.inject_push_failure(fieldops::ErrorCode::Validation, 1);

  fieldops::SyncCycleReport report;
  const fieldops::Result synced = node.sync_now(report);
  assert(!synced.ok);
  assert(synced.code == fieldops::ErrorCode::Validation);

  const auto stuck = node.stuck_events();
  assert(stuck.size() == 1U);
  assert(stuck.front().attempts == 1U);
  assert(stuck.front().last_error.starts_with("validation"));

  clock.now += 120'000;
  const std::string accepted_id = submit_ok(node, lunch(9), context_for("field-a", "user:lead"));
  report = sync_ok(node);
  assert(report.acknowledged == 1U);
  assert(authority.event_count(kOperation) == 1U);
  assert(node.find_event(accepted_id)->sync_status == fieldops::SyncStatus::Synced);
  assert(node.find_event(rejected_id)->sync_status == fieldops::SyncStatus::Failed);
}

void test_manual_iap_conflict_round_trip() {
  ManualClock clock;
  fieldops::InMemoryRemoteAuthority authority;
  fieldops::FieldService field_a;
  fieldops::FieldService field_b;
  assert(field_a.init(node_config("field-a"), authority, clock.fn()).ok);
  assert(field_b.init(node_config("field-b"), authority, clock.fn()).ok);

  const fieldops::ActorContext planner_a = context_for("field-a", "user:planner-a");
  const fieldops::ActorContext planner_b = context_for("field-b", "user:planner-b");
  const std::string draft_a = submit_ok(
      field_a, fieldops::IapSectionUpdatedPayload{.iap_id = "iap-1", .section = "objectives", .content = "Plan A"},
      planner_a);
  clock.now += 1;
  const std::string draft_b = submit_ok(
      field_b, fieldops::IapSectionUpdatedPayload{.iap_id = "iap-1", .section = "objectives", .content = "Plan B"},
      planner_b);

  sync_ok(field_a);
  fieldops::SyncCycleReport report = sync_ok(field_b);
  assert(report.conflicts == 1U);
  assert(report.acknowledged == 0U);
  assert(authority.event_count(kOperation) == 1U);
  assert(field_b.find_event(draft_b)->sync_status == fieldops::SyncStatus::Pending);
  assert(fieldops::iap_section_content(*field_b.snapshot(kOperation), "iap-1", "objectives") == "Plan B");

  const auto pending = field_b.pending_conflicts(kOperation);
  assert(pending.size() == 1U);
  const std::string conflict_id = pending.front().conflict_id;
  assert(field_b.status().open_conflicts == 1U);

  clock.now += 60'000;
  assert(field_b.resolve_manual_conflict("no-such-conflict", draft_a, planner_b, "").code ==
         fieldops::ErrorCode::NotFound);
  const fieldops::Result wrong_winner = field_b.resolve_manual_conflict(conflict_id, "not-a-candidate", planner_b, "");
  assert(!wrong_winner.ok);
  assert(wrong_winner.data == "winner_event_id");

  const fieldops::Result resolved =
      field_b.resolve_manual_conflict(conflict_id, draft_a, planner_b, "keep the approved objectives");
  assert(resolved.ok);
  assert(field_b.pending_conflicts(kOperation).empty());
  const auto resolution = field_b.find_event(resolved.data);
  assert(resolution.has_value());
  assert(resolution->kind == fieldops::EventKind::ConflictResolved);
  assert(resolution->causation_id == draft_a);

  report = sync_ok(field_b);
  assert(report.acknowledged == 2U);
  report = sync_ok(field_a);
  assert(report.merged == 2U);
  assert(report.conflicts == 0U);

  for (fieldops::FieldService* node : {&field_a, &field_b}) {
    assert(fieldops::iap_section_content(*node->snapshot(kOperation), "iap-1", "objectives") == "Plan A");
  }
  assert(authority.event_count(kOperation) == 3U);
}

void test_cancelled_cycle_discards_batch() {
  ManualClock clock;
  fieldops::InMemoryRemoteAuthority authority;
  RelayAuthority relay(authority);
  fieldops::FieldService field_a;
  fieldops::FieldService field_b;
  assert(field_a.init(node_config("field-a"), authority, clock.fn()).ok);
  assert(field_b.init(node_config("field-b"), relay, clock.fn()).ok);

  submit_ok(field_a, lunch(10), context_for("field-a", "user:lead"));
  submit_ok(field_a, lunch(15), context_for("field-a", "user:lead"));
  sync_ok(field_a);

  submit_ok(field_b, lunch(5), context_for("field-b", "user:feeder"));
  relay.after_pull = [&field_b](fieldops::PullBatch& batch) {
    assert(batch.events.size() == 2U);
    field_b.cancel_sync();
  };

  fieldops::SyncCycleReport report;
  const fieldops::Result cancelled = field_b.sync_now(report);
  assert(!cancelled.ok);
  assert(cancelled.code == fieldops::ErrorCode::Cancelled);
  assert(report.cancelled);
  assert(report.merged == 0U);
  assert(field_b.status().store.event_count == 1U);
  assert(field_b.sync_cursor(kOperation).last_position == 0U);
  assert(authority.event_count(kOperation) == 2U);

  report = sync_ok(field_b);
  assert(report.merged == 2U);
  assert(report.acknowledged == 1U);
  assert(field_b.sync_cursor(kOperation).last_position == 2U);
  assert(fieldops::total_meals_served(*field_b.snapshot(kOperation)) == 30);
  assert(authority.event_count(kOperation) == 3U);
}

void test_tampered_pull_is_rejected() {
  ManualClock clock;
  fieldops::InMemoryRemoteAuthority authority;
  RelayAuthority relay(authority);
  fieldops::FieldService field_a;
  fieldops::FieldService field_b;
  assert(field_a.init(node_config("field-a"), authority, clock.fn()).ok);
  assert(field_b.init(node_config("field-b"), relay, clock.fn()).ok);
  assert(field_b.switch_operation(kOperation).ok);

  submit_ok(field_a, lunch(10), context_for("field-a", "user:lead"));
  submit_ok(field_a, lunch(20), context_for("field-a", "user:lead"));
  sync_ok(field_a);

  relay.after_pull = [](fieldops::PullBatch& batch) {
    std::get<fieldops::MealsServedIncrementPayload>(batch.events[1].payload).count = 2000;
  };
  fieldops::SyncCycleReport report;
  const fieldops::Result rejected = field_b.sync_now(report);
  assert(!rejected.ok);
  assert(rejected.code == fieldops::ErrorCode::ChainIntegrity);
  assert(report.merged == 0U);
  assert(field_b.status().store.event_count == 0U);
  assert(field_b.sync_cursor(kOperation).last_position == 0U);

  report = sync_ok(field_b);
  assert(report.merged == 2U);
  assert(fieldops::total_meals_served(*field_b.snapshot(kOperation)) == 30);
}

void test_debounce_and_flush() {
  ManualClock clock;
  fieldops::InMemoryRemoteAuthority authority;
  fieldops::EngineConfig config = node_config("field-a");
  config.sync.debounce_ms = 2000;

  fieldops::FieldService node;
  assert(node.init(config, authority, clock.fn()).ok);
  const std::string event_id = submit_ok(node, lunch(3), context_for("field-a", "user:lead"));

  fieldops::SyncCycleReport report = sync_ok(node);
  assert(report.pushed == 0U);
  assert(node.find_event(event_id)->sync_status == fieldops::SyncStatus::Local);
  assert(node.status().sync.local == 1U);

  const fieldops::Result flushed = node.flush();
  assert(flushed.ok);
  assert(flushed.data == "1");
  assert(node.find_event(event_id)->sync_status == fieldops::SyncStatus::Pending);

  report = sync_ok(node);
  assert(report.acknowledged == 1U);
  assert(node.find_event(event_id)->sync_status == fieldops::SyncStatus::Synced);

  submit_ok(node, lunch(4), context_for("field-a", "user:lead"));
  clock.now += 2000;
  report = sync_ok(node);
  assert(report.acknowledged == 1U);
}

void test_sync_state_survives_restart() {
  const auto dir = temp_dir("restart");
  ManualClock clock;
  fieldops::InMemoryRemoteAuthority authority;
  const fieldops::ActorContext lead = context_for("field-a", "user:lead");

  std::string meals_id;
  {
    fieldops::FieldService node;
    assert(node.init(node_config("field-a", dir.string()), authority, clock.fn()).ok);
    authority.set_reachable(false);
    meals_id = submit_ok(node, lunch(25), lead);
    submit_ok(node,
              fieldops::FacilityCreatedPayload{
                  .facility_id = "shelter-1", .name = "Shelter 1", .facility_type = "shelter", .capacity = 120},
              lead);
    fieldops::SyncCycleReport report;
    assert(!node.sync_now(report).ok);
    assert(report.failed == 2U);
  }
  assert(std::filesystem::exists(dir / "events.log"));
  assert(std::filesystem::exists(dir / "sync-state.dat"));

  {
    fieldops::FieldService node;
    assert(node.init(node_config("field-a", dir.string()), authority, clock.fn()).ok);
    const fieldops::EngineStatusReport status = node.status();
    assert(status.store.event_count == 2U);
    assert(status.store.healthy);
    assert(status.sync.failed == 2U);
    assert(node.find_event(meals_id)->sync_attempts == 1U);
    assert(node.find_event(meals_id)->sync_status == fieldops::SyncStatus::Failed);
    assert(fieldops::total_meals_served(*node.snapshot(kOperation)) == 25);
    assert(fieldops::facility_name(*node.snapshot(kOperation), "shelter-1") == "Shelter 1");
    assert(node.verify_chain(kOperation).intact);

    authority.set_reachable(true);
    clock.now += 5000;
    const fieldops::SyncCycleReport report = sync_ok(node);
    assert(report.acknowledged == 2U);
    assert(node.status().sync.synced == 2U);

    clock.now += 1;
    submit_ok(node, lunch(5), lead);
  }

  fieldops::FieldService reopened;
  assert(reopened.init(node_config("field-a", dir.string()), authority, clock.fn()).ok);
  assert(reopened.find_event(meals_id)->sync_status == fieldops::SyncStatus::Synced);
  assert(reopened.status().sync.local == 1U);
  assert(fieldops::total_meals_served(*reopened.snapshot(kOperation)) == 30);
  const fieldops::SyncCycleReport report = sync_ok(reopened);
  assert(report.acknowledged == 1U);
  assert(authority.event_count(kOperation) == 3U);
}

void test_first_writer_policy_reaches_view() {
  ManualClock clock;
  fieldops::InMemoryRemoteAuthority authority;
  fieldops::EngineConfig config_a = node_config("field-a");
  fieldops::EngineConfig config_b = node_config("field-b");
  config_a.policy_overrides.emplace_back("facility.updated", "fww");
  config_b.policy_overrides.emplace_back("facility.updated", "fww");
  fieldops::FieldService field_a;
  fieldops::FieldService field_b;
  assert(field_a.init(config_a, authority, clock.fn()).ok);
  assert(field_b.init(config_b, authority, clock.fn()).ok);
  assert(field_b.switch_operation(kOperation).ok);

  const fieldops::ActorContext lead = context_for("field-a", "user:lead");
  const fieldops::ActorContext manager = context_for("field-b", "user:manager");
  submit_ok(field_a,
            fieldops::FacilityCreatedPayload{
                .facility_id = "shelter-1", .name = "Shelter 1", .facility_type = "shelter", .capacity = 120},
            lead);
  sync_ok(field_a);
  sync_ok(field_b);

  clock.now += 1000;
  const std::string first = submit_ok(
      field_a, fieldops::FacilityUpdatedPayload{.facility_id = "shelter-1", .name = "First write"}, lead);
  clock.now += 1000;
  submit_ok(field_b, fieldops::FacilityUpdatedPayload{.facility_id = "shelter-1", .name = "Second write"}, manager);

  fieldops::SyncCycleReport report = sync_ok(field_a);
  assert(report.acknowledged == 1U);

  report = sync_ok(field_b);
  assert(report.merged == 1U);
  assert(report.conflicts == 1U);
  assert(report.compensations == 1U);
  assert(report.acknowledged == 2U);
  assert(fieldops::facility_name(*field_b.snapshot(kOperation), "shelter-1") == "First write");

  report = sync_ok(field_a);
  assert(report.merged == 2U);

  for (fieldops::FieldService* node : {&field_a, &field_b}) {
    assert(fieldops::facility_name(*node->snapshot(kOperation), "shelter-1") == "First write");
    assert(node->self_test(kOperation).ok);
  }
  assert(fieldops::view_digest(*field_a.snapshot(kOperation)) ==
         fieldops::view_digest(*field_b.snapshot(kOperation)));
  assert(authority.event_count(kOperation) == 4U);

  std::vector<fieldops::Event> stream;
  assert(field_a.read_stream(kOperation, stream).ok);
  const fieldops::Event& record = stream.back();
  assert(record.kind == fieldops::EventKind::ConflictResolved);
  assert(std::get<fieldops::ConflictResolvedPayload>(record.payload).winner_event_id == first);
}

void test_out_of_order_pull_buffers_child() {
  ManualClock clock;
  fieldops::InMemoryRemoteAuthority authority;
  fieldops::EngineConfig config = node_config("field-b");
  config.sync.batch_size = 1;
  fieldops::FieldService field_b;
  assert(field_b.init(config, authority, clock.fn()).ok);
  assert(field_b.switch_operation(kOperation).ok);

  fieldops::EventFactory factory(clock.fn());
  const fieldops::ActorContext lead = context_for("field-a", "user:lead");
  const fieldops::Event shelter = build_remote(
      factory,
      fieldops::FacilityCreatedPayload{
          .facility_id = "shelter-1", .name = "Shelter 1", .facility_type = "shelter", .capacity = 120},
      lead);
  clock.now += 1000;
  const fieldops::Event annex = build_remote(
      factory, fieldops::FacilityUpdatedPayload{.facility_id = "shelter-1", .name = "Shelter 1 Annex"}, lead,
      shelter.id);
  push_direct(authority, annex);
  push_direct(authority, shelter);

  fieldops::SyncCycleReport report = sync_ok(field_b);
  assert(report.pulled == 2U);
  assert(report.buffered == 1U);
  assert(report.merged == 2U);
  assert(field_b.sync_cursor(kOperation).last_position == 0U);
  assert(field_b.status().awaiting_parent == 0U);
  assert(fieldops::facility_name(*field_b.snapshot(kOperation), "shelter-1") == "Shelter 1 Annex");

  std::vector<fieldops::Event> stream;
  assert(field_b.read_stream(kOperation, stream).ok);
  assert(stream.size() == 2U);
  assert(stream[0].id == shelter.id);
  assert(stream[1].id == annex.id);

  // The next cycle re-reads the held-back prefix and moves the cursor over it.
  report = sync_ok(field_b);
  assert(report.pulled == 2U);
  assert(report.merged == 0U);
  assert(field_b.sync_cursor(kOperation).last_position == 2U);

  report = sync_ok(field_b);
  assert(report.pulled == 0U);
  assert(field_b.verify_chain(kOperation).intact);
  assert(field_b.self_test(kOperation).ok);
}

void test_orphan_timeout_surfaces() {
  const auto dir = temp_dir("orphans");
  ManualClock clock;
  fieldops::InMemoryRemoteAuthority authority;
  fieldops::EngineConfig config = node_config("field-b", dir.string());
  config.awaiting_parent_timeout_ms = 1000;

  fieldops::EventFactory factory(clock.fn());
  const fieldops::ActorContext lead = context_for("field-a", "user:lead");
  const fieldops::Event withheld = build_remote(
      factory,
      fieldops::FacilityCreatedPayload{
          .facility_id = "shelter-9", .name = "Shelter 9", .facility_type = "shelter", .capacity = 60},
      lead);
  clock.now += 1;
  const fieldops::Event orphan = build_remote(
      factory, fieldops::FacilityUpdatedPayload{.facility_id = "shelter-9", .name = "River Annex"}, lead,
      withheld.id);
  clock.now += 1;
  const fieldops::Event tally = build_remote(factory, lunch(12), lead);
  push_direct(authority, orphan);
  push_direct(authority, tally);

  {
    fieldops::FieldService field_b;
    assert(field_b.init(config, authority, clock.fn()).ok);
    assert(field_b.switch_operation(kOperation).ok);

    fieldops::SyncCycleReport report = sync_ok(field_b);
    assert(report.buffered == 1U);
    assert(report.merged == 1U);
    assert(field_b.sync_cursor(kOperation).last_position == 0U);
    assert(field_b.status().awaiting_parent == 1U);

    clock.now += 5000;
    const fieldops::Result timed_out = field_b.sync_now(report);
    assert(!timed_out.ok);
    assert(timed_out.code == fieldops::ErrorCode::CausalityTimeout);
    assert(timed_out.data == orphan.id);
    assert(report.expired == 1U);
    assert(report.pulled == 2U);
    assert(report.buffered == 0U);
    assert(report.merged == 0U);
    assert(field_b.sync_cursor(kOperation).last_position == 2U);

    const fieldops::EngineStatusReport status = field_b.status();
    assert(status.awaiting_parent == 0U);
    assert(status.sync.orphaned == 1U);
    assert(field_b.orphaned_events().front().id == orphan.id);

    clock.now += 5000;
    report = sync_ok(field_b);
    assert(report.pulled == 0U);
    assert(report.expired == 0U);
    assert(report.buffered == 0U);
  }

  fieldops::FieldService reopened;
  assert(reopened.init(config, authority, clock.fn()).ok);
  assert(reopened.status().sync.orphaned == 1U);
  assert(fieldops::total_meals_served(*reopened.snapshot(kOperation)) == 12);

  push_direct(authority, withheld);
  const fieldops::SyncCycleReport report = sync_ok(reopened);
  assert(report.merged == 2U);
  assert(reopened.orphaned_events().empty());
  assert(reopened.sync_cursor(kOperation).last_position == 3U);
  assert(fieldops::facility_name(*reopened.snapshot(kOperation), "shelter-9") == "River Annex");
  assert(reopened.verify_chain(kOperation).intact);
}

void test_teardown_waits_for_background_cycle() {
  ManualClock clock;
  fieldops::InMemoryRemoteAuthority authority;
  fieldops::SyncCycleReport background;
  std::future<fieldops::Result> pending;
  {
    fieldops::FieldService node;
    assert(node.init(node_config("field-a"), authority, clock.fn()).ok);
    submit_ok(node, lunch(10), context_for("field-a", "user:lead"));
    pending = node.start_sync(background);
  }

  const fieldops::Result finished = pending.get();
  if (finished.ok) {
    assert(authority.event_count(kOperation) == 1U);
  } else {
    assert(finished.code == fieldops::ErrorCode::Cancelled);
    assert(background.cancelled);
  }
}

}  // namespace

int main() {
  test_backoff_schedule();
  test_shelter_rename_converges();
  test_concurrent_meal_counts_sum();
  test_concurrent_assignments_keep_one_position();
  test_retry_bound_marks_event_stuck();
  test_rejected_push_is_terminal();
  test_manual_iap_conflict_round_trip();
  test_cancelled_cycle_discards_batch();
  test_tampered_pull_is_rejected();
  test_debounce_and_flush();
  test_sync_state_survives_restart();
  test_first_writer_policy_reaches_view();
  test_out_of_order_pull_buffers_child();
  test_orphan_timeout_surfaces();
  test_teardown_waits_for_background_cycle();

  std::cout << "fieldops_sync_tests passed\n";
  return 0;
}
