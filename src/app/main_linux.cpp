#include <iostream>
#include <string>

#include "core/api/core_api.hpp"
#include "core/model/app_meta.hpp"
#include "core/projection/views.hpp"
#include "core/sync/remote_authority.hpp"

namespace {

fieldops::EngineConfig node_config(const std::string& device_id) {
  return {
      .data_dir = "fieldops-data-" + device_id,
      .device_id = device_id,
      .sync = {.debounce_ms = 0, .batch_size = 100, .max_attempts = 5, .backoff_base_ms = 1000,
               .backoff_cap_ms = 60000},
      .log_level = "info",
  };
}

bool report(const char* step, const fieldops::Result& result) {
  if (!result.ok) {
    std::cerr << step << " failed [" << fieldops::error_code_name(result.code) << "]: " << result.message << '\n';
  }
  return result.ok;
}

void print_status(const fieldops::CoreApi& api, const std::string& operation_id) {
  const fieldops::EngineStatusReport status = api.status();
  const auto view = api.snapshot(operation_id);
  std::cout << status.device_id << ": events=" << status.store.event_count << " file=" << status.store.events_file
            << " pending=" << status.sync.pending << " synced=" << status.sync.synced
            << " stuck=" << status.sync.stuck << " orphaned=" << status.sync.orphaned << " conflicts=" << status.open_conflicts << '\n';
  std::cout << "  operation=" << fieldops::operation_name(*view)
            << " shelter=" << fieldops::facility_name(*view, "shelter-1")
            << " meals=" << fieldops::total_meals_served(*view) << '\n';
}

}  // namespace

int main(int argc, char** argv) {
  fieldops::InMemoryRemoteAuthority authority;
  fieldops::CoreApi field_a;
  fieldops::CoreApi field_b;

  const fieldops::Result init_a = argc > 1
                                      ? field_a.init_from_profile(argv[1], node_config("field-a"), authority)
                                      : field_a.init(node_config("field-a"), authority);
  if (!report("field-a init", init_a) || !report("field-b init", field_b.init(node_config("field-b"), authority))) {
    return 1;
  }

  std::cout << fieldops::kAppDisplayName << ' ' << fieldops::kAppVersion << " (" << fieldops::kBuildRelease
            << ")\n";

  const std::string operation_id = "DR-4242";
  const fieldops::ActorContext lead{
      .actor_id = "user:lead", .device_id = "field-a", .session_id = "shift-1", .operation_id = operation_id};
  const fieldops::ActorContext feeder{
      .actor_id = "user:feeder", .device_id = "field-b", .session_id = "shift-1", .operation_id = operation_id};

  if (!report("switch", field_a.switch_operation(operation_id)) ||
      !report("switch", field_b.switch_operation(operation_id))) {
    return 1;
  }

  if (!field_a.snapshot(operation_id)->operation.created.set()) {
    if (!report("operation.created",
                field_a.submit(fieldops::OperationCreatedPayload{
                                   .name = "Spring Floods", .dr_number = "4242", .region = "Region 4"},
                               lead)) ||
        !report("facility.created",
                field_a.submit(fieldops::FacilityCreatedPayload{.facility_id = "shelter-1",
                                                                .name = "Shelter 1",
                                                                .facility_type = "shelter",
                                                                .address = "12 Main St",
                                                                .capacity = 120},
                               lead))) {
      return 1;
    }
  }

  fieldops::SyncCycleReport cycle;
  report("field-a sync", field_a.sync_now(cycle));
  report("field-b sync", field_b.sync_now(cycle));

  report("meals", field_b.submit(fieldops::MealsServedIncrementPayload{
                                     .location_id = "shelter-1", .meal_type = "lunch", .count = 50},
                                 feeder));
  report("meals", field_a.submit(fieldops::MealsServedIncrementPayload{
                                     .location_id = "shelter-1", .meal_type = "lunch", .count = 30},
                                 lead));

  report("field-b sync", field_b.sync_now(cycle));
  report("field-a sync", field_a.sync_now(cycle));
  report("field-b sync", field_b.sync_now(cycle));

  print_status(field_a, operation_id);
  print_status(field_b, operation_id);

  const fieldops::ChainVerification chain = field_a.verify_chain(operation_id);
  std::cout << "chain " << (chain.intact ? "intact" : "broken") << " after " << chain.checked << " events\n";
  return chain.intact ? 0 : 2;
}
