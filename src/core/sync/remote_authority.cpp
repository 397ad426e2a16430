#include "core/sync/remote_authority.hpp"

#include <algorithm>
#include <utility>

#include "core/event/envelope.hpp"

namespace fieldops {

Result InMemoryRemoteAuthority::push(const PushBatch& batch, PushAck& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  out = PushAck{};

  const Result reachable = check_reachable();
  if (!reachable.ok) {
    return reachable;
  }
  if (injected_remaining_ > 0) {
    --injected_remaining_;
    return Result::failure(injected_code_, "Push rejected by the authority.");
  }
  if (batch.operation_id.empty()) {
    return Result::failure(ErrorCode::Validation, "Push batch has no operation id.", "operation_id");
  }
  if (batch.events.empty()) {
    return Result::success("Nothing to push.");
  }
  if (batch.events.back().hash != batch.tail_digest) {
    return Result::failure(ErrorCode::ChainIntegrity, "Push batch tail digest does not match its last event.",
                           batch.events.back().id);
  }

  std::vector<Event>& stream = streams_[batch.operation_id];
  for (const auto& event : batch.events) {
    if (operation_by_event_.contains(event.id)) {
      out.accepted_ids.push_back(event.id);
      continue;
    }
    if (event.operation_id != batch.operation_id) {
      out.rejected.emplace(event.id, Result::failure(ErrorCode::Validation,
                                                     "Event belongs to another operation.", "operation_id"));
      continue;
    }
    const Result envelope = validate_envelope(event);
    if (!envelope.ok) {
      out.rejected.emplace(event.id, envelope);
      continue;
    }

    Event accepted = event;
    accepted.previous_hash = stream.empty() ? std::string{kGenesisHash} : stream.back().hash;
    accepted.sync_status = SyncStatus::Synced;
    accepted.sync_attempts = 0;
    accepted.sync_error.reset();
    operation_by_event_.emplace(accepted.id, batch.operation_id);
    stream.push_back(std::move(accepted));
    out.accepted_ids.push_back(event.id);
  }

  return Result::success("Batch processed.", std::to_string(out.accepted_ids.size()));
}

Result InMemoryRemoteAuthority::pull(const PullRequest& request, PullBatch& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  out = PullBatch{};

  const Result reachable = check_reachable();
  if (!reachable.ok) {
    return reachable;
  }

  const auto it = streams_.find(request.operation_id);
  if (it == streams_.end()) {
    out.tail_digest = std::string{kGenesisHash};
    return Result::success("Operation unknown to the authority.");
  }

  const std::vector<Event>& stream = it->second;
  out.tail_position = stream.size();
  out.first_position = request.since_position + 1;
  if (request.since_position >= stream.size()) {
    out.tail_digest = stream.empty() ? std::string{kGenesisHash} : stream.back().hash;
    return Result::success("Up to date.");
  }

  const std::size_t limit = request.limit == 0 ? stream.size() : request.limit;
  const std::size_t begin = static_cast<std::size_t>(request.since_position);
  const std::size_t end = std::min(stream.size(), begin + limit);
  out.events.assign(stream.begin() + static_cast<std::ptrdiff_t>(begin),
                    stream.begin() + static_cast<std::ptrdiff_t>(end));
  out.tail_digest = out.events.back().hash;
  out.has_more = end < stream.size();
  return Result::success("Pulled events.", std::to_string(out.events.size()));
}

void InMemoryRemoteAuthority::set_reachable(bool reachable) {
  std::lock_guard<std::mutex> lock(mutex_);
  reachable_ = reachable;
}

void InMemoryRemoteAuthority::inject_push_failure(ErrorCode code, std::size_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  injected_code_ = code;
  injected_remaining_ = count;
}

std::size_t InMemoryRemoteAuthority::event_count(const std::string& operation_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = streams_.find(operation_id);
  return it == streams_.end() ? 0 : it->second.size();
}

ChainVerification InMemoryRemoteAuthority::verify_chain(const std::string& operation_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = streams_.find(operation_id);
  if (it == streams_.end() || it->second.empty()) {
    return ChainVerification{};
  }
  return EventStore::verify_batch(it->second, kGenesisHash, it->second.back().hash);
}

Result InMemoryRemoteAuthority::check_reachable() const {
  if (!reachable_) {
    return Result::failure(ErrorCode::SyncTransport, "Remote authority unreachable.");
  }
  return Result::success();
}

}  // namespace fieldops
