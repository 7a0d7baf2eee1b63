/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sync/impl/sync_manager_impl.hpp"

#include <algorithm>

#include <boost/assert.hpp>

#include "common/visitor.hpp"
#include "sync/sync_error.hpp"

namespace auditsync::sync {

  namespace {
    // larger shifts overflow long before the backoff cap is reached
    constexpr uint32_t kMaxBackoffExponent = 30;
  }  // namespace

  SyncManagerImpl::SyncManagerImpl(NodeId node_id,
                                   SyncConfig config,
                                   std::shared_ptr<audit::AuditStorage> storage,
                                   std::shared_ptr<clock::SystemClock> clock)
      : node_id_{std::move(node_id)},
        config_{config},
        storage_{std::move(storage)},
        clock_{std::move(clock)},
        log_{log::createLogger("SyncManager", "sync_manager")} {
    BOOST_ASSERT(not node_id_.empty());
    BOOST_ASSERT(storage_);
    BOOST_ASSERT(clock_);
  }

  outcome::result<SyncRequest> SyncManagerImpl::createSyncRequest(
      const NodeId &target, const VectorClock &clock) const {
    OUTCOME_TRY(validatePeer(target));
    return SyncRequest{
        .from_node = node_id_,
        .since = watermarkFor(target),
        .vector_clock = clock,
    };
  }

  outcome::result<SyncResponse> SyncManagerImpl::processSyncRequest(
      const SyncMessage &message) {
    auto request_opt = if_type<SyncRequest>(message);
    if (not request_opt) {
      SL_WARN(log_,
              "Expected SyncRequest, got {} from {}",
              messageName(message),
              messageSender(message));
      return SyncError::UNEXPECTED_MESSAGE;
    }
    const SyncRequest &request = request_opt->get();
    OUTCOME_TRY(validatePeer(request.from_node));

    OUTCOME_TRY(matching, selectSince(request.since));
    // records the requester already acknowledged are not served again
    if (const auto *state = findState(request.from_node)) {
      std::erase_if(matching, [&](const audit::AuditRecord &record) {
        return state->isSynced(record.id);
      });
    }
    const size_t batch_size = std::max<size_t>(config_.batch_size, 1);
    const size_t total = matching.size();
    const bool has_more = total > batch_size;
    if (has_more) {
      matching.resize(batch_size);
    }

    local_clock_.merge(request.vector_clock);
    auto response =
        packRecords(request.from_node, std::move(matching), has_more);

    SL_DEBUG(log_,
             "Serving {} of {} records since {} to {}",
             response.records.size(),
             total,
             primitives::toUnixMillis(request.since),
             request.from_node);
    return response;
  }

  outcome::result<SyncAck> SyncManagerImpl::processSyncResponse(
      const SyncMessage &message) {
    auto response_opt = if_type<SyncResponse>(message);
    if (not response_opt) {
      SL_WARN(log_,
              "Expected SyncResponse, got {} from {}",
              messageName(message),
              messageSender(message));
      return SyncError::UNEXPECTED_MESSAGE;
    }
    const SyncResponse &response = response_opt->get();
    OUTCOME_TRY(validatePeer(response.from_node));

    for (const auto &distributed : response.records) {
      if (distributed.origin_node.empty()) {
        return SyncError::INVALID_NODE_ID;
      }
      if (not distributed.record.verify()) {
        SL_WARN(log_,
                "Record {} from {} fails its hash check",
                distributed.id(),
                response.from_node);
        return SyncError::TAMPERED_RECORD;
      }
    }

    auto &state = ensureState(response.from_node);
    SyncAck ack{
        .from_node = node_id_,
        .record_ids = {},
        .vector_clock = {},
    };
    ack.record_ids.reserve(response.records.size());

    size_t fresh = 0;
    std::optional<Timestamp> newest;
    for (const auto &distributed : response.records) {
      const auto &id = distributed.id();
      if (not state.isSynced(id)) {
        ++fresh;
      }
      state.markSynced(id);
      local_clock_.merge(distributed.vector_clock);
      ack.record_ids.push_back(id);
      if (not newest or *newest < distributed.record.timestamp) {
        newest = distributed.record.timestamp;
      }
    }
    local_clock_.merge(response.vector_clock);

    // truncated batch: continue from the newest received record next time
    auto watermark = response.has_more and newest ? *newest : now();
    state.recordSuccess(watermark);
    state.continuation_pending = response.has_more;
    state.diverged = false;

    ack.vector_clock = local_clock_;

    SL_DEBUG(log_,
             "Accepted {} records ({} new) from {}{}",
             ack.record_ids.size(),
             fresh,
             response.from_node,
             response.has_more ? ", more to come" : "");
    return ack;
  }

  outcome::result<void> SyncManagerImpl::processSyncAck(
      const SyncMessage &message) {
    auto ack_opt = if_type<SyncAck>(message);
    if (not ack_opt) {
      SL_WARN(log_,
              "Expected SyncAck, got {} from {}",
              messageName(message),
              messageSender(message));
      return SyncError::UNEXPECTED_MESSAGE;
    }
    const SyncAck &ack = ack_opt->get();
    OUTCOME_TRY(validatePeer(ack.from_node));

    auto &state = ensureState(ack.from_node);
    for (const auto &id : ack.record_ids) {
      state.markSynced(id);
    }
    state.recordSuccess(now());
    local_clock_.merge(ack.vector_clock);

    SL_TRACE(log_,
             "{} acknowledged {} records, {} still pending",
             ack.from_node,
             ack.record_ids.size(),
             state.pending_records.size());
    return outcome::success();
  }

  outcome::result<Heartbeat> SyncManagerImpl::createHeartbeat() const {
    OUTCOME_TRY(count, localCount());
    OUTCOME_TRY(last_hash, localLastHash());
    return Heartbeat{
        .from_node = node_id_,
        .vector_clock = local_clock_,
        .record_count = count,
        .last_hash = std::move(last_hash),
    };
  }

  outcome::result<std::optional<SyncMessage>>
  SyncManagerImpl::processHeartbeat(const SyncMessage &message) {
    auto heartbeat_opt = if_type<Heartbeat>(message);
    if (not heartbeat_opt) {
      SL_WARN(log_,
              "Expected Heartbeat, got {} from {}",
              messageName(message),
              messageSender(message));
      return SyncError::UNEXPECTED_MESSAGE;
    }
    const Heartbeat &heartbeat = heartbeat_opt->get();
    OUTCOME_TRY(validatePeer(heartbeat.from_node));

    OUTCOME_TRY(local_count, localCount());
    bool diverged = false;
    if (heartbeat.record_count == local_count and heartbeat.last_hash) {
      OUTCOME_TRY(local_hash, localLastHash());
      diverged = local_hash.has_value() and *local_hash != *heartbeat.last_hash;
    }

    // watermark is taken before the heartbeat refreshes it
    auto since = watermarkFor(heartbeat.from_node);

    local_clock_.merge(heartbeat.vector_clock);
    auto &state = ensureState(heartbeat.from_node);
    state.last_sync = now();
    state.diverged = diverged;

    if (diverged) {
      SL_WARN(log_,
              "Peer {} holds {} records as we do, but its head {} differs "
              "from ours",
              heartbeat.from_node,
              local_count,
              *heartbeat.last_hash);
    }

    if (heartbeat.record_count <= local_count) {
      return std::nullopt;
    }
    if (not config_.allowsPull()) {
      SL_DEBUG(log_,
               "Peer {} is ahead ({} > {}), waiting for push",
               heartbeat.from_node,
               heartbeat.record_count,
               local_count);
      return std::nullopt;
    }

    SL_DEBUG(log_,
             "Peer {} is ahead ({} > {}), pulling",
             heartbeat.from_node,
             heartbeat.record_count,
             local_count);
    return SyncMessage{SyncRequest{
        .from_node = node_id_,
        .since = since,
        .vector_clock = local_clock_,
    }};
  }

  outcome::result<SyncResponse> SyncManagerImpl::createPushResponse(
      const NodeId &target) {
    if (not config_.allowsPush()) {
      return SyncError::STRATEGY_DISABLED;
    }
    OUTCOME_TRY(validatePeer(target));

    OUTCOME_TRY(matching, selectSince(watermarkFor(target)));
    if (const auto *state = findState(target)) {
      std::erase_if(matching, [&](const audit::AuditRecord &record) {
        return state->isSynced(record.id);
      });
    }
    const size_t batch_size = std::max<size_t>(config_.batch_size, 1);
    const bool has_more = matching.size() > batch_size;
    if (has_more) {
      matching.resize(batch_size);
    }

    auto response = packRecords(target, std::move(matching), has_more);
    SL_DEBUG(
        log_, "Pushing {} records to {}", response.records.size(), target);
    return response;
  }

  outcome::result<std::optional<SyncMessage>> SyncManagerImpl::handleMessage(
      const SyncMessage &message) {
    using Reply = outcome::result<std::optional<SyncMessage>>;
    return visit_in_place(
        message,
        [&](const SyncRequest &) -> Reply {
          OUTCOME_TRY(response, processSyncRequest(message));
          return std::optional<SyncMessage>{std::move(response)};
        },
        [&](const SyncResponse &) -> Reply {
          OUTCOME_TRY(ack, processSyncResponse(message));
          return std::optional<SyncMessage>{std::move(ack)};
        },
        [&](const SyncAck &) -> Reply {
          OUTCOME_TRY(processSyncAck(message));
          return std::nullopt;
        },
        [&](const Heartbeat &) -> Reply { return processHeartbeat(message); });
  }

  bool SyncManagerImpl::needsSync(const NodeId &peer) const {
    const auto *state = findState(peer);
    if (state == nullptr) {
      return true;
    }
    if (state->hasPending() or state->continuation_pending) {
      return true;
    }
    if (not state->last_sync) {
      return true;
    }
    return now() - *state->last_sync
         > std::chrono::seconds(config_.sync_interval_secs);
  }

  void SyncManagerImpl::recordFailure(const NodeId &peer) {
    if (peer.empty()) {
      return;
    }
    auto &state = ensureState(peer);
    state.recordFailure(now());
    if (state.failed_attempts >= config_.max_retries) {
      SL_WARN(log_,
              "Sync with {} failed {} times in a row, retry in {}s",
              peer,
              state.failed_attempts,
              retryDelay(peer).count());
    } else {
      SL_DEBUG(log_,
               "Sync with {} failed ({} of {})",
               peer,
               state.failed_attempts,
               config_.max_retries);
    }
  }

  std::chrono::seconds SyncManagerImpl::retryDelay(const NodeId &peer) const {
    const auto *state = findState(peer);
    if (state == nullptr or state->failed_attempts == 0
        or state->failed_attempts < config_.max_retries) {
      return std::chrono::seconds{0};
    }
    auto exponent = std::min(state->failed_attempts - config_.max_retries,
                             kMaxBackoffExponent);
    auto delay = std::max<uint64_t>(config_.sync_interval_secs, 1)
               << exponent;
    return std::chrono::seconds{std::min(delay, config_.max_backoff_secs)};
  }

  bool SyncManagerImpl::canAttempt(const NodeId &peer) const {
    auto delay = retryDelay(peer);
    if (delay.count() == 0) {
      return true;
    }
    const auto *state = findState(peer);
    if (state == nullptr or not state->last_failure) {
      return true;
    }
    return now() - *state->last_failure >= delay;
  }

  std::optional<std::reference_wrapper<const SyncState>>
  SyncManagerImpl::syncState(const NodeId &peer) const {
    if (const auto *state = findState(peer)) {
      return std::cref(*state);
    }
    return std::nullopt;
  }

  std::vector<NodeId> SyncManagerImpl::knownPeers() const {
    std::vector<NodeId> peers;
    peers.reserve(sync_states_.size());
    for (const auto &[peer, _] : sync_states_) {
      peers.push_back(peer);
    }
    std::sort(peers.begin(), peers.end());
    return peers;
  }

  bool SyncManagerImpl::forgetPeer(const NodeId &peer) {
    if (sync_states_.erase(peer) == 0) {
      return false;
    }
    SL_DEBUG(log_, "Forgot sync state of {}", peer);
    return true;
  }

  Timestamp SyncManagerImpl::now() const {
    return primitives::toTimestamp(clock_->now());
  }

  outcome::result<void> SyncManagerImpl::validatePeer(
      const NodeId &peer) const {
    if (peer.empty()) {
      return SyncError::INVALID_NODE_ID;
    }
    if (peer == node_id_) {
      return SyncError::SELF_MESSAGE;
    }
    return outcome::success();
  }

  Timestamp SyncManagerImpl::watermarkFor(const NodeId &peer) const {
    if (const auto *state = findState(peer); state and state->last_sync) {
      return *state->last_sync;
    }
    return now() - kDefaultLookback;
  }

  SyncState &SyncManagerImpl::ensureState(const NodeId &peer) {
    auto [it, inserted] = sync_states_.try_emplace(peer);
    if (inserted) {
      SL_DEBUG(log_, "Tracking new peer {}", peer);
    }
    return it->second;
  }

  const SyncState *SyncManagerImpl::findState(const NodeId &peer) const {
    auto it = sync_states_.find(peer);
    return it == sync_states_.end() ? nullptr : &it->second;
  }

  outcome::result<std::vector<audit::AuditRecord>>
  SyncManagerImpl::selectSince(Timestamp since) const {
    auto all_res = storage_->getAll();
    if (all_res.has_error()) {
      SL_ERROR(log_,
               "Can't read audit records: {}",
               all_res.error().message());
      return SyncError::STORAGE_FAILURE;
    }
    auto &all = all_res.value();

    std::vector<audit::AuditRecord> matching;
    std::copy_if(std::make_move_iterator(all.begin()),
                 std::make_move_iterator(all.end()),
                 std::back_inserter(matching),
                 [&](const audit::AuditRecord &record) {
                   return record.timestamp >= since;
                 });
    std::stable_sort(matching.begin(),
                     matching.end(),
                     [](const audit::AuditRecord &lhs,
                        const audit::AuditRecord &rhs) {
                       return lhs.timestamp < rhs.timestamp;
                     });
    return matching;
  }

  outcome::result<size_t> SyncManagerImpl::localCount() const {
    auto res = storage_->count();
    if (res.has_error()) {
      SL_ERROR(log_, "Can't count audit records: {}", res.error().message());
      return SyncError::STORAGE_FAILURE;
    }
    return res.value();
  }

  outcome::result<std::optional<std::string>> SyncManagerImpl::localLastHash()
      const {
    auto res = storage_->getLastHash();
    if (res.has_error()) {
      SL_ERROR(log_, "Can't read audit log head: {}", res.error().message());
      return SyncError::STORAGE_FAILURE;
    }
    return std::move(res.value());
  }

  SyncResponse SyncManagerImpl::packRecords(
      const NodeId &peer,
      std::vector<audit::AuditRecord> records,
      bool has_more) {
    SyncResponse response{
        .from_node = node_id_,
        .records = {},
        .vector_clock = {},
        .has_more = has_more,
    };
    response.records.reserve(records.size());

    auto &state = ensureState(peer);
    for (auto &record : records) {
      local_clock_.increment(node_id_);
      DistributedRecord distributed{
          .record = std::move(record),
          .origin_node = node_id_,
          .vector_clock = local_clock_,
      };
      state.addPending(distributed);
      response.records.emplace_back(std::move(distributed));
    }
    response.vector_clock = local_clock_;
    return response;
  }

}  // namespace auditsync::sync
