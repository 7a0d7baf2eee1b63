/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "sync/sync_manager.hpp"

#include <memory>
#include <unordered_map>

#include "audit/audit_storage.hpp"
#include "clock/clock.hpp"
#include "log/logger.hpp"

namespace auditsync::sync {

  class SyncManagerImpl final : public SyncManager {
   public:
    /// Watermark used for peers never synced before
    static constexpr std::chrono::hours kDefaultLookback{24};

    SyncManagerImpl(NodeId node_id,
                    SyncConfig config,
                    std::shared_ptr<audit::AuditStorage> storage,
                    std::shared_ptr<clock::SystemClock> clock);

    const NodeId &nodeId() const override {
      return node_id_;
    }

    const SyncConfig &config() const override {
      return config_;
    }

    const VectorClock &localClock() const override {
      return local_clock_;
    }

    outcome::result<SyncRequest> createSyncRequest(
        const NodeId &target, const VectorClock &clock) const override;

    outcome::result<SyncResponse> processSyncRequest(
        const SyncMessage &message) override;

    outcome::result<SyncAck> processSyncResponse(
        const SyncMessage &message) override;

    outcome::result<void> processSyncAck(const SyncMessage &message) override;

    outcome::result<Heartbeat> createHeartbeat() const override;

    outcome::result<std::optional<SyncMessage>> processHeartbeat(
        const SyncMessage &message) override;

    outcome::result<SyncResponse> createPushResponse(
        const NodeId &target) override;

    outcome::result<std::optional<SyncMessage>> handleMessage(
        const SyncMessage &message) override;

    bool needsSync(const NodeId &peer) const override;

    void recordFailure(const NodeId &peer) override;

    std::chrono::seconds retryDelay(const NodeId &peer) const override;

    bool canAttempt(const NodeId &peer) const override;

    std::optional<std::reference_wrapper<const SyncState>> syncState(
        const NodeId &peer) const override;

    std::vector<NodeId> knownPeers() const override;

    bool forgetPeer(const NodeId &peer) override;

   private:
    Timestamp now() const;

    /// Rejects empty ids and messages claiming to come from this node
    outcome::result<void> validatePeer(const NodeId &peer) const;

    Timestamp watermarkFor(const NodeId &peer) const;

    SyncState &ensureState(const NodeId &peer);

    const SyncState *findState(const NodeId &peer) const;

    /// Local records not older than the watermark, oldest first
    outcome::result<std::vector<audit::AuditRecord>> selectSince(
        Timestamp since) const;

    outcome::result<size_t> localCount() const;

    outcome::result<std::optional<std::string>> localLastHash() const;

    /**
     * Wraps records into a response, advancing the local clock once per
     * record, and queues them as pending for the peer
     */
    SyncResponse packRecords(const NodeId &peer,
                             std::vector<audit::AuditRecord> records,
                             bool has_more);

    NodeId node_id_;
    SyncConfig config_;
    std::shared_ptr<audit::AuditStorage> storage_;
    std::shared_ptr<clock::SystemClock> clock_;
    VectorClock local_clock_;
    std::unordered_map<NodeId, SyncState> sync_states_;
    log::Logger log_;
  };

}  // namespace auditsync::sync
