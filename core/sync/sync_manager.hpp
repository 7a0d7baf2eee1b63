/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <vector>

#include "outcome/outcome.hpp"
#include "sync/sync_config.hpp"
#include "sync/sync_message.hpp"
#include "sync/sync_state.hpp"

namespace auditsync::sync {

  /**
   * Drives replication of the audit log with peers: builds and consumes
   * protocol messages and keeps per-peer sync state.
   *
   * Not internally synchronized: callers serialize access to one instance.
   * A failed call leaves the state untouched.
   */
  class SyncManager {
   public:
    virtual ~SyncManager() = default;

    virtual const NodeId &nodeId() const = 0;

    virtual const SyncConfig &config() const = 0;

    virtual const VectorClock &localClock() const = 0;

    /**
     * Builds a pull request for records of the target.
     * Watermark is the last sync with the target, or 24 hours ago if there
     * was none.
     * @param target peer to pull from
     * @param clock causal stamp to send
     */
    virtual outcome::result<SyncRequest> createSyncRequest(
        const NodeId &target, const VectorClock &clock) const = 0;

    /**
     * Answers a SyncRequest with a batch of local records not older than the
     * watermark. Sent records stay pending for the requester until acked.
     * @return SyncError::UNEXPECTED_MESSAGE for any other variant
     */
    virtual outcome::result<SyncResponse> processSyncRequest(
        const SyncMessage &message) = 0;

    /**
     * Accepts records of a SyncResponse for the responding peer and
     * acknowledges all of them. Persisting the records is up to the caller.
     */
    virtual outcome::result<SyncAck> processSyncResponse(
        const SyncMessage &message) = 0;

    /// Marks acknowledged records as synced and clears failures of the peer
    virtual outcome::result<void> processSyncAck(
        const SyncMessage &message) = 0;

    /// Advertises size and head of the local log
    virtual outcome::result<Heartbeat> createHeartbeat() const = 0;

    /**
     * Registers liveness of the sender.
     * @return SyncRequest to the sender if it holds more records than the
     * local log, none otherwise
     */
    virtual outcome::result<std::optional<SyncMessage>> processHeartbeat(
        const SyncMessage &message) = 0;

    /**
     * Builds an unsolicited response with records the target is not known to
     * have. Available for Push and Hybrid strategies.
     */
    virtual outcome::result<SyncResponse> createPushResponse(
        const NodeId &target) = 0;

    /**
     * Dispatches any message to its handler.
     * @return reply to send back to the sender, if any
     */
    virtual outcome::result<std::optional<SyncMessage>> handleMessage(
        const SyncMessage &message) = 0;

    /**
     * @return true if the peer was never synced, its sync interval elapsed,
     * it has unacknowledged records or the last batch from it was truncated
     */
    virtual bool needsSync(const NodeId &peer) const = 0;

    /// Registers a failed exchange (transport error, malformed response)
    virtual void recordFailure(const NodeId &peer) = 0;

    /**
     * Delay to keep between attempts: zero below max_retries consecutive
     * failures, then sync interval doubling with each further failure, capped
     * by max_backoff_secs
     */
    virtual std::chrono::seconds retryDelay(const NodeId &peer) const = 0;

    /// @return true if the retry delay since the last failure has elapsed
    virtual bool canAttempt(const NodeId &peer) const = 0;

    virtual std::optional<std::reference_wrapper<const SyncState>> syncState(
        const NodeId &peer) const = 0;

    virtual std::vector<NodeId> knownPeers() const = 0;

    /**
     * Drops all state kept for the peer
     * @return false if the peer was unknown
     */
    virtual bool forgetPeer(const NodeId &peer) = 0;
  };

}  // namespace auditsync::sync
