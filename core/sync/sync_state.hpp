/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <unordered_set>
#include <vector>

#include "primitives/timestamp.hpp"
#include "sync/distributed_record.hpp"

namespace auditsync::sync {

  using primitives::RecordId;
  using primitives::Timestamp;

  /**
   * Bookkeeping kept by a node for one of its peers
   */
  struct SyncState {
    /// watermark of the last completed exchange, none until one completes
    std::optional<Timestamp> last_sync = std::nullopt;
    /// records the peer is known to have
    std::unordered_set<RecordId> synced_records;
    /// records sent to the peer and not acknowledged yet
    std::vector<DistributedRecord> pending_records;
    /// consecutive failed exchanges
    uint32_t failed_attempts = 0;
    std::optional<Timestamp> last_failure = std::nullopt;
    /// peer advertised a log of the same size with a different head
    bool diverged = false;
    /// last response from the peer was truncated to the batch size
    bool continuation_pending = false;

    bool isSynced(const RecordId &id) const {
      return synced_records.contains(id);
    }

    bool isPending(const RecordId &id) const;

    bool hasPending() const {
      return not pending_records.empty();
    }

    /// Marks the record as held by the peer, dropping it from pending
    void markSynced(const RecordId &id);

    /**
     * Queues a record sent to the peer.
     * @return false if the record is already synced or pending
     */
    bool addPending(DistributedRecord record);

    void recordFailure(Timestamp now);

    /// Completed exchange: moves the watermark and clears failures
    void recordSuccess(Timestamp watermark);
  };

}  // namespace auditsync::sync
