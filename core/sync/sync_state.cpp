/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sync/sync_state.hpp"

#include <algorithm>

namespace auditsync::sync {

  bool SyncState::isPending(const RecordId &id) const {
    return std::any_of(
        pending_records.begin(),
        pending_records.end(),
        [&](const DistributedRecord &record) { return record.id() == id; });
  }

  void SyncState::markSynced(const RecordId &id) {
    synced_records.insert(id);
    std::erase_if(pending_records, [&](const DistributedRecord &record) {
      return record.id() == id;
    });
  }

  bool SyncState::addPending(DistributedRecord record) {
    if (isSynced(record.id()) or isPending(record.id())) {
      return false;
    }
    pending_records.emplace_back(std::move(record));
    return true;
  }

  void SyncState::recordFailure(Timestamp now) {
    ++failed_attempts;
    last_failure = now;
  }

  void SyncState::recordSuccess(Timestamp watermark) {
    last_sync = watermark;
    failed_attempts = 0;
    last_failure.reset();
  }

}  // namespace auditsync::sync
