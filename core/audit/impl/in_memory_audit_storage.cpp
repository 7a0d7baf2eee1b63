/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "audit/impl/in_memory_audit_storage.hpp"

#include <mutex>

#include "audit/audit_storage_error.hpp"

namespace auditsync::audit {

  InMemoryAuditStorage::InMemoryAuditStorage()
      : log_{log::createLogger("AuditStorage", "audit_storage")} {}

  outcome::result<size_t> InMemoryAuditStorage::count() const {
    std::shared_lock lock{mutex_};
    return records_.size();
  }

  outcome::result<std::optional<std::string>>
  InMemoryAuditStorage::getLastHash() const {
    std::shared_lock lock{mutex_};
    return last_hash_;
  }

  outcome::result<std::vector<AuditRecord>> InMemoryAuditStorage::getAll()
      const {
    std::shared_lock lock{mutex_};
    return records_;
  }

  outcome::result<RecordId> InMemoryAuditStorage::append(AuditRecord record) {
    std::unique_lock lock{mutex_};
    record.previous_hash = last_hash_;
    record.record_hash = record.computeHash();
    auto id = record.id;
    OUTCOME_TRY(storeLocked(std::move(record), true));
    SL_DEBUG(log_, "Audit record created: {}", id);
    return id;
  }

  outcome::result<void> InMemoryAuditStorage::importRecord(
      const AuditRecord &record) {
    if (not record.verify()) {
      SL_WARN(log_, "Rejected replicated record {}: hash mismatch", record.id);
      return AuditStorageError::INVALID_RECORD_HASH;
    }
    std::unique_lock lock{mutex_};
    OUTCOME_TRY(storeLocked(record, false));
    SL_DEBUG(log_, "Audit record replicated: {}", record.id);
    return outcome::success();
  }

  outcome::result<void> InMemoryAuditStorage::storeLocked(AuditRecord record,
                                                          bool local) {
    if (index_.contains(record.id)) {
      return AuditStorageError::DUPLICATE_RECORD;
    }
    index_.emplace(record.id, records_.size());
    last_hash_ = record.record_hash;
    records_.emplace_back(std::move(record));
    local_.push_back(local);
    return outcome::success();
  }

  outcome::result<AuditRecord> InMemoryAuditStorage::get(
      const RecordId &id) const {
    std::shared_lock lock{mutex_};
    auto it = index_.find(id);
    if (it == index_.end()) {
      return AuditStorageError::RECORD_NOT_FOUND;
    }
    return records_[it->second];
  }

  bool InMemoryAuditStorage::contains(const RecordId &id) const {
    std::shared_lock lock{mutex_};
    return index_.contains(id);
  }

  bool InMemoryAuditStorage::verifyIntegrity() const {
    std::shared_lock lock{mutex_};
    for (size_t i = 0; i < records_.size(); ++i) {
      const auto &record = records_[i];
      if (not record.verify()) {
        SL_WARN(log_, "Tamper detected: record {} hash mismatch", record.id);
        return false;
      }
      if (not local_[i]) {
        continue;
      }
      std::optional<std::string> expected_previous;
      if (i > 0) {
        expected_previous = records_[i - 1].record_hash;
      }
      if (record.previous_hash != expected_previous) {
        SL_WARN(log_, "Tamper detected: record {} breaks the chain", record.id);
        return false;
      }
    }
    return true;
  }

}  // namespace auditsync::audit
