/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "audit/audit_storage.hpp"

#include <shared_mutex>
#include <unordered_map>

#include "log/logger.hpp"

namespace auditsync::audit {

  /**
   * Audit log kept in memory. Locally produced records are chained to the
   * current head; records replicated from peers are stored as received after
   * their hash is checked.
   */
  class InMemoryAuditStorage : public AuditStorage {
   public:
    InMemoryAuditStorage();

    outcome::result<size_t> count() const override;

    outcome::result<std::optional<std::string>> getLastHash() const override;

    outcome::result<std::vector<AuditRecord>> getAll() const override;

    /**
     * Links the record to the current head, recomputes its hash and stores it
     * @return id of the stored record
     */
    outcome::result<RecordId> append(AuditRecord record);

    /**
     * Stores a record received from another replica as is
     */
    outcome::result<void> importRecord(const AuditRecord &record);

    outcome::result<AuditRecord> get(const RecordId &id) const;

    bool contains(const RecordId &id) const;

    /**
     * @return false if any stored record fails its hash check or a locally
     * appended record does not link to its predecessor
     */
    bool verifyIntegrity() const;

   private:
    outcome::result<void> storeLocked(AuditRecord record, bool local);

    mutable std::shared_mutex mutex_;
    std::vector<AuditRecord> records_;
    /// whether records_[i] was appended locally
    std::vector<bool> local_;
    std::unordered_map<RecordId, size_t> index_;
    std::optional<std::string> last_hash_;
    log::Logger log_;
  };

}  // namespace auditsync::audit
