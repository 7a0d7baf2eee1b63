/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "audit/audit_record.hpp"
#include "outcome/outcome.hpp"

namespace auditsync::audit {

  /**
   * Read surface of the append-only audit log consumed by synchronization.
   * Implementations may block on I/O and must be safe to share between
   * threads.
   */
  class AuditStorage {
   public:
    virtual ~AuditStorage() = default;

    /// Number of records in the log
    virtual outcome::result<size_t> count() const = 0;

    /// Hash of the most recently stored record, none for an empty log
    virtual outcome::result<std::optional<std::string>> getLastHash()
        const = 0;

    /// Every record in storage order
    virtual outcome::result<std::vector<AuditRecord>> getAll() const = 0;
  };

}  // namespace auditsync::audit
