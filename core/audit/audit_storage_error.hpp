/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace auditsync::audit {

  enum class AuditStorageError : uint8_t {
    RECORD_NOT_FOUND = 1,
    DUPLICATE_RECORD,
    INVALID_RECORD_HASH,
  };

}  // namespace auditsync::audit

OUTCOME_HPP_DECLARE_ERROR(auditsync::audit, AuditStorageError);
