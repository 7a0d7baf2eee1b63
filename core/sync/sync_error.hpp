/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace auditsync::sync {

  enum class SyncError : uint8_t {
    /// handler received a message variant it does not process
    UNEXPECTED_MESSAGE = 1,
    /// audit storage failed to serve a read
    STORAGE_FAILURE,
    /// node id of a peer is empty
    INVALID_NODE_ID,
    /// message claims to come from this very node
    SELF_MESSAGE,
    /// received record does not match its hash
    TAMPERED_RECORD,
    /// operation is not permitted by the configured strategy
    STRATEGY_DISABLED,
  };

}  // namespace auditsync::sync

OUTCOME_HPP_DECLARE_ERROR(auditsync::sync, SyncError);
