/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sync/sync_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(auditsync::sync, SyncError, e) {
  using E = auditsync::sync::SyncError;
  switch (e) {
    case E::UNEXPECTED_MESSAGE:
      return "Unexpected sync message type";
    case E::STORAGE_FAILURE:
      return "Audit storage is not available";
    case E::INVALID_NODE_ID:
      return "Empty node id";
    case E::SELF_MESSAGE:
      return "Sync message originates from the local node";
    case E::TAMPERED_RECORD:
      return "Received audit record fails its hash check";
    case E::STRATEGY_DISABLED:
      return "Operation is disabled by the sync strategy";
  }
  return "Unknown SyncError";
}
