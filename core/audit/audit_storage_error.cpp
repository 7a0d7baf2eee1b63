/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "audit/audit_storage_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(auditsync::audit, AuditStorageError, e) {
  using E = auditsync::audit::AuditStorageError;
  switch (e) {
    case E::RECORD_NOT_FOUND:
      return "Audit record not found";
    case E::DUPLICATE_RECORD:
      return "Audit record with the same id is already stored";
    case E::INVALID_RECORD_HASH:
      return "Audit record hash does not match its content";
  }
  return "Unknown AuditStorageError";
}
