/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "audit/audit_record.hpp"

#include <fmt/format.h>

#include "common/hexutil.hpp"
#include "crypto/sha/sha256.hpp"

namespace auditsync::audit {

  AuditRecord AuditRecord::create(EventType event_type,
                                  std::string actor,
                                  std::string statute_id,
                                  std::string subject_id,
                                  std::string result,
                                  Timestamp timestamp,
                                  std::optional<std::string> previous_hash) {
    AuditRecord record{
        .id = RecordId::generate(),
        .timestamp = timestamp,
        .event_type = event_type,
        .actor = std::move(actor),
        .statute_id = std::move(statute_id),
        .subject_id = std::move(subject_id),
        .result = std::move(result),
        .previous_hash = std::move(previous_hash),
        .record_hash = {},
    };
    record.record_hash = record.computeHash();
    return record;
  }

  std::string AuditRecord::computeHash() const {
    // fields are length-prefixed so that no two records share an encoding
    auto field = [](std::string_view value) {
      return fmt::format("{}:{};", value.size(), value);
    };
    auto data = fmt::format("{}{};{};{}{}{}{}{}",
                            field(id.toString()),
                            primitives::toUnixMillis(timestamp),
                            static_cast<unsigned>(event_type),
                            field(actor),
                            field(statute_id),
                            field(subject_id),
                            field(result),
                            field(previous_hash.value_or("")));
    return common::hex_lower(crypto::sha256(data));
  }

  bool AuditRecord::verify() const {
    return computeHash() == record_hash;
  }

}  // namespace auditsync::audit
