/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "audit/audit_record.hpp"
#include "sync/vector_clock.hpp"

namespace auditsync::sync {

  /**
   * Audit record prepared for transmission: the node which sent it and the
   * causal stamp taken at that moment. Never modified after creation.
   */
  struct DistributedRecord {
    audit::AuditRecord record;
    NodeId origin_node;
    VectorClock vector_clock;

    const primitives::RecordId &id() const {
      return record.id;
    }

    bool operator==(const DistributedRecord &other) const = default;

    template <class Stream,
              typename = std::enable_if_t<Stream::is_encoder_stream>>
    friend Stream &operator<<(Stream &s, const DistributedRecord &v) {
      return s << v.record << v.origin_node << v.vector_clock;
    }

    template <class Stream,
              typename = std::enable_if_t<Stream::is_decoder_stream>>
    friend Stream &operator>>(Stream &s, DistributedRecord &v) {
      return s >> v.record >> v.origin_node >> v.vector_clock;
    }
  };

}  // namespace auditsync::sync
