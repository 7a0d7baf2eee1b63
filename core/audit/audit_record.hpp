/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>

#include "primitives/record_id.hpp"
#include "primitives/timestamp.hpp"

namespace auditsync::audit {

  using primitives::RecordId;
  using primitives::Timestamp;

  /// Type of audited event
  enum class EventType : uint8_t {
    /// Automatic decision by the system
    AutomaticDecision = 0,
    /// Decision requiring human review
    DiscretionaryReview,
    /// Human override of an automatic decision
    HumanOverride,
    /// Appeal or review request
    Appeal,
    /// Statute was modified
    StatuteModified,
    /// Simulation run
    SimulationRun,
  };

  /**
   * Entry of the append-only audit log. Each record carries the hash of its
   * predecessor, so changing any record invalidates every later hash of the
   * same chain.
   */
  struct AuditRecord {
    RecordId id;
    Timestamp timestamp{};
    EventType event_type = EventType::AutomaticDecision;
    /// who triggered the event, e.g. "system:evaluator" or "user:alice"
    std::string actor;
    std::string statute_id;
    std::string subject_id;
    /// serialized decision outcome
    std::string result;
    /// hash of the preceding record, none for the chain head
    std::optional<std::string> previous_hash;
    /// hex SHA-256 over all the fields above
    std::string record_hash;

    /**
     * Creates a record with a fresh id and computes its hash
     */
    static AuditRecord create(EventType event_type,
                              std::string actor,
                              std::string statute_id,
                              std::string subject_id,
                              std::string result,
                              Timestamp timestamp,
                              std::optional<std::string> previous_hash);

    std::string computeHash() const;

    /// @return true if stored hash matches the content
    bool verify() const;

    bool operator==(const AuditRecord &other) const = default;

    template <class Stream,
              typename = std::enable_if_t<Stream::is_encoder_stream>>
    friend Stream &operator<<(Stream &s, const AuditRecord &v) {
      return s << v.id << primitives::toUnixMillis(v.timestamp)
               << static_cast<uint8_t>(v.event_type) << v.actor
               << v.statute_id << v.subject_id << v.result << v.previous_hash
               << v.record_hash;
    }

    template <class Stream,
              typename = std::enable_if_t<Stream::is_decoder_stream>>
    friend Stream &operator>>(Stream &s, AuditRecord &v) {
      int64_t millis = 0;
      uint8_t event_type = 0;
      s >> v.id >> millis >> event_type >> v.actor >> v.statute_id
          >> v.subject_id >> v.result >> v.previous_hash >> v.record_hash;
      v.timestamp = primitives::fromUnixMillis(millis);
      v.event_type = static_cast<EventType>(event_type);
      return s;
    }
  };

}  // namespace auditsync::audit
