/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <boost/variant.hpp>

#include "primitives/record_id.hpp"
#include "primitives/timestamp.hpp"
#include "sync/distributed_record.hpp"
#include "sync/vector_clock.hpp"

namespace auditsync::sync {

  using primitives::RecordId;
  using primitives::Timestamp;

  /**
   * Pull of every record stored since the watermark
   */
  struct SyncRequest {
    NodeId from_node;
    /// watermark: only records with timestamp >= since are requested
    Timestamp since{};
    VectorClock vector_clock;

    bool operator==(const SyncRequest &other) const = default;

    template <class Stream,
              typename = std::enable_if_t<Stream::is_encoder_stream>>
    friend Stream &operator<<(Stream &s, const SyncRequest &v) {
      return s << v.from_node << primitives::toUnixMillis(v.since)
               << v.vector_clock;
    }

    template <class Stream,
              typename = std::enable_if_t<Stream::is_decoder_stream>>
    friend Stream &operator>>(Stream &s, SyncRequest &v) {
      int64_t since = 0;
      s >> v.from_node >> since >> v.vector_clock;
      v.since = primitives::fromUnixMillis(since);
      return s;
    }
  };

  /**
   * One batch of records, answer to SyncRequest or an unsolicited push
   */
  struct SyncResponse {
    NodeId from_node;
    std::vector<DistributedRecord> records;
    VectorClock vector_clock;
    /// more records matched than fit into the batch
    bool has_more = false;

    bool operator==(const SyncResponse &other) const = default;

    template <class Stream,
              typename = std::enable_if_t<Stream::is_encoder_stream>>
    friend Stream &operator<<(Stream &s, const SyncResponse &v) {
      return s << v.from_node << v.records << v.vector_clock << v.has_more;
    }

    template <class Stream,
              typename = std::enable_if_t<Stream::is_decoder_stream>>
    friend Stream &operator>>(Stream &s, SyncResponse &v) {
      return s >> v.from_node >> v.records >> v.vector_clock >> v.has_more;
    }
  };

  /**
   * Confirmation of records received in a SyncResponse
   */
  struct SyncAck {
    NodeId from_node;
    std::vector<RecordId> record_ids;
    VectorClock vector_clock;

    bool operator==(const SyncAck &other) const = default;

    template <class Stream,
              typename = std::enable_if_t<Stream::is_encoder_stream>>
    friend Stream &operator<<(Stream &s, const SyncAck &v) {
      return s << v.from_node << v.record_ids << v.vector_clock;
    }

    template <class Stream,
              typename = std::enable_if_t<Stream::is_decoder_stream>>
    friend Stream &operator>>(Stream &s, SyncAck &v) {
      return s >> v.from_node >> v.record_ids >> v.vector_clock;
    }
  };

  /**
   * Liveness beacon advertising the size and head of the sender's log
   */
  struct Heartbeat {
    NodeId from_node;
    VectorClock vector_clock;
    uint64_t record_count = 0;
    std::optional<std::string> last_hash;

    bool operator==(const Heartbeat &other) const = default;

    template <class Stream,
              typename = std::enable_if_t<Stream::is_encoder_stream>>
    friend Stream &operator<<(Stream &s, const Heartbeat &v) {
      return s << v.from_node << v.vector_clock << v.record_count
               << v.last_hash;
    }

    template <class Stream,
              typename = std::enable_if_t<Stream::is_decoder_stream>>
    friend Stream &operator>>(Stream &s, Heartbeat &v) {
      return s >> v.from_node >> v.vector_clock >> v.record_count
          >> v.last_hash;
    }
  };

  using SyncMessage =
      /// Note: order of types in variant matters
      boost::variant<SyncRequest,   // 0
                     SyncResponse,  // 1
                     SyncAck,       // 2
                     Heartbeat>;    // 3

  /// Name of the held variant, for logs
  std::string_view messageName(const SyncMessage &message);

  /// Sender of any message
  NodeId messageSender(const SyncMessage &message);

}  // namespace auditsync::sync
