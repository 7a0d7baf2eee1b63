/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <map>
#include <utility>
#include <vector>

#include "primitives/node_id.hpp"

namespace auditsync::sync {

  using primitives::NodeId;

  /**
   * Causality tracker: a counter per node which only ever grows.
   * Nodes absent from the map have counter zero.
   */
  class VectorClock {
   public:
    using Counter = uint64_t;
    using Entries = std::map<NodeId, Counter>;

    VectorClock() = default;

    /// Advances the counter of the given node by exactly one
    void increment(const NodeId &node_id);

    Counter get(const NodeId &node_id) const;

    /**
     * Raises the counter of the given node to the value, a lower value is
     * ignored
     */
    void set(const NodeId &node_id, Counter value);

    /// Pointwise maximum with another clock
    void merge(const VectorClock &other);

    /**
     * @return true if every counter is less or equal to the one of other and
     * at least one is strictly less
     */
    bool happenedBefore(const VectorClock &other) const;

    /// @return true if clocks differ and neither happened before the other
    bool isConcurrent(const VectorClock &other) const;

    const Entries &entries() const {
      return counters_;
    }

    bool operator==(const VectorClock &other) const;

    template <class Stream,
              typename = std::enable_if_t<Stream::is_encoder_stream>>
    friend Stream &operator<<(Stream &s, const VectorClock &v) {
      std::vector<std::pair<NodeId, Counter>> entries(v.counters_.begin(),
                                                      v.counters_.end());
      return s << entries;
    }

    template <class Stream,
              typename = std::enable_if_t<Stream::is_decoder_stream>>
    friend Stream &operator>>(Stream &s, VectorClock &v) {
      std::vector<std::pair<NodeId, Counter>> entries;
      s >> entries;
      v.counters_.clear();
      for (auto &[node_id, counter] : entries) {
        v.set(node_id, counter);
      }
      return s;
    }

   private:
    Entries counters_;
  };

}  // namespace auditsync::sync
