/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sync/vector_clock.hpp"

#include <algorithm>
#include <set>

namespace auditsync::sync {

  void VectorClock::increment(const NodeId &node_id) {
    ++counters_[node_id];
  }

  VectorClock::Counter VectorClock::get(const NodeId &node_id) const {
    auto it = counters_.find(node_id);
    return it == counters_.end() ? 0 : it->second;
  }

  void VectorClock::set(const NodeId &node_id, Counter value) {
    if (value == 0) {
      return;
    }
    auto &counter = counters_[node_id];
    counter = std::max(counter, value);
  }

  void VectorClock::merge(const VectorClock &other) {
    for (const auto &[node_id, counter] : other.counters_) {
      set(node_id, counter);
    }
  }

  bool VectorClock::happenedBefore(const VectorClock &other) const {
    std::set<NodeId> nodes;
    for (const auto &[node_id, _] : counters_) {
      nodes.insert(node_id);
    }
    for (const auto &[node_id, _] : other.counters_) {
      nodes.insert(node_id);
    }

    bool strictly_less = false;
    for (const auto &node_id : nodes) {
      auto mine = get(node_id);
      auto theirs = other.get(node_id);
      if (mine > theirs) {
        return false;
      }
      if (mine < theirs) {
        strictly_less = true;
      }
    }
    return strictly_less;
  }

  bool VectorClock::isConcurrent(const VectorClock &other) const {
    return *this != other and not happenedBefore(other)
       and not other.happenedBefore(*this);
  }

  bool VectorClock::operator==(const VectorClock &other) const {
    // zero counters are never stored, so maps compare directly
    return counters_ == other.counters_;
  }

}  // namespace auditsync::sync
