/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <set>
#include <span>
#include <unordered_map>
#include <utility>
#include <vector>

#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "primitives/node_id.hpp"

namespace auditsync::network {

  using primitives::NodeId;

  enum class LoopbackNetworkError : uint8_t {
    UNKNOWN_PEER = 1,
    LINK_DOWN,
  };

  /**
   * In-process transport: messages are queued on send and handed to the
   * receiver's handler by deliver()
   */
  class LoopbackNetwork {
   public:
    using Handler =
        std::function<void(const NodeId &from, std::span<const uint8_t> bytes)>;

    /// Upper bound of messages handled by one deliver() call
    static constexpr size_t kMaxDeliveries = 100000;

    LoopbackNetwork();

    void attach(const NodeId &node, Handler handler);

    void detach(const NodeId &node);

    /// Queues the bytes for the receiver
    outcome::result<void> send(const NodeId &from,
                               const NodeId &to,
                               std::vector<uint8_t> bytes);

    /**
     * Hands queued messages to their receivers until the queue drains,
     * including messages sent by the handlers themselves
     * @return number of delivered messages
     */
    size_t deliver();

    /// Makes sends between the two nodes fail in both directions
    void setLinkDown(const NodeId &a, const NodeId &b, bool down);

    size_t queued() const {
      return queue_.size();
    }

   private:
    struct Envelope {
      NodeId from;
      NodeId to;
      std::vector<uint8_t> bytes;
    };

    bool isLinkDown(const NodeId &a, const NodeId &b) const;

    std::unordered_map<NodeId, Handler> handlers_;
    std::deque<Envelope> queue_;
    std::set<std::pair<NodeId, NodeId>> down_links_;
    log::Logger log_;
  };

}  // namespace auditsync::network

OUTCOME_HPP_DECLARE_ERROR(auditsync::network, LoopbackNetworkError);
