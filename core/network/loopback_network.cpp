/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/loopback_network.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(auditsync::network, LoopbackNetworkError, e) {
  using E = auditsync::network::LoopbackNetworkError;
  switch (e) {
    case E::UNKNOWN_PEER:
      return "No node is attached under the receiver id";
    case E::LINK_DOWN:
      return "Link between the nodes is down";
  }
  return "Unknown LoopbackNetworkError";
}

namespace auditsync::network {

  namespace {
    std::pair<NodeId, NodeId> linkKey(const NodeId &a, const NodeId &b) {
      return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
    }
  }  // namespace

  LoopbackNetwork::LoopbackNetwork()
      : log_{log::createLogger("LoopbackNetwork", "network")} {}

  void LoopbackNetwork::attach(const NodeId &node, Handler handler) {
    handlers_[node] = std::move(handler);
  }

  void LoopbackNetwork::detach(const NodeId &node) {
    handlers_.erase(node);
  }

  outcome::result<void> LoopbackNetwork::send(const NodeId &from,
                                              const NodeId &to,
                                              std::vector<uint8_t> bytes) {
    if (not handlers_.contains(to)) {
      return LoopbackNetworkError::UNKNOWN_PEER;
    }
    if (isLinkDown(from, to)) {
      SL_TRACE(log_, "Dropped {} bytes from {} to {}", bytes.size(), from, to);
      return LoopbackNetworkError::LINK_DOWN;
    }
    queue_.push_back(Envelope{
        .from = from,
        .to = to,
        .bytes = std::move(bytes),
    });
    return outcome::success();
  }

  size_t LoopbackNetwork::deliver() {
    size_t delivered = 0;
    while (not queue_.empty() and delivered < kMaxDeliveries) {
      auto envelope = std::move(queue_.front());
      queue_.pop_front();

      auto it = handlers_.find(envelope.to);
      if (it == handlers_.end()) {
        SL_DEBUG(log_, "Receiver {} went away, message dropped", envelope.to);
        continue;
      }
      // handler may send, copy it out of the map first
      auto handler = it->second;
      handler(envelope.from, envelope.bytes);
      ++delivered;
    }
    if (not queue_.empty()) {
      SL_WARN(log_,
              "Delivery limit reached, {} messages stay queued",
              queue_.size());
    }
    return delivered;
  }

  void LoopbackNetwork::setLinkDown(const NodeId &a,
                                    const NodeId &b,
                                    bool down) {
    if (down) {
      down_links_.insert(linkKey(a, b));
    } else {
      down_links_.erase(linkKey(a, b));
    }
  }

  bool LoopbackNetwork::isLinkDown(const NodeId &a, const NodeId &b) const {
    return down_links_.contains(linkKey(a, b));
  }

}  // namespace auditsync::network
