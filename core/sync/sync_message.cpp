/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sync/sync_message.hpp"

#include "common/visitor.hpp"

namespace auditsync::sync {

  std::string_view messageName(const SyncMessage &message) {
    return visit_in_place(
        message,
        [](const SyncRequest &) -> std::string_view { return "SyncRequest"; },
        [](const SyncResponse &) -> std::string_view {
          return "SyncResponse";
        },
        [](const SyncAck &) -> std::string_view { return "SyncAck"; },
        [](const Heartbeat &) -> std::string_view { return "Heartbeat"; });
  }

  NodeId messageSender(const SyncMessage &message) {
    return visit_in_place(
        message, [](const auto &msg) -> NodeId { return msg.from_node; });
  }

}  // namespace auditsync::sync
