/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <span>
#include <string>
#include <vector>

#include "audit/impl/in_memory_audit_storage.hpp"
#include "clock/clock.hpp"
#include "log/logger.hpp"
#include "network/loopback_network.hpp"
#include "sync/message_codec.hpp"
#include "sync/sync_manager.hpp"

namespace auditsync::node {

  using primitives::NodeId;

  /**
   * One audit log replica: owns the log and its sync manager and talks to
   * the other replicas through the loopback network
   */
  class Replica {
   public:
    Replica(NodeId node_id,
            sync::SyncConfig config,
            std::shared_ptr<clock::SystemClock> clock,
            std::shared_ptr<network::LoopbackNetwork> network);

    Replica(const Replica &) = delete;
    Replica &operator=(const Replica &) = delete;

    ~Replica();

    const NodeId &nodeId() const;

    /// Appends a locally produced record to the log
    outcome::result<primitives::RecordId> recordEvent(audit::EventType type,
                                                      std::string actor,
                                                      std::string statute_id,
                                                      std::string subject_id,
                                                      std::string result);

    /**
     * One scheduling step: heartbeats every peer, then pushes or pulls to
     * peers that need a sync and are not backing off
     */
    void tick(const std::vector<NodeId> &peers);

    const audit::InMemoryAuditStorage &storage() const {
      return *storage_;
    }

    const sync::SyncManager &syncManager() const {
      return *sync_manager_;
    }

   private:
    void onMessage(const NodeId &from, std::span<const uint8_t> bytes);

    /// Stores records of a validated response that are not in the log yet
    outcome::result<size_t> importRecords(const sync::SyncResponse &response);

    void send(const NodeId &to, const sync::SyncMessage &message);

    NodeId node_id_;
    std::shared_ptr<clock::SystemClock> clock_;
    std::shared_ptr<network::LoopbackNetwork> network_;
    std::shared_ptr<audit::InMemoryAuditStorage> storage_;
    std::unique_ptr<sync::SyncManager> sync_manager_;
    sync::MessageCodec codec_;
    log::Logger log_;
  };

}  // namespace auditsync::node
