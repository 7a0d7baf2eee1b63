/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "node/replica.hpp"

#include <boost/assert.hpp>

#include "common/visitor.hpp"
#include "sync/impl/sync_manager_impl.hpp"

namespace auditsync::node {

  Replica::Replica(NodeId node_id,
                   sync::SyncConfig config,
                   std::shared_ptr<clock::SystemClock> clock,
                   std::shared_ptr<network::LoopbackNetwork> network)
      : node_id_{std::move(node_id)},
        clock_{std::move(clock)},
        network_{std::move(network)},
        storage_{std::make_shared<audit::InMemoryAuditStorage>()},
        log_{log::createLogger("Replica", "replica")} {
    BOOST_ASSERT(clock_);
    BOOST_ASSERT(network_);
    sync_manager_ = std::make_unique<sync::SyncManagerImpl>(
        node_id_, config, storage_, clock_);
    network_->attach(
        node_id_, [this](const NodeId &from, std::span<const uint8_t> bytes) {
          onMessage(from, bytes);
        });
  }

  Replica::~Replica() {
    network_->detach(node_id_);
  }

  const NodeId &Replica::nodeId() const {
    return node_id_;
  }

  outcome::result<primitives::RecordId> Replica::recordEvent(
      audit::EventType type,
      std::string actor,
      std::string statute_id,
      std::string subject_id,
      std::string result) {
    auto now = primitives::toTimestamp(clock_->now());
    auto record = audit::AuditRecord::create(type,
                                             std::move(actor),
                                             std::move(statute_id),
                                             std::move(subject_id),
                                             std::move(result),
                                             now,
                                             std::nullopt);
    return storage_->append(std::move(record));
  }

  void Replica::tick(const std::vector<NodeId> &peers) {
    auto heartbeat_res = sync_manager_->createHeartbeat();
    if (heartbeat_res.has_error()) {
      SL_ERROR(log_,
               "Can't create heartbeat: {}",
               heartbeat_res.error().message());
      return;
    }
    const sync::SyncMessage heartbeat{std::move(heartbeat_res.value())};

    const auto &config = sync_manager_->config();
    for (const auto &peer : peers) {
      if (peer == node_id_) {
        continue;
      }
      send(peer, heartbeat);

      if (not sync_manager_->needsSync(peer)
          or not sync_manager_->canAttempt(peer)) {
        continue;
      }
      if (config.allowsPush()) {
        auto push_res = sync_manager_->createPushResponse(peer);
        if (push_res.has_error()) {
          SL_WARN(log_,
                  "Can't prepare push to {}: {}",
                  peer,
                  push_res.error().message());
        } else if (not push_res.value().records.empty()) {
          send(peer, sync::SyncMessage{std::move(push_res.value())});
        }
      }
      if (config.allowsPull()) {
        auto request_res = sync_manager_->createSyncRequest(
            peer, sync_manager_->localClock());
        if (request_res.has_error()) {
          SL_WARN(log_,
                  "Can't prepare request to {}: {}",
                  peer,
                  request_res.error().message());
        } else {
          send(peer, sync::SyncMessage{std::move(request_res.value())});
        }
      }
    }
  }

  void Replica::onMessage(const NodeId &from, std::span<const uint8_t> bytes) {
    auto message_res = codec_.decode(bytes);
    if (message_res.has_error()) {
      SL_WARN(log_,
              "Malformed message from {}: {}",
              from,
              message_res.error().message());
      sync_manager_->recordFailure(from);
      return;
    }
    const auto &message = message_res.value();

    auto sender = sync::messageSender(message);
    if (sender != from) {
      SL_WARN(log_,
              "{} from {} claims to come from {}",
              sync::messageName(message),
              from,
              sender);
      sync_manager_->recordFailure(from);
      return;
    }

    auto reply_res = sync_manager_->handleMessage(message);
    if (reply_res.has_error()) {
      SL_WARN(log_,
              "Can't handle {} from {}: {}",
              sync::messageName(message),
              from,
              reply_res.error().message());
      sync_manager_->recordFailure(from);
      return;
    }

    if (auto response = if_type<sync::SyncResponse>(message)) {
      auto imported_res = importRecords(response->get());
      if (imported_res.has_error()) {
        SL_WARN(log_,
                "Can't store records from {}: {}",
                from,
                imported_res.error().message());
        sync_manager_->recordFailure(from);
        return;
      }
      if (imported_res.value() > 0) {
        SL_DEBUG(log_,
                 "Stored {} records received from {}",
                 imported_res.value(),
                 from);
      }
    }

    if (reply_res.value()) {
      send(from, *reply_res.value());
    }
  }

  outcome::result<size_t> Replica::importRecords(
      const sync::SyncResponse &response) {
    size_t imported = 0;
    for (const auto &distributed : response.records) {
      if (storage_->contains(distributed.id())) {
        continue;
      }
      OUTCOME_TRY(storage_->importRecord(distributed.record));
      ++imported;
    }
    return imported;
  }

  void Replica::send(const NodeId &to, const sync::SyncMessage &message) {
    auto bytes_res = codec_.encode(message);
    if (bytes_res.has_error()) {
      SL_ERROR(log_,
               "Can't encode {} for {}: {}",
               sync::messageName(message),
               to,
               bytes_res.error().message());
      return;
    }
    if (auto res = network_->send(node_id_, to, std::move(bytes_res.value()));
        res.has_error()) {
      SL_DEBUG(log_,
               "Can't send {} to {}: {}",
               sync::messageName(message),
               to,
               res.error().message());
      sync_manager_->recordFailure(to);
    }
  }

}  // namespace auditsync::node
