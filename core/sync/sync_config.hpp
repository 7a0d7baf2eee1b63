/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace auditsync::sync {

  enum class SyncStrategy : uint8_t {
    /// Replicas send their records to peers unsolicited
    Push,

    /// Replicas request records from peers, heartbeats trigger pulls
    Pull,

    /// Both of the above
    Hybrid,
  };

  inline std::optional<SyncStrategy> str_to_sync_strategy(
      std::string_view str) {
    if (str == "push" or str == "Push") {
      return SyncStrategy::Push;
    }
    if (str == "pull" or str == "Pull") {
      return SyncStrategy::Pull;
    }
    if (str == "hybrid" or str == "Hybrid") {
      return SyncStrategy::Hybrid;
    }
    return std::nullopt;
  }

  inline std::string_view sync_strategy_to_str(SyncStrategy strategy) {
    switch (strategy) {
      case SyncStrategy::Push:
        return "push";
      case SyncStrategy::Pull:
        return "pull";
      case SyncStrategy::Hybrid:
        return "hybrid";
    }
    return "unknown";
  }

  struct SyncConfig {
    SyncStrategy strategy = SyncStrategy::Hybrid;
    /// peer is considered stale once this much time passed since last sync
    uint64_t sync_interval_secs = 60;
    /// maximum number of records in one response
    uint32_t batch_size = 100;
    /// consecutive failures tolerated before backoff applies
    uint32_t max_retries = 3;
    /// carried for transports, no compression is done by the protocol
    bool enable_compression = false;
    /// upper bound of the retry backoff
    uint64_t max_backoff_secs = 3600;

    bool allowsPull() const {
      return strategy != SyncStrategy::Push;
    }

    bool allowsPush() const {
      return strategy != SyncStrategy::Pull;
    }

    bool operator==(const SyncConfig &other) const = default;
  };

}  // namespace auditsync::sync
