/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "sync/sync_config.hpp"

namespace auditsync::application {

  /**
   * Parameters of an audit sync node run
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    virtual const sync::SyncConfig &syncConfig() const = 0;

    /// Number of replicas started by the node
    virtual uint32_t nodeCount() const = 0;

    /// Number of audit records each replica produces before syncing
    virtual uint32_t recordsPerNode() const = 0;

    /// Number of sync rounds to run
    virtual uint32_t rounds() const = 0;

    /// Logging filters in `<group>=<level>` or `<level>` form
    virtual const std::vector<std::string> &log() const = 0;
  };

}  // namespace auditsync::application
