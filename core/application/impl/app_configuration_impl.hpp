/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <filesystem>
#include <optional>

#include "log/logger.hpp"

namespace auditsync::application {

  // clang-format off
  /**
   * Reads node configuration. Priority of sources:
   *
   *   COMMAND LINE ARGUMENTS    <- max priority
   *                V
   *   CONFIGURATION FILE (JSON)
   *                V
   *   DEFAULT VALUES            <- low priority
   */
  // clang-format on
  class AppConfigurationImpl final : public AppConfiguration {
   public:
    explicit AppConfigurationImpl(log::Logger logger);

    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    const sync::SyncConfig &syncConfig() const override {
      return sync_config_;
    }

    uint32_t nodeCount() const override {
      return node_count_;
    }

    uint32_t recordsPerNode() const override {
      return records_per_node_;
    }

    uint32_t rounds() const override {
      return rounds_;
    }

    const std::vector<std::string> &log() const override {
      return logger_tuning_config_;
    }

   private:
    bool loadConfigFile(const std::filesystem::path &path);

    log::Logger logger_;

    sync::SyncConfig sync_config_;
    uint32_t node_count_;
    uint32_t records_per_node_;
    uint32_t rounds_;
    std::vector<std::string> logger_tuning_config_;
  };

}  // namespace auditsync::application
