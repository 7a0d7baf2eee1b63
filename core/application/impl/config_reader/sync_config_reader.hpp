/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <istream>

#include <boost/property_tree/ptree.hpp>

#include "outcome/outcome.hpp"
#include "sync/sync_config.hpp"

namespace auditsync::application {

  /**
   * Reads the sync section of a node configuration from JSON:
   * @code
   *   {"sync": {"strategy": "hybrid", "interval_secs": 60,
   *             "batch_size": 100, "max_retries": 3,
   *             "enable_compression": false, "max_backoff_secs": 3600}}
   * @endcode
   */
  class SyncConfigReader {
   public:
    /**
     * @param config_file_data stream with the config file data
     * @return sync configuration if the data was correctly read and contained
     * every entry
     */
    static outcome::result<sync::SyncConfig> initConfig(
        std::istream &config_file_data);

    /**
     * Updates parameters of config from entries present in the config data.
     * Entries missing in the stream keep their current values
     * @return error if the stream couldn't be read or contained malformed
     * content; config stays untouched then
     */
    static outcome::result<void> updateConfig(sync::SyncConfig &config,
                                              std::istream &config_file_data);

   private:
    static outcome::result<boost::property_tree::ptree> readPropertyTree(
        std::istream &data);

    static outcome::result<void> validate(const sync::SyncConfig &config);
  };

}  // namespace auditsync::application
