/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/config_reader/sync_config_reader.hpp"

#include <limits>

#include <boost/property_tree/json_parser.hpp>

#include "application/impl/config_reader/error.hpp"
#include "application/impl/config_reader/pt_util.hpp"

namespace auditsync::application {
  namespace pt = boost::property_tree;

  namespace {
    constexpr auto kSection = "sync";

    /// Absent entry gives none, an entry of another type is an error
    template <typename T>
    outcome::result<boost::optional<T>> readEntry(const pt::ptree &section,
                                                  const char *key) {
      auto child = section.get_child_optional(key);
      if (not child) {
        return boost::none;
      }
      auto value = child->get_value_optional<T>();
      if (not value) {
        return ConfigReaderError::INVALID_VALUE;
      }
      return value;
    }

    /// Negative numbers are rejected instead of being wrapped around
    template <typename T>
    outcome::result<T> toUnsigned(int64_t value) {
      if (value < 0
          or static_cast<uint64_t>(value) > std::numeric_limits<T>::max()) {
        return ConfigReaderError::INVALID_VALUE;
      }
      return static_cast<T>(value);
    }

    outcome::result<sync::SyncStrategy> toStrategy(std::string_view str) {
      auto strategy = sync::str_to_sync_strategy(str);
      if (not strategy) {
        return ConfigReaderError::INVALID_VALUE;
      }
      return *strategy;
    }

    outcome::result<sync::SyncConfig> initConfigFromPropertyTree(
        const pt::ptree &tree) {
      OUTCOME_TRY(section, ensure(tree.get_child_optional(kSection)));

      OUTCOME_TRY(strategy_entry,
                  readEntry<std::string>(section, "strategy"));
      OUTCOME_TRY(strategy_str, ensure(strategy_entry));
      OUTCOME_TRY(interval_entry,
                  readEntry<int64_t>(section, "interval_secs"));
      OUTCOME_TRY(interval, ensure(interval_entry));
      OUTCOME_TRY(batch_entry, readEntry<int64_t>(section, "batch_size"));
      OUTCOME_TRY(batch_size, ensure(batch_entry));
      OUTCOME_TRY(retries_entry, readEntry<int64_t>(section, "max_retries"));
      OUTCOME_TRY(max_retries, ensure(retries_entry));
      OUTCOME_TRY(compression_entry,
                  readEntry<bool>(section, "enable_compression"));
      OUTCOME_TRY(compression, ensure(compression_entry));
      OUTCOME_TRY(backoff_entry,
                  readEntry<int64_t>(section, "max_backoff_secs"));
      OUTCOME_TRY(max_backoff, ensure(backoff_entry));

      OUTCOME_TRY(strategy, toStrategy(strategy_str));
      OUTCOME_TRY(interval_secs, toUnsigned<uint64_t>(interval));
      OUTCOME_TRY(batch, toUnsigned<uint32_t>(batch_size));
      OUTCOME_TRY(retries, toUnsigned<uint32_t>(max_retries));
      OUTCOME_TRY(backoff_secs, toUnsigned<uint64_t>(max_backoff));

      sync::SyncConfig config;
      config.strategy = strategy;
      config.sync_interval_secs = interval_secs;
      config.batch_size = batch;
      config.max_retries = retries;
      config.enable_compression = compression;
      config.max_backoff_secs = backoff_secs;
      return config;
    }

    outcome::result<void> updateConfigFromPropertyTree(
        sync::SyncConfig &config, const pt::ptree &tree) {
      auto section = tree.get_child_optional(kSection);
      if (not section) {
        return outcome::success();
      }

      OUTCOME_TRY(strategy, readEntry<std::string>(*section, "strategy"));
      if (strategy) {
        OUTCOME_TRY(value, toStrategy(*strategy));
        config.strategy = value;
      }
      OUTCOME_TRY(interval, readEntry<int64_t>(*section, "interval_secs"));
      if (interval) {
        OUTCOME_TRY(value, toUnsigned<uint64_t>(*interval));
        config.sync_interval_secs = value;
      }
      OUTCOME_TRY(batch_size, readEntry<int64_t>(*section, "batch_size"));
      if (batch_size) {
        OUTCOME_TRY(value, toUnsigned<uint32_t>(*batch_size));
        config.batch_size = value;
      }
      OUTCOME_TRY(max_retries, readEntry<int64_t>(*section, "max_retries"));
      if (max_retries) {
        OUTCOME_TRY(value, toUnsigned<uint32_t>(*max_retries));
        config.max_retries = value;
      }
      OUTCOME_TRY(compression,
                  readEntry<bool>(*section, "enable_compression"));
      if (compression) {
        config.enable_compression = *compression;
      }
      OUTCOME_TRY(max_backoff,
                  readEntry<int64_t>(*section, "max_backoff_secs"));
      if (max_backoff) {
        OUTCOME_TRY(value, toUnsigned<uint64_t>(*max_backoff));
        config.max_backoff_secs = value;
      }
      return outcome::success();
    }
  }  // namespace

  outcome::result<sync::SyncConfig> SyncConfigReader::initConfig(
      std::istream &config_file_data) {
    OUTCOME_TRY(tree, readPropertyTree(config_file_data));
    OUTCOME_TRY(config, initConfigFromPropertyTree(tree));
    OUTCOME_TRY(validate(config));
    return config;
  }

  outcome::result<void> SyncConfigReader::updateConfig(
      sync::SyncConfig &config, std::istream &config_file_data) {
    OUTCOME_TRY(tree, readPropertyTree(config_file_data));
    auto updated = config;
    OUTCOME_TRY(updateConfigFromPropertyTree(updated, tree));
    OUTCOME_TRY(validate(updated));
    config = updated;
    return outcome::success();
  }

  outcome::result<boost::property_tree::ptree>
  SyncConfigReader::readPropertyTree(std::istream &data) {
    pt::ptree tree;
    try {
      pt::read_json(data, tree);
    } catch (pt::json_parser_error &e) {
      return ConfigReaderError::PARSER_ERROR;
    }
    return tree;
  }

  outcome::result<void> SyncConfigReader::validate(
      const sync::SyncConfig &config) {
    if (config.batch_size == 0 or config.sync_interval_secs == 0) {
      return ConfigReaderError::INVALID_VALUE;
    }
    return outcome::success();
  }

}  // namespace auditsync::application
