/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <cassert>
#include <fstream>
#include <iostream>

#include <boost/program_options.hpp>

#include "application/impl/config_reader/sync_config_reader.hpp"

namespace {
  const uint32_t def_node_count = 3;
  const uint32_t def_records_per_node = 5;
  const uint32_t def_rounds = 3;
  const uint32_t min_node_count = 2;

  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    assert(nullptr != name);
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }
}  // namespace

namespace auditsync::application {

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger)
      : logger_(std::move(logger)),
        node_count_(def_node_count),
        records_per_node_(def_records_per_node),
        rounds_(def_rounds) {}

  bool AppConfigurationImpl::loadConfigFile(
      const std::filesystem::path &path) {
    std::ifstream file{path};
    if (not file.is_open()) {
      SL_ERROR(logger_, "Can't open config file {}", path.native());
      return false;
    }
    if (auto res = SyncConfigReader::updateConfig(sync_config_, file);
        res.has_error()) {
      SL_ERROR(logger_,
               "Can't load config file {}: {}",
               path.native(),
               res.error().message());
      return false;
    }
    return true;
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<group>=<level>`, e.g. -lsync_manager=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all groups log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Filepath to a soralog YAML configuration")
        ("config,c", po::value<std::string>(), "Filepath to a JSON configuration with a `sync` section")
        ;

    po::options_description sync_desc("Sync options");
    sync_desc.add_options()
        ("strategy", po::value<std::string>(), "Sync strategy: push, pull or hybrid (default)")
        ("batch-size", po::value<uint32_t>(), "Maximum number of records in one response")
        ;

    po::options_description run_desc("Run options");
    run_desc.add_options()
        ("nodes", po::value<uint32_t>()->default_value(def_node_count), "Number of replicas")
        ("records", po::value<uint32_t>()->default_value(def_records_per_node), "Audit records produced by each replica")
        ("rounds", po::value<uint32_t>()->default_value(def_rounds), "Number of sync rounds")
        ;
    // clang-format on

    desc.add(sync_desc).add(run_desc);

    po::variables_map vm;
    try {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    if (vm.count("help") > 0) {
      std::cout << desc << std::endl;
      return false;
    }

    if (auto it = vm.find("config"); it != vm.end()) {
      if (not loadConfigFile(it->second.as<std::string>())) {
        return false;
      }
    }

    bool valid = true;
    find_argument<std::string>(vm, "strategy", [&](const std::string &val) {
      if (auto strategy = sync::str_to_sync_strategy(val)) {
        sync_config_.strategy = *strategy;
      } else {
        SL_ERROR(logger_, "Unknown sync strategy '{}'", val);
        valid = false;
      }
    });
    find_argument<uint32_t>(vm, "batch-size", [&](uint32_t val) {
      if (val == 0) {
        SL_ERROR(logger_, "Batch size must be positive");
        valid = false;
      }
      sync_config_.batch_size = val;
    });

    node_count_ = vm["nodes"].as<uint32_t>();
    records_per_node_ = vm["records"].as<uint32_t>();
    rounds_ = vm["rounds"].as<uint32_t>();
    if (node_count_ < min_node_count) {
      SL_ERROR(logger_, "At least {} nodes are needed", min_node_count);
      valid = false;
    }

    if (auto it = vm.find("log"); it != vm.end()) {
      logger_tuning_config_ = it->second.as<std::vector<std::string>>();
    }

    return valid;
  }

}  // namespace auditsync::application
