/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <array>
#include <filesystem>
#include <iostream>
#include <memory>
#include <random>
#include <vector>

#include <fmt/format.h>
#include <soralog/logging_system.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "clock/impl/clock_impl.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"
#include "network/loopback_network.hpp"
#include "node/replica.hpp"

using auditsync::application::AppConfigurationImpl;
using auditsync::node::Replica;
using auditsync::primitives::NodeId;

namespace {
  constexpr std::array kEventTypes{
      auditsync::audit::EventType::AutomaticDecision,
      auditsync::audit::EventType::DiscretionaryReview,
      auditsync::audit::EventType::HumanOverride,
      auditsync::audit::EventType::Appeal,
      auditsync::audit::EventType::StatuteModified,
      auditsync::audit::EventType::SimulationRun,
  };

  bool produceRecords(Replica &replica,
                      uint32_t count,
                      std::mt19937 &rng,
                      const auditsync::log::Logger &logger) {
    std::uniform_int_distribution<size_t> event_dist(0,
                                                     kEventTypes.size() - 1);
    std::uniform_int_distribution<uint32_t> subject_dist(1, 9999);
    for (uint32_t i = 0; i < count; ++i) {
      auto res = replica.recordEvent(
          kEventTypes[event_dist(rng)],
          fmt::format("system:{}", replica.nodeId()),
          fmt::format("statute-{}", i % 7),
          fmt::format("subject-{}", subject_dist(rng)),
          R"({"eligible":true})");
      if (res.has_error()) {
        SL_ERROR(logger,
                 "{} failed to record an event: {}",
                 replica.nodeId(),
                 res.error().message());
        return false;
      }
    }
    return true;
  }

  int run_node(int argc, const char **argv) {
    auto logger =
        auditsync::log::createLogger("Main", auditsync::log::defaultGroupName);

    auto configuration = std::make_shared<AppConfigurationImpl>(
        auditsync::log::createLogger("AppConfiguration", "application"));
    if (not configuration->initializeFromArgs(argc, argv)) {
      return EXIT_FAILURE;
    }

    auditsync::log::tuneLoggingSystem(configuration->log());

    const auto &sync_config = configuration->syncConfig();
    SL_INFO(logger,
            "Starting {} replicas, strategy {}, batch size {}",
            configuration->nodeCount(),
            auditsync::sync::sync_strategy_to_str(sync_config.strategy),
            sync_config.batch_size);

    auto clock = std::make_shared<auditsync::clock::SystemClockImpl>();
    auto network = std::make_shared<auditsync::network::LoopbackNetwork>();

    std::vector<NodeId> node_ids;
    std::vector<std::unique_ptr<Replica>> replicas;
    for (uint32_t i = 1; i <= configuration->nodeCount(); ++i) {
      NodeId node_id{fmt::format("node-{}", i)};
      node_ids.push_back(node_id);
      replicas.emplace_back(
          std::make_unique<Replica>(node_id, sync_config, clock, network));
    }

    std::mt19937 rng{std::random_device{}()};
    for (auto &replica : replicas) {
      if (not produceRecords(
              *replica, configuration->recordsPerNode(), rng, logger)) {
        return EXIT_FAILURE;
      }
    }

    for (uint32_t round = 1; round <= configuration->rounds(); ++round) {
      for (auto &replica : replicas) {
        replica->tick(node_ids);
      }
      auto delivered = network->deliver();
      SL_INFO(logger, "Round {}: {} messages delivered", round, delivered);
    }

    const size_t expected =
        size_t{configuration->nodeCount()} * configuration->recordsPerNode();
    bool converged = true;
    bool intact = true;
    for (const auto &replica : replicas) {
      auto count_res = replica->storage().count();
      if (count_res.has_error()) {
        SL_ERROR(logger,
                 "{} can't count its records: {}",
                 replica->nodeId(),
                 count_res.error().message());
        return EXIT_FAILURE;
      }
      auto integrity = replica->storage().verifyIntegrity();
      SL_INFO(logger,
              "{}: {} of {} records, integrity {}, clock entries {}",
              replica->nodeId(),
              count_res.value(),
              expected,
              integrity ? "ok" : "BROKEN",
              replica->syncManager().localClock().entries().size());
      converged = converged and count_res.value() == expected;
      intact = intact and integrity;
    }

    if (converged) {
      SL_INFO(logger, "All replicas hold all {} records", expected);
    } else {
      SL_WARN(logger,
              "Replicas have not converged after {} rounds",
              configuration->rounds());
    }
    return intact ? EXIT_SUCCESS : EXIT_FAILURE;
  }

}  // namespace

int main(int argc, const char **argv) {
  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        auditsync::log::Configurator::getLogConfigFile(argc - 1, argv + 1);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<auditsync::log::Configurator>(
                  custom_log_config_path.value())
            : std::make_shared<auditsync::log::Configurator>();

    return std::make_shared<soralog::LoggingSystem>(std::move(configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  auditsync::log::setLoggingSystem(logging_system);

  auto exit_code = run_node(argc, argv);

  auto logger =
      auditsync::log::createLogger("Main", auditsync::log::defaultGroupName);
  SL_INFO(logger, "All replicas are stopped");
  logger->flush();

  return exit_code;
}
