/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "node/config.hpp"

#include <fstream>
#include <iostream>

#include <boost/program_options.hpp>

#include "config/exchange_options.hpp"
#include "config/validate_with.hpp"

namespace datex::node {
  CLI_VALIDATE(ClockMode) {
    config::validateWith(out, values, [](const std::string &value) {
      if (value == "counter") {
        return ClockMode::kCounter;
      }
      if (value == "wall") {
        return ClockMode::kWall;
      }
      throw std::invalid_argument{value};
    });
  }

  CLI_VALIDATE(Scenario) {
    config::validateWith(out, values, [](const std::string &value) {
      if (value == "settle") {
        return Scenario::kSettle;
      }
      if (value == "revert") {
        return Scenario::kRevert;
      }
      if (value == "cancel") {
        return Scenario::kCancel;
      }
      if (value == "reject") {
        return Scenario::kReject;
      }
      throw std::invalid_argument{value};
    });
  }

  Config Config::read(int argc, char **argv) {
    Config config;
    struct {
      char log_level;
      std::string config_path;
    } raw;
    namespace po = boost::program_options;
    po::options_description desc("Datex node options");
    auto option{desc.add_options()};
    option("help,h", "print usage message");
    option("config",
           po::value(&raw.config_path)->default_value("datex.cfg"),
           "config file, read if exists");
    option("log,l",
           po::value(&raw.log_level)->default_value('i'),
           "log level, [e,w,i,d,t]");
    option("log-file", po::value(&config.log_file), "also log to file");
    option("scenario",
           po::value(&config.scenario),
           "scenario to run, [settle,revert,cancel,reject]");
    option("data-ids",
           po::value(&config.data_ids)->default_value(config.data_ids),
           "number of data ids in the offer");
    option("price",
           po::value(&config.price)->default_value(config.price),
           "tokens paid on settlement");

    po::options_description clock_desc("Clock options");
    auto clock_option{clock_desc.add_options()};
    clock_option("clock",
                 po::value(&config.clock_mode),
                 "height source, [counter,wall]");
    clock_option("genesis",
                 po::value(&config.genesis_time)
                     ->default_value(config.genesis_time),
                 "genesis time (seconds)");
    clock_option("block-delay",
                 po::value(&config.block_delay)
                     ->default_value(config.block_delay),
                 "seconds per height");
    desc.add(clock_desc);

    desc.add(config::exchangeOptions(config.exchange));

    po::variables_map vm;
    po::store(parse_command_line(argc, argv, desc), vm);
    if (vm.count("help") != 0) {
      std::cerr << desc << std::endl;
      exit(EXIT_SUCCESS);
    }
    po::notify(vm);
    std::ifstream config_file{raw.config_path};
    if (config_file.good()) {
      po::store(po::parse_config_file(config_file, desc), vm);
      po::notify(vm);
    }

    OUTCOME_EXCEPT(config::validate(config.exchange));
    if (config.block_delay <= 0) {
      throw std::invalid_argument{"block-delay must be positive"};
    }

    config.log_level = common::logLevelFromChar(raw.log_level);
    spdlog::set_level(config.log_level);
    return config;
  }
}  // namespace datex::node
