/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <exception>
#include <iostream>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include "utilities/Config.hpp"
#include "utilities/Utilities.hpp"

namespace {
// Value following a CLI flag, e.g. the path in "-C path"
std::string optionValue(int argc, char *argv[], int i) {
  if (i + 1 >= argc) {
    throw std::invalid_argument(std::string("Missing value for CLI option ") +
                                argv[i]);
  }
  return std::string(argv[i + 1]);
}
}  // namespace

bool Config::parseCli(int argc, char *argv[]) {
  if (argc == 1) {
    return true;
  }

  for (int i = 1; i < argc; i++) {
    if (std::string(argv[i]) == "-h" || std::string(argv[i]) == "--help") {
      std::cout << "\nusage: pvsim [-C config] [-O odir] [-n points] "
                   "[-j threads] \n\n";
      std::cout << "-C, --config \t : path to config file\n";
      std::cout << "-O, --odir \t : path to output directory\n";
      std::cout << "-n, --points \t : number of samples in the voltage sweep\n";
      std::cout << "-j, --threads \t : number of sweep threads\n";
      return false;
    } else if (std::string(argv[i]) == "-C" ||
               std::string(argv[i]) == "--config") {
      m_config["ConfigFile"] = optionValue(argc, argv, i);
      spdlog::info("Loading config from file: {:s}", m_config["ConfigFile"]);
      i++;
    } else if (std::string(argv[i]) == "-O" ||
               std::string(argv[i]) == "--odir") {
      m_config["OutputDirectory"] = optionValue(argc, argv, i);
      spdlog::info("Writing output to directory: {:s}",
                   m_config["OutputDirectory"]);
      i++;
    } else if ((std::string(argv[i]) == "-n") ||
               (std::string(argv[i]) == "--points")) {
      m_config["SweepPoints"] = optionValue(argc, argv, i);
      i++;
    } else if ((std::string(argv[i]) == "-j") ||
               (std::string(argv[i]) == "--threads")) {
      m_config["SweepThreads"] = optionValue(argc, argv, i);
      i++;
    } else {
      // Unrecognized option
      throw std::invalid_argument("Unrecognized CLI option \"" +
                                  std::string(argv[i]) + "\"");
    }
  }
  return true;
}

void Config::parseFile(const std::string &fn) {
  if (fn == "") {
    if (m_config.find("ConfigFile") != m_config.end()) {
      m_configFileName = m_config["ConfigFile"];
    } else {
      m_configFileName = "pvsim-config.yml";
    }
  } else {
    m_configFileName = fn;
  }
  Utility::assertFileExists(m_configFileName);
  auto ymlconfig =
      YAML::LoadFile(m_configFileName).as<std::map<std::string, std::string>>();
  m_config.insert(ymlconfig.begin(),
                  ymlconfig.end());  // Note: CLI arguments override yaml-config
}

const std::string &Config::getString(const std::string &key) const {
  auto it = m_config.find(key);
  if (it != m_config.end()) {
    return it->second;
  } else {
    throw std::invalid_argument(key + ": not found in config file " +
                                m_configFileName);
  }
}

unsigned int Config::getUint(const std::string &key) const {
  const auto &val = getString(key);
  try {
    size_t pos = 0;
    const auto res = std::stoul(val, &pos);
    if (pos != val.size() || val.find('-') != std::string::npos ||
        res > std::numeric_limits<unsigned int>::max()) {
      throw std::invalid_argument(val);
    }
    return static_cast<unsigned int>(res);
  } catch (std::logic_error &e) {
    throw std::invalid_argument(key + " is not an unsigned integer: " + val);
  }
}

double Config::getDouble(const std::string &key) const {
  const auto &val = getString(key);
  try {
    size_t pos = 0;
    const auto res = std::stod(val, &pos);
    if (pos != val.size()) {
      throw std::invalid_argument(val);
    }
    return res;
  } catch (std::logic_error &e) {
    throw std::invalid_argument(key + " is not a number: " + val);
  }
}

bool Config::getBool(const std::string &key) const {
  const auto &val = getString(key);
  if (val == "True" || val == "true") {
    return true;
  } else if (val == "False" || val == "false") {
    return false;
  } else {
    throw std::invalid_argument(key + " is not a boolean value.");
  }
}

bool Config::contains(const std::string &key) const {
  return m_config.find(key) != m_config.end();
}
