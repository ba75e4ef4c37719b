/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

//! Default config, relative to the build directory
#define DEFAULT_CONFIG_FILE "../config/gaas-pin-config.yml"

#include "ps/CellConfig.hpp"
#include "ps/CellMetrics.hpp"
#include "ps/JvReport.hpp"
#include "ps/JvSweep.hpp"
#include "ps/PvCell.hpp"
#include "utilities/Config.hpp"
#include "utilities/Utilities.hpp"
#include <exception>
#include <iostream>
#include <spdlog/spdlog.h>
#include <string>

namespace {
std::string stringOr(const std::string &key, const std::string &fallback) {
  return Config::get().contains(key) ? Config::get().getString(key) : fallback;
}

int run() {
  const auto params = CellConfig::loadParameters();
  const auto settings = CellConfig::loadSolverSettings();
  const unsigned int threads = Config::get().contains("SweepThreads")
                                   ? Config::get().getUint("SweepThreads")
                                   : 1;

  JvSweep sweep(params, settings, threads);
  const auto range = CellConfig::loadSweepRange(sweep);

  spdlog::info("Sweeping {:d} samples from {:f} V to {:f} V", range.points,
               range.start, range.stop);
  const Curve curve = sweep.run(range);

  const double incidentPower =
      Config::get().contains("IncidentPowerDensity")
          ? Config::get().getDouble("IncidentPowerDensity")
          : PVSIM_INCIDENT_POWER_DENSITY;
  const auto metrics = Metrics::derive(sweep, curve, incidentPower);

  MeasuredMetrics measured{};
  const bool hasMeasured = CellConfig::loadMeasured(measured);
  if (hasMeasured) {
    const double relTol =
        Config::get().contains("CrossCheckTolerance")
            ? Config::get().getDouble("CrossCheckTolerance")
            : PVSIM_CROSS_CHECK_TOLERANCE;
    const auto mismatches = Metrics::crossCheck(metrics, measured, relTol);
    if (mismatches.empty()) {
      spdlog::info("Measured figures agree with the model within {:g}%",
                   relTol * 100.0);
    } else {
      spdlog::warn("{:d} measured figure(s) disagree with the model",
                   mismatches.size());
    }
  }

  const auto odir = stringOr("OutputDirectory", ".");
  const auto stem = stringOr("CellName", "GaAs-pin");
  JvReport report(
      stringOr("CellDescription", "GaAs p-i-n Solar Cell with ~2 µm active "
                                  "layer"),
      curve, metrics, hasMeasured ? &measured : nullptr);

  Utility::createDirectories(odir);
  report.writeCsv(odir + "/" + stem + "_jv.csv");
  if (!Config::get().contains("WriteGnuplotScript") ||
      Config::get().getBool("WriteGnuplotScript")) {
    report.writeGnuplotScript(odir + "/" + stem + "_jv.gp", stem + "_jv.csv",
                              stem + "_jv.png");
  }

  std::cout << report.summary() << "\n" << report.evaluation();
  return 0;
}
}  // namespace

int main(int argc, char *argv[]) {
  try {
    // Parse CLI arguments & config file
    if (!Config::get().parseCli(argc, argv)) {
      return 0;
    }
    if (Config::get().contains("ConfigFile")) {
      // Config file parsed as argument
      Config::get().parseFile(Config::get().getString("ConfigFile"));
    } else {
      Config::get().parseFile(DEFAULT_CONFIG_FILE);
    }
    CellConfig::applyLogLevel();

    return run();
  } catch (std::exception &e) {
    spdlog::error("{}", e.what());
    return 1;
  }
}
