/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include "include/pvsim.h"
#include "ps/CellConfig.hpp"
#include "utilities/Config.hpp"

namespace {
double doubleOr(const std::string &key, double fallback) {
  return Config::get().contains(key) ? Config::get().getDouble(key) : fallback;
}

unsigned int uintOr(const std::string &key, unsigned int fallback) {
  return Config::get().contains(key) ? Config::get().getUint(key) : fallback;
}
}  // namespace

PvCell::CellParameters CellConfig::loadParameters() {
  PvCell::CellParameters params;
  params.jsc = doubleOr("ShortCircuitCurrentDensity", 30.52638788);
  params.j0 = doubleOr("SaturationCurrentDensity", 1e-12);
  params.n = doubleOr("IdealityFactor", 1.2);
  params.vt = doubleOr("ThermalVoltage", 0.02585);
  params.rs = doubleOr("SeriesResistance", 0.001);
  params.rsh = doubleOr("ShuntResistance", 10000.0);
  PvCell::validate(params);

  spdlog::info("Cell: Jsc={:g} mA/cm2, J0={:g} mA/cm2, n={:g}, Vt={:g} V, "
               "Rs={:g} Ohm cm2, Rsh={:g} Ohm cm2",
               params.jsc, params.j0, params.n, params.vt, params.rs,
               params.rsh);
  return params;
}

PvCell::SolverSettings CellConfig::loadSolverSettings() {
  PvCell::SolverSettings settings;
  settings.tolerance = doubleOr("SolverTolerance", PVSIM_SOLVER_TOLERANCE);
  settings.maxIterations =
      uintOr("SolverMaxIterations", PVSIM_SOLVER_MAX_ITERATIONS);
  return settings;
}

SweepRange CellConfig::loadSweepRange(const JvSweep &sweep) {
  SweepRange range;
  range.start = doubleOr("SweepStart", PVSIM_SWEEP_START);
  range.points = uintOr("SweepPoints", PVSIM_SWEEP_POINTS);
  if (Config::get().contains("SweepStop")) {
    range.stop = Config::get().getDouble("SweepStop");
  } else {
    const double voc = Metrics::estimateOpenCircuitVoltage(sweep);
    range.stop = voc + PVSIM_SWEEP_VOC_MARGIN;
    spdlog::info("Model Voc={:f} V, sweeping up to {:f} V", voc, range.stop);
  }
  return range;
}

bool CellConfig::loadMeasured(MeasuredMetrics &measured) {
  if (!Config::get().contains("MeasuredVoc")) {
    return false;
  }
  const auto &cfg = Config::get();
  measured.voc = cfg.getDouble("MeasuredVoc");
  measured.jsc = cfg.getDouble("MeasuredJsc");
  measured.fillFactor = cfg.getDouble("MeasuredFillFactor");
  measured.efficiency = cfg.getDouble("MeasuredEfficiency");
  measured.vmpp = cfg.getDouble("MeasuredVmpp");
  measured.jmpp = cfg.getDouble("MeasuredJmpp");
  return true;
}

void CellConfig::applyLogLevel() {
  if (!Config::get().contains("LogLevel")) {
    return;
  }
  const auto &lvl = Config::get().getString("LogLevel");
  if (lvl == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (lvl == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (lvl == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (lvl == "error") {
    spdlog::set_level(spdlog::level::err);
  } else {
    throw std::invalid_argument("LogLevel: invalid level \"" + lvl + "\"");
  }
}
