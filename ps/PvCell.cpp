/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include "ps/PvCell.hpp"

namespace {
// Largest argument std::exp can take without overflowing to inf
const double k_maxExponent = std::log(std::numeric_limits<double>::max());

void requireFinite(double value, const std::string &name) {
  if (!std::isfinite(value)) {
    throw std::invalid_argument(
        fmt::format("PvCell: {} must be finite, got {}", name, value));
  }
}
}  // namespace

std::string PvCell::toString(SolveStatus status) {
  switch (status) {
    case SolveStatus::Converged:
      return "Converged";
    case SolveStatus::DidNotConverge:
      return "DidNotConverge";
    case SolveStatus::NumericOverflow:
      return "NumericOverflow";
  }
  return "Unknown";
}

void PvCell::validate(const CellParameters &params) {
  requireFinite(params.jsc, "Jsc");
  requireFinite(params.j0, "J0");
  requireFinite(params.n, "n");
  requireFinite(params.vt, "Vt");
  requireFinite(params.rs, "Rs");
  // Rsh = +inf is the ideal limit, -inf falls to the sign check below
  if (std::isnan(params.rsh)) {
    throw std::invalid_argument("PvCell: Rsh must not be NaN");
  }

  if (params.n <= 0.0) {
    throw std::invalid_argument(
        fmt::format("PvCell: ideality factor must be > 0, got {}", params.n));
  }
  if (params.vt <= 0.0) {
    throw std::invalid_argument(
        fmt::format("PvCell: thermal voltage must be > 0, got {}", params.vt));
  }
  if (params.rsh <= 0.0) {
    throw std::invalid_argument(fmt::format(
        "PvCell: shunt resistance must be > 0, got {}", params.rsh));
  }
  if (params.rs < 0.0) {
    throw std::invalid_argument(fmt::format(
        "PvCell: series resistance must be >= 0, got {}", params.rs));
  }
  if (params.jsc < 0.0 || params.j0 < 0.0) {
    throw std::invalid_argument(
        fmt::format("PvCell: current densities must be >= 0, got Jsc={} J0={}",
                    params.jsc, params.j0));
  }
}

double PvCell::residual(double v, double j, const CellParameters &params) {
  // Voltage across the diode and shunt branch
  const double vd = v + j * params.rs;
  return j - params.jsc +
         params.j0 * (std::exp(vd / params.diodeVoltageScale()) - 1.0) +
         vd / params.rsh;
}

PvCell::SolveResult PvCell::solveCurrent(double v, const CellParameters &params,
                                         const SolverSettings &settings) {
  validate(params);
  requireFinite(v, "V");
  if (!(settings.tolerance > 0.0) || settings.maxIterations == 0) {
    throw std::invalid_argument(fmt::format(
        "PvCell: invalid solver settings tolerance={} maxIterations={}",
        settings.tolerance, settings.maxIterations));
  }

  const double nvt = params.diodeVoltageScale();

  // Near short circuit the photocurrent dominates, start there
  double jGuess = params.jsc;

  for (unsigned int i = 1; i <= settings.maxIterations; i++) {
    const double vd = v + jGuess * params.rs;
    const double exponent = vd / nvt;
    if (exponent > k_maxExponent) {
      spdlog::debug("PvCell: diode exponent {:e} overflows at v={:e}, J={:e}",
                    exponent, v, jGuess);
      return SolveResult{SolveStatus::NumericOverflow, jGuess, i};
    }

    const double expTerm = std::exp(exponent);
    const double f =
        jGuess - params.jsc + params.j0 * (expTerm - 1.0) + vd / params.rsh;
    const double df =
        1.0 + (params.j0 * params.rs / nvt) * expTerm + params.rs / params.rsh;
    const double jNew = jGuess - f / df;

    if (!std::isfinite(jNew)) {
      spdlog::debug("PvCell: non-finite Newton step at v={:e} after {:d} "
                    "iterations (f={:e}, df={:e})",
                    v, i, f, df);
      return SolveResult{SolveStatus::NumericOverflow, jGuess, i};
    }

    if (std::abs(jNew - jGuess) < settings.tolerance) {
      return SolveResult{SolveStatus::Converged, jNew, i};
    }
    jGuess = jNew;
  }

  spdlog::debug("PvCell: couldn't converge after {:d} iterations. v={:e}, "
                "J={:e}",
                settings.maxIterations, v, jGuess);
  return SolveResult{SolveStatus::DidNotConverge, jGuess,
                     settings.maxIterations};
}
