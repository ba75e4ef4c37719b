/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>
#include "ps/CellMetrics.hpp"

namespace {

// Bisect J(v) = 0 on [lo, hi] where J(lo) > 0 >= J(hi)
double bisectZeroCurrent(const JvSweep &sweep, double lo, double hi) {
  while ((hi - lo) > PVSIM_METRIC_VOLTAGE_TOLERANCE) {
    const double mid = 0.5 * (lo + hi);
    if (sweep.solveAt(mid) > 0.0) {
      lo = mid;
    } else {
      hi = mid;
    }
  }
  return 0.5 * (lo + hi);
}

// Golden-section search for the maximum of v*J(v) on [lo, hi]
double maximisePower(const JvSweep &sweep, double lo, double hi) {
  const double invPhi = 0.5 * (std::sqrt(5.0) - 1.0);
  double a = hi - invPhi * (hi - lo);
  double b = lo + invPhi * (hi - lo);
  double pa = a * sweep.solveAt(a);
  double pb = b * sweep.solveAt(b);

  while ((hi - lo) > PVSIM_METRIC_VOLTAGE_TOLERANCE) {
    if (pa > pb) {
      hi = b;
      b = a;
      pb = pa;
      a = hi - invPhi * (hi - lo);
      pa = a * sweep.solveAt(a);
    } else {
      lo = a;
      a = b;
      pa = pb;
      b = lo + invPhi * (hi - lo);
      pb = b * sweep.solveAt(b);
    }
  }
  return 0.5 * (lo + hi);
}

}  // namespace

double Metrics::openCircuitVoltage(const JvSweep &sweep, const Curve &curve) {
  for (size_t i = 0; i + 1 < curve.size(); i++) {
    if (curve[i].j > 0.0 && curve[i + 1].j <= 0.0) {
      if (curve[i + 1].j == 0.0) {
        return curve[i + 1].v;
      }
      return bisectZeroCurrent(sweep, curve[i].v, curve[i + 1].v);
    }
  }
  throw std::runtime_error(
      fmt::format("Metrics: curve over [{}, {}] V never crosses J = 0",
                  curve[0].v, curve[curve.size() - 1].v));
}

double Metrics::estimateOpenCircuitVoltage(const JvSweep &sweep) {
  double lo = 0.0;
  if (!(sweep.solveAt(lo) > 0.0)) {
    throw std::runtime_error("Metrics: no forward current at V = 0");
  }

  double hi = sweep.parameters().diodeVoltageScale();
  for (int i = 0; i < 64; i++) {
    if (sweep.solveAt(hi) <= 0.0) {
      return bisectZeroCurrent(sweep, lo, hi);
    }
    lo = hi;
    hi *= 2.0;
  }
  throw std::runtime_error(
      fmt::format("Metrics: no J = 0 crossing below {} V", hi));
}

CellMetrics Metrics::derive(const JvSweep &sweep, const Curve &curve,
                            double incidentPower) {
  if (!(incidentPower > 0.0)) {
    throw std::invalid_argument(fmt::format(
        "Metrics: incident power density must be > 0, got {}", incidentPower));
  }

  CellMetrics m;
  m.jsc = sweep.solveAt(0.0);
  m.voc = openCircuitVoltage(sweep, curve);

  const size_t best = curve.maxPowerIndex();
  if (!(curve[best].power() > 0.0)) {
    throw std::runtime_error("Metrics: cell produces no power on the curve");
  }

  // The maximum lies between the neighbours of the best sample
  const double lo = curve[best == 0 ? 0 : best - 1].v;
  const double hi = curve[std::min(best + 1, curve.size() - 1)].v;
  m.vmpp = maximisePower(sweep, lo, hi);
  m.jmpp = sweep.solveAt(m.vmpp);
  if (m.vmpp * m.jmpp < curve[best].power()) {
    m.vmpp = curve[best].v;
    m.jmpp = curve[best].j;
  }
  m.pmax = m.vmpp * m.jmpp;

  m.fillFactor = m.pmax / (m.voc * m.jsc);
  m.efficiency = m.pmax / incidentPower;

  spdlog::debug("Metrics: Voc={:f} V, Jsc={:f} mA/cm2, MPP=({:f} V, {:f} "
                "mA/cm2), FF={:f}, eta={:f}",
                m.voc, m.jsc, m.vmpp, m.jmpp, m.fillFactor, m.efficiency);
  return m;
}

std::vector<std::string> Metrics::crossCheck(const CellMetrics &derived,
                                             const MeasuredMetrics &measured,
                                             double relTol) {
  typedef std::tuple<std::string, double, double> figure_t;
  const std::vector<figure_t> figures{
      figure_t("Voc", derived.voc, measured.voc),
      figure_t("Jsc", derived.jsc, measured.jsc),
      figure_t("FF", derived.fillFactor, measured.fillFactor),
      figure_t("eta", derived.efficiency, measured.efficiency),
      figure_t("V_MPP", derived.vmpp, measured.vmpp),
      figure_t("J_MPP", derived.jmpp, measured.jmpp)};

  std::vector<std::string> mismatches;
  for (const auto &f : figures) {
    std::string name;
    double d;
    double ms;
    std::tie(name, d, ms) = f;
    const double scale = ms == 0.0 ? 1.0 : std::abs(ms);
    const double relErr = std::abs(d - ms) / scale;
    if (!(relErr <= relTol)) {
      spdlog::warn("Measured {:s}={:g} differs from model {:s}={:g} by "
                   "{:.2f}%",
                   name, ms, name, d, relErr * 100.0);
      mismatches.push_back(name);
    }
  }
  return mismatches;
}
