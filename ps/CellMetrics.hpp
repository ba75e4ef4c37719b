/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>
#include "include/pvsim.h"
#include "ps/JvSweep.hpp"
#include "ps/PvCell.hpp"

/**
 * @brief Performance figures derived from the diode model.
 */
struct CellMetrics {
  double voc;         //! Open-circuit voltage [V]
  double jsc;         //! Current density at V = 0 [mA/cm^2]
  double vmpp;        //! Maximum power point voltage [V]
  double jmpp;        //! Maximum power point current density [mA/cm^2]
  double pmax;        //! Maximum power density [mW/cm^2]
  double fillFactor;  //! pmax / (voc * jsc)
  double efficiency;  //! pmax / incident power density
};

/**
 * @brief Measured performance figures of a cell, as reported by a lab
 * measurement. Same units as CellMetrics.
 */
struct MeasuredMetrics {
  double voc;
  double jsc;
  double fillFactor;
  double efficiency;
  double vmpp;
  double jmpp;
};

namespace Metrics {

/**
 * @brief openCircuitVoltage Voc from the first J = 0 crossing of a solved
 * curve, refined by bisection on the solver.
 * @throws std::runtime_error if the curve never crosses J = 0
 */
double openCircuitVoltage(const JvSweep &sweep, const Curve &curve);

/**
 * @brief estimateOpenCircuitVoltage Voc without a curve. Brackets the zero
 * crossing by doubling the voltage from n*Vt, then bisects. Used to place the
 * reference grid before sweeping.
 * @throws std::runtime_error if no crossing is found
 */
double estimateOpenCircuitVoltage(const JvSweep &sweep);

/**
 * @brief derive Jsc, Voc, MPP, fill factor and efficiency of a solved curve.
 * The MPP is refined by golden-section search around the best sample.
 * @param sweep sweep the curve was produced with
 * @param curve solved curve, must contain a power-generating region
 * @param incidentPower incident power density [mW/cm^2]
 * @throws std::runtime_error if the cell produces no power on the curve
 */
CellMetrics derive(const JvSweep &sweep, const Curve &curve,
                   double incidentPower = PVSIM_INCIDENT_POWER_DENSITY);

/**
 * @brief crossCheck compare measured figures with derived ones.
 * Every figure off by more than relTol (relative to the measured value) is
 * logged as a warning.
 * @retval names of the mismatching figures, empty if all agree.
 */
std::vector<std::string> crossCheck(
    const CellMetrics &derived, const MeasuredMetrics &measured,
    double relTol = PVSIM_CROSS_CHECK_TOLERANCE);

}  // namespace Metrics
