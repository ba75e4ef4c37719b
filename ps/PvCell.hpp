/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include "include/pvsim.h"

namespace PvCell {

/**
 * @brief Physical parameters of the single-diode equivalent circuit.
 * Current densities in mA/cm^2, resistances in Ohm*cm^2, voltages in V.
 */
struct CellParameters {
  double jsc;  //! Short-circuit (photo-generated) current density
  double j0;   //! Reverse saturation current density
  double n;    //! Diode ideality factor
  double vt;   //! Thermal voltage kT/q
  double rs;   //! Series resistance, may be zero
  double rsh;  //! Shunt resistance

  //! Denominator of the diode exponent, n * Vt
  double diodeVoltageScale() const { return n * vt; }
};

/**
 * @brief Newton-Raphson settings.
 */
struct SolverSettings {
  double tolerance{PVSIM_SOLVER_TOLERANCE};
  unsigned int maxIterations{PVSIM_SOLVER_MAX_ITERATIONS};
};

enum class SolveStatus { Converged, DidNotConverge, NumericOverflow };

/**
 * @brief Outcome of a single solve.
 * On DidNotConverge/NumericOverflow, current holds the last finite iterate.
 */
struct SolveResult {
  SolveStatus status;
  double current;
  unsigned int iterations;

  bool converged() const { return status == SolveStatus::Converged; }
};

std::string toString(SolveStatus status);

/**
 * @brief validate Reject parameter sets the diode equation is undefined for.
 * @throws std::invalid_argument on non-positive n, Vt or Rsh, negative Rs, Jsc
 * or J0, or any non-finite value.
 */
void validate(const CellParameters &params);

/**
 * @brief residual f(J) of the implicit single-diode equation. Zero at the
 * operating point.
 */
double residual(double v, double j, const CellParameters &params);

/**
 * @brief solveCurrent Solve the single-diode equation
 *   J = Jsc - J0*(exp((V + J*Rs)/(n*Vt)) - 1) - (V + J*Rs)/Rsh
 * for the output current density at applied voltage v, using Newton-Raphson
 * starting from J = Jsc.
 * @param v applied voltage
 * @param params cell parameters, validated before iterating
 * @param settings step tolerance and iteration cap
 * @retval solve result, see SolveStatus
 */
SolveResult solveCurrent(double v, const CellParameters &params,
                         const SolverSettings &settings = SolverSettings());

}  // namespace PvCell
