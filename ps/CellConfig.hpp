/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include "ps/CellMetrics.hpp"
#include "ps/JvSweep.hpp"
#include "ps/PvCell.hpp"

/*
 * Builds the simulation inputs from Config. Keys missing from the
 * configuration fall back to the reference GaAs p-i-n cell.
 */
namespace CellConfig {

/**
 * @brief loadParameters read the diode-model parameters.
 * @throws std::invalid_argument on malformed or physically invalid values
 */
PvCell::CellParameters loadParameters();

//! Read SolverTolerance and SolverMaxIterations
PvCell::SolverSettings loadSolverSettings();

/**
 * @brief loadSweepRange read the voltage grid. Without SweepStop the grid
 * ends 0.05 V past the open-circuit voltage of the model.
 * @param sweep used to estimate Voc when SweepStop is absent
 */
SweepRange loadSweepRange(const JvSweep &sweep);

/**
 * @brief loadMeasured read measured reference figures.
 * @param[out] measured filled if MeasuredVoc is configured
 * @retval true if measured figures are configured
 * @throws std::invalid_argument if MeasuredVoc is present but any other
 * measured figure is missing
 */
bool loadMeasured(MeasuredMetrics &measured);

//! Read LogLevel and apply it to spdlog
void applyLogLevel();

}  // namespace CellConfig
