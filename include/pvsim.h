/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

/*
 * @brief Reference constants and defaults shared by the pvsim solver, sweep
 * and report layers.
 */

#ifndef __PVSIM_H
#define __PVSIM_H

/* ------ Newton-Raphson defaults ------ */
#define PVSIM_SOLVER_TOLERANCE 1.0e-10  //! Absolute step tolerance [mA/cm^2]
#define PVSIM_SOLVER_MAX_ITERATIONS 100 //! Iteration cap per solve

/* ------ Reference sweep ------ */
#define PVSIM_SWEEP_START -0.1      //! First grid voltage [V]
#define PVSIM_SWEEP_VOC_MARGIN 0.05 //! Grid extends this far past Voc [V]
#define PVSIM_SWEEP_POINTS 500      //! Number of grid samples

/* ------ Metric extraction ------ */
#define PVSIM_METRIC_VOLTAGE_TOLERANCE 1.0e-9 //! Voc/MPP refinement [V]
#define PVSIM_INCIDENT_POWER_DENSITY 100.0    //! AM1.5G [mW/cm^2]
#define PVSIM_CROSS_CHECK_TOLERANCE 0.02      //! Relative tolerance

#endif
