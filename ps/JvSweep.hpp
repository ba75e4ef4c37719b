/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stddef.h>
#include <vector>
#include "ps/PvCell.hpp"

/**
 * @brief A solved (voltage, current density) sample.
 */
struct OperatingPoint {
  double v;  //! Applied voltage [V]
  double j;  //! Current density [mA/cm^2]

  //! Power density [mW/cm^2]
  double power() const { return v * j; }
};

/**
 * @brief Operating points over a strictly increasing voltage grid. Read-only
 * once built.
 */
class Curve {
 public:
  typedef std::vector<OperatingPoint>::const_iterator const_iterator;

  explicit Curve(std::vector<OperatingPoint> points);

  size_t size() const { return m_points.size(); }
  const OperatingPoint &operator[](size_t i) const { return m_points[i]; }
  const_iterator begin() const { return m_points.begin(); }
  const_iterator end() const { return m_points.end(); }

  /**
   * @brief maxPowerIndex index of the sample with the largest power density.
   * The first one wins on ties.
   */
  size_t maxPowerIndex() const;

  //! Largest sampled power density [mW/cm^2]
  double maxPower() const { return m_points[maxPowerIndex()].power(); }

 private:
  std::vector<OperatingPoint> m_points;
};

/**
 * @brief Voltage grid of a sweep.
 */
struct SweepRange {
  double start;   //! [V]
  double stop;    //! [V]
  size_t points;  //! Number of samples, including both ends
};

/**
 * @brief JvSweep solves the single-diode model over a voltage grid.
 *
 * Samples are independent, so the grid may be split over several threads.
 * Each thread fills a disjoint slice of the output, the resulting curve is
 * identical for any thread count.
 */
class JvSweep {
 public:
  /**
   * @brief JvSweep
   * @param params cell parameters, validated here
   * @param settings Newton-Raphson settings used for every sample
   * @param threads number of worker threads, 1 solves on the calling thread
   */
  explicit JvSweep(const PvCell::CellParameters &params,
                   const PvCell::SolverSettings &settings =
                       PvCell::SolverSettings(),
                   unsigned int threads = 1);

  /**
   * @brief run Solve every voltage of the grid.
   * @param range grid bounds and size
   * @retval curve in ascending voltage order
   * @throws std::invalid_argument on an invalid grid
   * @throws std::runtime_error if any sample fails to converge
   */
  Curve run(const SweepRange &range) const;

  /**
   * @brief referenceRange the standard grid, -0.1 V to voc + 0.05 V with 500
   * samples.
   */
  static SweepRange referenceRange(double voc);

  /**
   * @brief solveAt Current density at a single voltage.
   * @throws std::runtime_error if the solve fails to converge
   */
  double solveAt(double v) const;

  const PvCell::CellParameters &parameters() const { return m_params; }
  const PvCell::SolverSettings &settings() const { return m_settings; }
  unsigned int threads() const { return m_threads; }

  /**
   * @brief workerCount Threads run() starts for a grid of @p samples, the
   * requested count capped by the grid size and the hardware concurrency.
   */
  size_t workerCount(size_t samples) const;

 private:
  void solveSlice(const std::vector<double> &grid, size_t begin, size_t end,
                  std::vector<PvCell::SolveResult> &results) const;

  const PvCell::CellParameters m_params;
  const PvCell::SolverSettings m_settings;
  const unsigned int m_threads;
};
