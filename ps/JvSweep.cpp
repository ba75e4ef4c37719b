/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <functional>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>
#include "ps/JvSweep.hpp"
#include "utilities/Utilities.hpp"

Curve::Curve(std::vector<OperatingPoint> points) : m_points(std::move(points)) {
  if (m_points.empty()) {
    throw std::invalid_argument("Curve: no operating points");
  }
  for (size_t i = 1; i < m_points.size(); i++) {
    if (!(m_points[i].v > m_points[i - 1].v)) {
      throw std::invalid_argument(fmt::format(
          "Curve: voltage grid not strictly increasing at index {}", i));
    }
  }
}

size_t Curve::maxPowerIndex() const {
  size_t best = 0;
  for (size_t i = 1; i < m_points.size(); i++) {
    if (m_points[i].power() > m_points[best].power()) {
      best = i;
    }
  }
  return best;
}

JvSweep::JvSweep(const PvCell::CellParameters &params,
                 const PvCell::SolverSettings &settings, unsigned int threads)
    : m_params(params), m_settings(settings), m_threads(threads) {
  PvCell::validate(m_params);
  if (!(m_settings.tolerance > 0.0) || m_settings.maxIterations == 0) {
    throw std::invalid_argument(fmt::format(
        "JvSweep: invalid solver settings tolerance={} maxIterations={}",
        m_settings.tolerance, m_settings.maxIterations));
  }
  if (m_threads == 0) {
    throw std::invalid_argument("JvSweep: thread count must be >= 1");
  }
}

SweepRange JvSweep::referenceRange(double voc) {
  return SweepRange{PVSIM_SWEEP_START, voc + PVSIM_SWEEP_VOC_MARGIN,
                    PVSIM_SWEEP_POINTS};
}

double JvSweep::solveAt(double v) const {
  const auto r = PvCell::solveCurrent(v, m_params, m_settings);
  if (!r.converged()) {
    throw std::runtime_error(
        fmt::format("JvSweep: solve at v={} V returned {} after {} iterations",
                    v, PvCell::toString(r.status), r.iterations));
  }
  return r.current;
}

void JvSweep::solveSlice(const std::vector<double> &grid, size_t begin,
                         size_t end,
                         std::vector<PvCell::SolveResult> &results) const {
  for (size_t i = begin; i < end; i++) {
    results[i] = PvCell::solveCurrent(grid[i], m_params, m_settings);
  }
}

size_t JvSweep::workerCount(size_t samples) const {
  size_t n = std::min<size_t>(m_threads, samples);
  // hardware_concurrency() is 0 when unknown, keep the request then
  const unsigned int hw = std::thread::hardware_concurrency();
  if (hw > 0 && n > hw) {
    spdlog::debug("JvSweep: capping {:d} requested threads at {:d}", n, hw);
    n = hw;
  }
  return std::max<size_t>(n, 1);
}

Curve JvSweep::run(const SweepRange &range) const {
  const auto grid = Utility::linspace(range.start, range.stop, range.points);
  std::vector<PvCell::SolveResult> results(grid.size());

  const size_t nThreads = workerCount(grid.size());
  if (nThreads <= 1) {
    solveSlice(grid, 0, grid.size(), results);
  } else {
    // Contiguous chunks, the last one takes the remainder
    const size_t chunk = grid.size() / nThreads;
    std::vector<std::thread> workers;
    workers.reserve(nThreads);
    try {
      for (size_t t = 0; t < nThreads; t++) {
        const size_t begin = t * chunk;
        const size_t end = (t == nThreads - 1) ? grid.size() : begin + chunk;
        workers.emplace_back(&JvSweep::solveSlice, this, std::cref(grid),
                             begin, end, std::ref(results));
      }
    } catch (std::system_error &e) {
      // Started workers must be joined before the vector goes away
      for (auto &w : workers) {
        w.join();
      }
      spdlog::error("JvSweep: could only start {:d} of {:d} threads: {}",
                    workers.size(), nThreads, e.what());
      throw;
    }
    for (auto &w : workers) {
      w.join();
    }
  }

  std::vector<OperatingPoint> points;
  points.reserve(grid.size());
  for (size_t i = 0; i < grid.size(); i++) {
    const auto &r = results[i];
    if (!r.converged()) {
      spdlog::error("Sweep sample {:d} at v={:e} failed: {:s} after {:d} "
                    "iterations (last J={:e})",
                    i, grid[i], PvCell::toString(r.status), r.iterations,
                    r.current);
      throw std::runtime_error(fmt::format(
          "JvSweep: solve at v={} V returned {}", grid[i],
          PvCell::toString(r.status)));
    }
    points.push_back(OperatingPoint{grid[i], r.current});
  }

  spdlog::debug("Swept {:d} samples over [{:f}, {:f}] V on {:d} thread(s)",
                grid.size(), range.start, range.stop, nThreads);
  return Curve(std::move(points));
}
