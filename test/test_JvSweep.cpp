/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <assert.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <stdexcept>
#include <thread>
#include <vector>
#include "ps/JvSweep.hpp"
#include "ps/PvCell.hpp"
#include "utilities/Utilities.hpp"

namespace {
const PvCell::CellParameters k_reference{30.52638788, 1e-12, 1.2, 0.02585,
                                         0.001,       10000.0};
}  // namespace

int main() {
  spdlog::info("------ TEST: linspace hits both endpoints");
  {
    const auto grid = Utility::linspace(-0.1, 1.058312, 500);
    assert(grid.size() == 500);
    assert(grid.front() == -0.1);
    assert(grid.back() == 1.058312);
    const double step = (1.058312 + 0.1) / 499.0;
    for (size_t i = 1; i < grid.size(); i++) {
      assert(grid[i] > grid[i - 1]);
      assert(std::abs((grid[i] - grid[i - 1]) - step) < 1e-12);
    }
  }

  spdlog::info("------ TEST: linspace rejects empty and reversed intervals");
  {
    auto failures = 0;
    try {
      Utility::linspace(0.0, 1.0, 1);
    } catch (std::invalid_argument &e) {
      failures++;
    }
    try {
      Utility::linspace(1.0, 1.0, 10);
    } catch (std::invalid_argument &e) {
      failures++;
    }
    try {
      Utility::linspace(1.0, 0.0, 10);
    } catch (std::invalid_argument &e) {
      failures++;
    }
    assert(failures == 3);
  }

  spdlog::info("------ TEST: Reference range");
  {
    const auto range = JvSweep::referenceRange(1.008312);
    assert(range.start == -0.1);
    assert(std::abs(range.stop - 1.058312) < 1e-12);
    assert(range.points == 500);
  }

  spdlog::info("------ TEST: Sweep samples match single-point solves");
  JvSweep serial(k_reference);
  const auto range = JvSweep::referenceRange(1.008312);
  const Curve curve = serial.run(range);
  {
    assert(curve.size() == range.points);
    assert(curve[0].v == range.start);
    assert(curve[curve.size() - 1].v == range.stop);
    for (size_t i = 0; i < curve.size(); i++) {
      const auto r = PvCell::solveCurrent(curve[i].v, k_reference);
      assert(r.converged());
      assert(curve[i].j == r.current);
      assert(curve[i].power() == curve[i].v * curve[i].j);
      if (i > 0) {
        assert(curve[i].v > curve[i - 1].v);
      }
    }
    assert(serial.solveAt(0.5) == PvCell::solveCurrent(0.5, k_reference).current);
  }

  spdlog::info("------ TEST: Threaded sweeps are identical to the serial one");
  {
    for (unsigned int threads : {2u, 4u, 7u}) {
      JvSweep parallel(k_reference, PvCell::SolverSettings(), threads);
      const Curve c = parallel.run(range);
      assert(c.size() == curve.size());
      for (size_t i = 0; i < c.size(); i++) {
        assert(c[i].v == curve[i].v);
        assert(c[i].j == curve[i].j);
      }
    }
  }

  spdlog::info("------ TEST: More threads than samples");
  {
    JvSweep parallel(k_reference, PvCell::SolverSettings(), 8);
    const Curve c = parallel.run(SweepRange{0.0, 0.5, 3});
    assert(c.size() == 3);
    assert(c[1].v == 0.25);
    assert(parallel.workerCount(3) <= 3);
  }

  spdlog::info("------ TEST: Thread count is capped by the hardware");
  {
    JvSweep wide(k_reference, PvCell::SolverSettings(), 100000);
    assert(wide.threads() == 100000);
    const unsigned int hw = std::thread::hardware_concurrency();
    const size_t workers = wide.workerCount(200000);
    assert(workers >= 1);
    if (hw > 0) {
      assert(workers <= hw);
    }
    const Curve c = wide.run(range);
    assert(c.size() == curve.size());
    for (size_t i = 0; i < c.size(); i++) {
      assert(c[i].j == curve[i].j);
    }
  }

  spdlog::info("------ TEST: Maximum power sample");
  {
    const size_t best = curve.maxPowerIndex();
    for (const auto &p : curve) {
      assert(p.power() <= curve[best].power());
    }
    assert(curve.maxPower() == curve[best].power());
    assert(curve[best].v > 0.0 && curve[best].j > 0.0);
  }

  spdlog::info("------ TEST: Non-convergent samples fail the sweep");
  {
    PvCell::SolverSettings settings;
    settings.maxIterations = 1;
    JvSweep capped(k_reference, settings);
    auto success = false;
    try {
      capped.run(range);
    } catch (std::runtime_error &e) {
      success = true;
    }
    assert(success);

    success = false;
    try {
      capped.solveAt(0.9);
    } catch (std::runtime_error &e) {
      success = true;
    }
    assert(success);
  }

  spdlog::info("------ TEST: Invalid sweep construction");
  {
    auto failures = 0;
    PvCell::CellParameters bad = k_reference;
    bad.rsh = -1.0;
    try {
      JvSweep s(bad);
    } catch (std::invalid_argument &e) {
      failures++;
    }
    try {
      JvSweep s(k_reference, PvCell::SolverSettings(), 0);
    } catch (std::invalid_argument &e) {
      failures++;
    }
    try {
      serial.run(SweepRange{0.5, 0.0, 10});
    } catch (std::invalid_argument &e) {
      failures++;
    }
    assert(failures == 3);
  }

  spdlog::info("------ TEST: Curve requires a strictly increasing grid");
  {
    auto success = false;
    try {
      Curve c(std::vector<OperatingPoint>{{0.0, 1.0}, {0.0, 0.5}});
    } catch (std::invalid_argument &e) {
      success = true;
    }
    assert(success);
  }

  return 0;
}
