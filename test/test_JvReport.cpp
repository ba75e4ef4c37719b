/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <assert.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "ps/CellMetrics.hpp"
#include "ps/JvReport.hpp"
#include "ps/JvSweep.hpp"
#include "utilities/Utilities.hpp"

namespace {
std::string readFile(const std::string &path) {
  std::ifstream f(path);
  std::stringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}
}  // namespace

int main() {
  const Curve curve(std::vector<OperatingPoint>{{-0.1, 31.0},
                                                {0.0, 31.0},
                                                {0.5, 30.8},
                                                {0.92, 30.0},
                                                {1.0, 0.0},
                                                {1.05, -20.0}});
  const CellMetrics good{1.0, 31.0, 0.92, 30.0, 27.6, 0.89, 0.276};
  const MeasuredMetrics lab{1.008312, 30.52638788, 0.883105,
                            0.271821, 0.915723,    29.68373326};

  spdlog::info("------ TEST: CSV dump of the curve");
  {
    JvReport report("Test cell", curve, good);
    const std::string path = "/tmp/pvsim_test_jv.csv";
    report.writeCsv(path);

    std::ifstream f(path);
    std::string line;
    std::vector<std::string> lines;
    while (std::getline(f, line)) {
      lines.push_back(line);
    }
    assert(lines.size() == curve.size() + 1);
    assert(lines[0] ==
           "voltage_V,current_density_mA_cm2,power_density_mW_cm2");
    assert(lines[1] == "-0.1,31,-3.1");
    assert(lines[4] == "0.92,30,27.6");
    assert(lines[6] == "1.05,-20,-21");
  }

  spdlog::info("------ TEST: Output directories with shell quotes in the name");
  {
    const std::string dir = "/tmp/pvsim it's/nested dir";
    Utility::createDirectories(dir);
    Utility::createDirectories(dir);  // Existing directory is fine
    JvReport report("Test cell", curve, good);
    report.writeCsv(dir + "/jv.csv");
    Utility::assertFileExists(dir + "/jv.csv");

    auto success = false;
    try {
      Utility::createDirectories("/tmp/pvsim_test_jv.csv/sub");
    } catch (std::runtime_error &e) {
      success = true;
    }
    assert(success);
  }

  spdlog::info("------ TEST: Unwritable output throws");
  {
    JvReport report("Test cell", curve, good);
    auto success = false;
    try {
      report.writeCsv("/nonexistent-dir/pvsim.csv");
    } catch (std::runtime_error &e) {
      success = true;
    }
    assert(success);
  }

  spdlog::info("------ TEST: Gnuplot script plots the csv file");
  {
    JvReport report("Test cell", curve, good);
    const std::string path = "/tmp/pvsim_test_jv.gp";
    report.writeGnuplotScript(path, "test_jv.csv", "test_jv.png");
    const auto script = readFile(path);
    assert(contains(script, "set output 'test_jv.png'"));
    assert(contains(script, "plot 'test_jv.csv' every ::1 using 1:2"));
    assert(contains(script, "'test_jv.csv' every ::1 using 1:3 axes x1y2"));
    assert(contains(script, "set xrange [-0.1:1.05]"));
    assert(contains(script, "Efficiency (η) = 27.60% | Fill Factor (FF) = "
                            "89.00%"));
    assert(contains(script, "title 'Voc = 1.000 V'"));
    assert(contains(script, "set object 1 rect from 0,0 to 0.92,30"));
  }

  spdlog::info("------ TEST: Summary without measured figures");
  {
    JvReport report("Test cell", curve, good);
    const auto s = report.summary();
    assert(contains(s, "=== SOLAR CELL PERFORMANCE ANALYSIS ==="));
    assert(contains(s, "1. Open-Circuit Voltage (Voc): 1.000 V\n"));
    assert(contains(s, "2. Short-Circuit Current Density (Jsc): 31.00 mA/cm²"));
    assert(contains(s, "3. Fill Factor (FF): 89.00%"));
    assert(contains(s, "4. Efficiency (η): 27.60%"));
    assert(contains(s, "   - Voltage (V_MPP): 0.920 V (92.0% of Voc)"));
    assert(contains(s, "   - Current (J_MPP): 30.00 mA/cm² (96.8% of Jsc)"));
    assert(contains(s, "   - Power Density: 27.600 mW/cm²"));
    assert(contains(s, "6. Theoretical Maximum Power: 27.590 mW/cm²"));
    assert(contains(s, "7. Test cell"));
    assert(!contains(s, "measured"));
  }

  spdlog::info("------ TEST: Summary with measured figures");
  {
    JvReport report("Test cell", curve, good, &lab);
    const auto s = report.summary();
    assert(contains(s, "1. Open-Circuit Voltage (Voc): 1.000 V [measured: "
                       "1.008 V]"));
    assert(contains(s, "3. Fill Factor (FF): 89.00% [measured: 88.31%]"));
    assert(contains(s, "[measured: 29.68 mA/cm²]"));
  }

  spdlog::info("------ TEST: Evaluation thresholds");
  {
    JvReport report("Test cell", curve, good);
    const auto e = report.evaluation();
    assert(contains(e, "=== PERFORMANCE EVALUATION ==="));
    assert(contains(e, "✓ Excellent efficiency (>27%)"));
    assert(contains(e, "✓ Outstanding fill factor (>88%)"));
    assert(contains(e, "✓ Very high current density (>30 mA/cm²)"));
    assert(contains(e, "✓ Competitive with state-of-the-art GaAs cells"));

    CellMetrics weak = good;
    weak.efficiency = 0.25;
    weak.fillFactor = 0.86;
    const auto w = JvReport("Test cell", curve, weak).evaluation();
    assert(contains(w, "✗ Efficiency below 27%"));
    assert(contains(w, "✗ Fill factor below 88%"));
    assert(contains(w, "✓ Very high current density"));
    assert(contains(w, "✗ Below state-of-the-art GaAs cells"));
  }

  return 0;
}
