/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include "ps/JvReport.hpp"

namespace {
// Thresholds of the qualitative evaluation
const double k_efficiencyThreshold = 0.27;
const double k_fillFactorThreshold = 0.88;
const double k_currentDensityThreshold = 30.0;  // [mA/cm^2]

std::ofstream openOutput(const std::string &path) {
  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f.good()) {
    throw std::runtime_error(fmt::format("Can't open output file at {}", path));
  }
  return f;
}
}  // namespace

JvReport::JvReport(const std::string &description, const Curve &curve,
                   const CellMetrics &metrics, const MeasuredMetrics *measured)
    : m_description(description),
      m_curve(curve),
      m_metrics(metrics),
      m_measured(measured) {}

void JvReport::writeCsv(const std::string &path) const {
  auto f = openOutput(path);
  f << "voltage_V,current_density_mA_cm2,power_density_mW_cm2\n";
  for (const auto &p : m_curve) {
    f << fmt::format("{:.9g},{:.12g},{:.12g}\n", p.v, p.j, p.power());
  }
  if (!f.good()) {
    throw std::runtime_error(fmt::format("Failed writing {}", path));
  }
  spdlog::info("Wrote {:d} samples to {:s}", m_curve.size(), path);
}

void JvReport::writeGnuplotScript(const std::string &path,
                                  const std::string &csvFile,
                                  const std::string &imageFile) const {
  const auto &m = m_metrics;
  const double vStart = m_curve[0].v;
  const double vStop = m_curve[m_curve.size() - 1].v;

  auto f = openOutput(path);
  f << "# J-V and power density of " << m_description << "\n";
  f << "set terminal pngcairo size 1000,700 enhanced font ',12'\n";
  f << fmt::format("set output '{}'\n", imageFile);
  f << "set datafile separator ','\n";
  f << fmt::format(
      "set title \"Current-Voltage (J-V) Characteristics of {}\\n"
      "Efficiency (η) = {:.2f}% | Fill Factor (FF) = {:.2f}%\" "
      "font ',14'\n",
      m_description, m.efficiency * 100.0, m.fillFactor * 100.0);
  f << "set xlabel 'Voltage (V)'\n";
  f << "set ylabel 'Current Density (mA/cm²)' textcolor rgb 'blue'\n";
  f << "set y2label 'Power Density (mW/cm²)' textcolor rgb 'red'\n";
  f << fmt::format("set xrange [{:g}:{:g}]\n", vStart, vStop);
  f << fmt::format("set yrange [-2:{:g}]\n", m.jsc * 1.1);
  f << fmt::format("set y2range [0:{:g}]\n", m_curve.maxPower() * 1.1);
  f << "set ytics nomirror textcolor rgb 'blue'\n";
  f << "set y2tics textcolor rgb 'red'\n";
  f << "set grid\n";
  f << "set key top right\n";

  // Maximum power rectangle and reference lines
  f << fmt::format("set object 1 rect from 0,0 to {:g},{:g} fc rgb 'orange' "
                   "fs transparent solid 0.2 noborder\n",
                   m.vmpp, m.jmpp);
  f << "set arrow from graph 0, first 0 to graph 1, first 0 nohead "
       "lc rgb 'black' lw 0.5\n";
  f << "set arrow from 0, graph 0 to 0, graph 1 nohead lc rgb 'black' "
       "lw 0.5\n";
  f << fmt::format("set arrow from {:g}, graph 0 to {:g}, graph 1 nohead "
                   "dt 2 lc rgb 'red'\n",
                   m.voc, m.voc);
  f << fmt::format("set arrow from graph 0, first {:g} to graph 1, first {:g} "
                   "nohead dt 2 lc rgb 'dark-green'\n",
                   m.jsc, m.jsc);

  f << fmt::format(
      "set label 1 \"Voc = {:.3f} V\\nJsc = {:.2f} mA/cm²\\nFF = {:.2f}%\\n"
      "η = {:.2f}%\\nV_MPP = {:.3f} V\\nJ_MPP = {:.2f} mA/cm²\\n{}\" "
      "at graph 0.02, graph 0.98 left front boxed\n",
      m.voc, m.jsc, m.fillFactor * 100.0, m.efficiency * 100.0, m.vmpp,
      m.jmpp, m_description);

  // Key points as inline data blocks
  f << fmt::format("$voc << EOD\n{:g} 0\nEOD\n", m.voc);
  f << fmt::format("$jsc << EOD\n0 {:g}\nEOD\n", m.jsc);
  f << fmt::format("$mpp << EOD\n{:g} {:g}\nEOD\n", m.vmpp, m.jmpp);

  f << fmt::format(
      "plot '{0}' every ::1 using 1:2 with lines lw 2.5 lc rgb 'blue' "
      "title 'J-V Curve', \\\n"
      "     '{0}' every ::1 using 1:3 axes x1y2 with lines dt 2 lw 1.5 "
      "lc rgb 'red' title 'Power', \\\n"
      "     $voc using 1:2 with points pt 7 ps 2 lc rgb 'red' "
      "title 'Voc = {1:.3f} V', \\\n"
      "     $jsc using 1:2 with points pt 7 ps 2 lc rgb 'dark-green' "
      "title 'Jsc = {2:.2f} mA/cm²', \\\n"
      "     $mpp using 1:2 with points pt 7 ps 2 lc rgb 'magenta' "
      "title 'MPP: ({3:.3f} V, {4:.2f} mA/cm²), {5:.2f} mW/cm²'\n",
      csvFile, m.voc, m.jsc, m.vmpp, m.jmpp, m.pmax);

  if (!f.good()) {
    throw std::runtime_error(fmt::format("Failed writing {}", path));
  }
  spdlog::info("Wrote gnuplot script to {:s}", path);
}

std::string JvReport::measuredSuffix(double MeasuredMetrics::*field,
                                     double scale, int precision,
                                     const std::string &unit) const {
  if (m_measured == nullptr) {
    return "";
  }
  return fmt::format(" [measured: {:.{}f}{}]", m_measured->*field * scale,
                     precision, unit);
}

std::string JvReport::summary() const {
  const auto &m = m_metrics;
  std::ostringstream s;
  s << "=== SOLAR CELL PERFORMANCE ANALYSIS ===\n";
  s << fmt::format("1. Open-Circuit Voltage (Voc): {:.3f} V", m.voc)
    << measuredSuffix(&MeasuredMetrics::voc, 1.0, 3, " V") << "\n";
  s << fmt::format("2. Short-Circuit Current Density (Jsc): {:.2f} mA/cm²",
                   m.jsc)
    << measuredSuffix(&MeasuredMetrics::jsc, 1.0, 2, " mA/cm²") << "\n";
  s << fmt::format("3. Fill Factor (FF): {:.2f}%", m.fillFactor * 100.0)
    << measuredSuffix(&MeasuredMetrics::fillFactor, 100.0, 2, "%") << "\n";
  s << fmt::format("4. Efficiency (η): {:.2f}%", m.efficiency * 100.0)
    << measuredSuffix(&MeasuredMetrics::efficiency, 100.0, 2, "%") << "\n";
  s << "5. Maximum Power Point:\n";
  s << fmt::format("   - Voltage (V_MPP): {:.3f} V ({:.1f}% of Voc)", m.vmpp,
                   m.vmpp / m.voc * 100.0)
    << measuredSuffix(&MeasuredMetrics::vmpp, 1.0, 3, " V") << "\n";
  s << fmt::format("   - Current (J_MPP): {:.2f} mA/cm² ({:.1f}% of Jsc)",
                   m.jmpp, m.jmpp / m.jsc * 100.0)
    << measuredSuffix(&MeasuredMetrics::jmpp, 1.0, 2, " mA/cm²") << "\n";
  s << fmt::format("   - Power Density: {:.3f} mW/cm²\n", m.pmax);
  s << fmt::format("6. Theoretical Maximum Power: {:.3f} mW/cm²\n",
                   m.voc * m.jsc * m.fillFactor);
  s << fmt::format("7. {}\n", m_description);
  return s.str();
}

std::string JvReport::evaluation() const {
  const auto &m = m_metrics;
  std::ostringstream s;
  s << "=== PERFORMANCE EVALUATION ===\n";
  s << (m.efficiency > k_efficiencyThreshold
            ? fmt::format("✓ Excellent efficiency (>{:.0f}%)\n",
                          k_efficiencyThreshold * 100.0)
            : fmt::format("✗ Efficiency below {:.0f}%\n",
                          k_efficiencyThreshold * 100.0));
  s << (m.fillFactor > k_fillFactorThreshold
            ? fmt::format("✓ Outstanding fill factor (>{:.0f}%)\n",
                          k_fillFactorThreshold * 100.0)
            : fmt::format("✗ Fill factor below {:.0f}%\n",
                          k_fillFactorThreshold * 100.0));
  s << (m.jsc > k_currentDensityThreshold
            ? fmt::format("✓ Very high current density (>{:.0f} mA/cm²)\n",
                          k_currentDensityThreshold)
            : fmt::format("✗ Current density below {:.0f} mA/cm²\n",
                          k_currentDensityThreshold));
  const bool competitive = m.efficiency > k_efficiencyThreshold &&
                           m.fillFactor > k_fillFactorThreshold &&
                           m.jsc > k_currentDensityThreshold;
  s << (competitive ? "✓ Competitive with state-of-the-art GaAs cells\n"
                    : "✗ Below state-of-the-art GaAs cells\n");
  return s.str();
}
