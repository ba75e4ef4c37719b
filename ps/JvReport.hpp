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

/**
 * class JvReport renders a solved J-V curve and its metrics.
 *
 * Output: a csv-formatted dump of the curve, a gnuplot script drawing the J-V
 * and power-density curves from that dump, and a textual performance
 * summary. Measured figures, when given, are printed next to the derived
 * ones.
 */
class JvReport {
 public:
  /* ------ Public methods ------ */

  //! Constructor
  JvReport(const std::string &description, const Curve &curve,
           const CellMetrics &metrics,
           const MeasuredMetrics *measured = nullptr);

  /**
   * @brief writeCsv write voltage, current density and power density of
   * every sample.
   * @param path output file, overwritten
   * @throws std::runtime_error if the file can't be opened
   */
  void writeCsv(const std::string &path) const;

  /**
   * @brief writeGnuplotScript write a gnuplot script plotting the csv file
   * written by writeCsv.
   * @param path output file, overwritten
   * @param csvFile csv file as seen from the script's working directory
   * @param imageFile png file the script renders to
   * @throws std::runtime_error if the file can't be opened
   */
  void writeGnuplotScript(const std::string &path, const std::string &csvFile,
                          const std::string &imageFile) const;

  //! Performance analysis text
  std::string summary() const;

  //! Qualitative evaluation against state-of-the-art thresholds
  std::string evaluation() const;

 private:
  /* ------ Private methods ------ */
  std::string measuredSuffix(double MeasuredMetrics::*field, double scale,
                             int precision, const std::string &unit) const;

  /* ------ Private variables ------ */
  const std::string m_description;
  const Curve m_curve;
  const CellMetrics m_metrics;
  const MeasuredMetrics *m_measured;  //! nullptr if no measurement
};
