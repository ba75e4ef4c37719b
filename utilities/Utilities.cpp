/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <stddef.h>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>
#include "utilities/Utilities.hpp"

std::vector<double> Utility::linspace(double start, double stop,
                                      size_t points) {
  if (points < 2 || !(stop > start) || !std::isfinite(start) ||
      !std::isfinite(stop)) {
    throw std::invalid_argument(
        fmt::format("linspace: invalid interval [{}, {}] with {} points",
                    start, stop, points));
  }

  std::vector<double> res(points);
  const double step = (stop - start) / static_cast<double>(points - 1);
  for (size_t i = 0; i < points - 1; i++) {
    res[i] = start + static_cast<double>(i) * step;
  }
  res[points - 1] = stop;  // Avoid rounding drift on the endpoint
  return res;
}

void Utility::assertFileExists(const std::string &filename) {
  std::ifstream ifile(filename.c_str());
  if (!(bool)ifile) {
    spdlog::error("File {} does not exist.", filename);
    throw std::invalid_argument(fmt::format("File {} does not exist.", filename));
  }
}

void Utility::createDirectories(const std::string &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    throw std::runtime_error(fmt::format(
        "Failed to create output directory at {}: {}", path, ec.message()));
  }
}
