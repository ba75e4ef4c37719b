/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stddef.h>
#include <string>
#include <vector>

namespace Utility {

/**
 * @brief linspace evenly spaced samples over a closed interval.
 * The first sample equals start and the last equals stop exactly.
 * @param start first sample
 * @param stop last sample, must be > start
 * @param points number of samples, must be >= 2
 * @throws std::invalid_argument on an empty or reversed interval
 */
std::vector<double> linspace(double start, double stop, size_t points);

/**
 * @brief assertFileExists Check that a file exists and is readable.
 * @param filename
 * @throws std::invalid_argument if the file can't be opened
 */
void assertFileExists(const std::string &filename);

/**
 * @brief createDirectories Create a directory path, including parents.
 * @param path
 * @throws std::runtime_error if the directory could not be created
 */
void createDirectories(const std::string &path);

}  // namespace Utility
