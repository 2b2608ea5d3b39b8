// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * extraction.hpp
 *
 * Segment extraction configuration.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef OCCLUTRACK_CONFIG_EXTRACTION_HPP
#define OCCLUTRACK_CONFIG_EXTRACTION_HPP

#include <limits>

namespace occlutrack::config {

/**
 * @brief Blocked-run extraction parameters.
 *
 * Runs separated by at most gap_merge_beams clear beams are merged, then
 * segments narrower than min_segment_beams are dropped.
 */
struct Extraction {
  int min_segment_beams = 5;  ///< Minimum segment width [beams], >= 1
  int gap_merge_beams = 2;    ///< Largest clear gap bridged [beams], >= 0

  /// Also treat readings at or beyond max_range as "no return".
  /// Useful for drivers that report max range instead of infinity.
  bool treat_max_range_as_blocked = false;
  float max_range = std::numeric_limits<float>::infinity();  ///< [m]
};

}  // namespace occlutrack::config

#endif  // OCCLUTRACK_CONFIG_EXTRACTION_HPP
