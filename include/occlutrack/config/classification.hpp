// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * classification.hpp
 *
 * Occlusion vs. transient classification thresholds.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef OCCLUTRACK_CONFIG_CLASSIFICATION_HPP
#define OCCLUTRACK_CONFIG_CLASSIFICATION_HPP

namespace occlutrack::config {

/**
 * @brief Stability classification parameters.
 *
 * A segment is an occlusion when stability >= persistence_threshold and its
 * angular width >= min_occlusion_width_deg.
 */
struct Classification {
  double persistence_threshold = 0.7;    ///< In [0, 1]
  double min_occlusion_width_deg = 5.0;  ///< [deg], >= 0

  /// Stability denominator during warm-up.
  /// false: history_size (stability ramps up from zero).
  /// true: min(frames processed, history_size).
  bool normalize_during_warmup = false;
};

}  // namespace occlutrack::config

#endif  // OCCLUTRACK_CONFIG_CLASSIFICATION_HPP
