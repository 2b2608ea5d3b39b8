// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * scan_frame.hpp
 *
 * One 360-beam range scan, validated at construction.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef OCCLUTRACK_SCAN_FRAME_HPP
#define OCCLUTRACK_SCAN_FRAME_HPP

#include <Eigen/Core>
#include <cstdint>
#include <vector>

namespace occlutrack {

/// Number of beams in one scan (one per degree of the sensor ring).
constexpr int kNumBeams = 360;

using BeamArray = Eigen::Array<float, kNumBeams, 1>;
using BeamMask = Eigen::Array<bool, kNumBeams, 1>;

/**
 * @brief Immutable range scan.
 *
 * Each range is either a finite non-negative distance [m] or an infinity
 * meaning "no return". The sign of an infinity is not significant.
 *
 * Construction throws MalformedFrame when the beam count is not kNumBeams,
 * or a value is NaN or a negative finite number.
 */
class ScanFrame {
 public:
  ScanFrame(int64_t timestep, const BeamArray& ranges);
  ScanFrame(int64_t timestep, const std::vector<float>& ranges);

  int64_t timestep() const noexcept { return timestep_; }
  const BeamArray& ranges() const noexcept { return ranges_; }
  float range(int beam) const { return ranges_(beam); }

  /// Beams with no return. Readings >= max_range are included as well when
  /// treat_max_as_blocked is set.
  BeamMask blockedMask(bool treat_max_as_blocked = false,
                       float max_range = 0.0f) const;

 private:
  void validate() const;

  int64_t timestep_;
  BeamArray ranges_;
};

}  // namespace occlutrack

#endif  // OCCLUTRACK_SCAN_FRAME_HPP
