// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * beam_geometry.hpp
 *
 * Beam index <-> angle conversion on the 360-beam ring.
 *
 * Angle convention: every angle returned here is normalized into
 * [-180, 180) degrees. Angle ranges are reported with their literal start
 * and end angles, so a range crossing the +-180 seam reads "start > end".
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef OCCLUTRACK_GEOMETRY_BEAM_GEOMETRY_HPP
#define OCCLUTRACK_GEOMETRY_BEAM_GEOMETRY_HPP

#include "occlutrack/scan_frame.hpp"

namespace occlutrack {

/// Wrap any beam offset (negative or >= kNumBeams) onto [0, kNumBeams).
constexpr int wrapBeam(int beam) noexcept {
  const int r = beam % kNumBeams;
  return r < 0 ? r + kNumBeams : r;
}

/// Normalize an angle into [-180, 180) degrees.
double normalizeDegrees(double degrees) noexcept;

/// angle_min_deg + beam * (angle_span_deg / kNumBeams), normalized.
double beamToDegrees(int beam, double angle_min_deg,
                     double angle_span_deg) noexcept;

/// Angular width covered by width_beams beams [deg].
double beamsToDegrees(int width_beams, double angle_span_deg) noexcept;

/// Minimal index difference on the ring: min(|a-b|, kNumBeams - |a-b|).
int circularDistance(int a, int b) noexcept;

/// True if a segment ending at end crosses the 359 -> 0 boundary.
constexpr bool wraps(int start, int end) noexcept { return end < start; }

/// Inclusive beam count from start to end, walking forward around the ring.
constexpr int segmentWidth(int start, int end) noexcept {
  return wrapBeam(end - start) + 1;
}

/// Circular midpoint of a segment (rounded towards start).
constexpr int segmentCenter(int start, int width) noexcept {
  return wrapBeam(start + (width - 1) / 2);
}

}  // namespace occlutrack

#endif  // OCCLUTRACK_GEOMETRY_BEAM_GEOMETRY_HPP
