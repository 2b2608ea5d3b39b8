// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * types.hpp
 *
 * Value types passed between the tracking stages.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef OCCLUTRACK_TYPES_HPP
#define OCCLUTRACK_TYPES_HPP

#include <cstdint>
#include <vector>

#include "occlutrack/geometry/beam_geometry.hpp"

namespace occlutrack {

/// Stable identifier of a tracked segment lineage.
using TrackId = uint64_t;

/**
 * @brief Contiguous (possibly wrapping) run of blocked beams in one frame.
 *
 * start_beam and end_beam are inclusive. A wrapping segment has
 * end_beam < start_beam. A fully blocked ring is 0-359.
 */
struct Segment {
  int start_beam = 0;
  int end_beam = 0;
  int width_beams = 1;
  int center_beam = 0;

  static Segment fromRange(int start, int end) {
    Segment s;
    s.start_beam = wrapBeam(start);
    s.end_beam = wrapBeam(end);
    s.width_beams = segmentWidth(s.start_beam, s.end_beam);
    s.center_beam = segmentCenter(s.start_beam, s.width_beams);
    return s;
  }

  bool wraps() const noexcept { return occlutrack::wraps(start_beam, end_beam); }

  bool operator==(const Segment& other) const {
    return start_beam == other.start_beam && end_beam == other.end_beam;
  }
  bool operator!=(const Segment& other) const { return !(*this == other); }
};

/// Segment after classification, with its angle range in degrees.
struct ClassifiedSegment {
  TrackId track_id = 0;
  int start_beam = 0;
  int end_beam = 0;
  int width_beams = 0;
  double start_deg = 0.0;  ///< Literal start angle, may exceed end_deg
  double end_deg = 0.0;
  double width_deg = 0.0;
  double stability = 0.0;  ///< In [0, 1]
  bool is_occlusion = false;
};

/// Per-frame report. segments holds only the reported occlusions.
struct FrameResult {
  int64_t timestep = 0;
  bool has_occlusion = false;
  std::vector<ClassifiedSegment> segments;
};

}  // namespace occlutrack

#endif  // OCCLUTRACK_TYPES_HPP
