// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "occlutrack/classification/stability_classifier.hpp"

#include <algorithm>

#include "occlutrack/geometry/beam_geometry.hpp"

namespace occlutrack {

double computeStability(const TrackedSegment& track,
                        const TrackedSegmentStore& store,
                        const config::Classification& config) {
  const int window = config.normalize_during_warmup ? store.framesInWindow()
                                                    : store.historySize();
  if (window <= 0) return 0.0;
  const double stability = static_cast<double>(track.match_count) / window;
  return std::clamp(stability, 0.0, 1.0);
}

std::vector<ClassifiedSegment> classifySegments(
    const std::vector<TrackId>& assignments, const TrackedSegmentStore& store,
    const config::Geometry& geometry, const config::Classification& config) {
  std::vector<ClassifiedSegment> classified;
  classified.reserve(assignments.size());

  for (TrackId id : assignments) {
    const TrackedSegment& track = store.at(id);
    const Segment& seg = track.current_position;

    ClassifiedSegment out;
    out.track_id = id;
    out.start_beam = seg.start_beam;
    out.end_beam = seg.end_beam;
    out.width_beams = seg.width_beams;
    out.start_deg = beamToDegrees(seg.start_beam, geometry.angle_min_deg,
                                  geometry.angle_span_deg);
    out.end_deg = beamToDegrees(seg.end_beam, geometry.angle_min_deg,
                                geometry.angle_span_deg);
    out.width_deg = beamsToDegrees(seg.width_beams, geometry.angle_span_deg);
    out.stability = computeStability(track, store, config);
    out.is_occlusion = out.stability >= config.persistence_threshold &&
                       out.width_deg >= config.min_occlusion_width_deg;
    classified.push_back(out);
  }
  return classified;
}

}  // namespace occlutrack
