// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * temporal_matcher.hpp
 *
 * Frame-to-history association of candidate segments.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef OCCLUTRACK_TRACKING_TEMPORAL_MATCHER_HPP
#define OCCLUTRACK_TRACKING_TEMPORAL_MATCHER_HPP

#include <cstdint>
#include <vector>

#include "occlutrack/config/tracking.hpp"
#include "occlutrack/tracking/tracked_segment_store.hpp"
#include "occlutrack/types.hpp"

namespace occlutrack {

/// Outcome of matching one frame against the store.
struct MatchResult {
  std::vector<TrackId> assignments;  ///< Lineage of each candidate, in order
  std::vector<TrackId> created;
  std::vector<TrackId> evicted;
};

/**
 * @brief Match a frame's candidates against the store and update it.
 *
 * A candidate may match a tracked segment whose center lies within
 * drift_tolerance_beams (circular distance). Assignment is greedy,
 * nearest first; equal distances prefer the higher existing match_count,
 * then the older lineage. Each side is matched at most once.
 *
 * - Matched lineage: position replaced, hit recorded, last seen updated.
 * - Unmatched candidate: new lineage with match_count = 1.
 * - Unmatched lineage: miss recorded; evicted after history_size frames
 *   without a match.
 *
 * Advances the store by one frame.
 *
 * @param candidates Segments extracted from the current frame
 * @param store Tracking history (mutated)
 * @param timestep Timestep of the current frame
 * @param config Tracking configuration
 */
MatchResult matchSegments(const std::vector<Segment>& candidates,
                          TrackedSegmentStore& store, int64_t timestep,
                          const config::Tracking& config);

}  // namespace occlutrack

#endif  // OCCLUTRACK_TRACKING_TEMPORAL_MATCHER_HPP
