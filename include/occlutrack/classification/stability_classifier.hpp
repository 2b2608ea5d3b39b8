// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * stability_classifier.hpp
 *
 * Stability scoring and occlusion/noise classification of tracked segments.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef OCCLUTRACK_CLASSIFICATION_STABILITY_CLASSIFIER_HPP
#define OCCLUTRACK_CLASSIFICATION_STABILITY_CLASSIFIER_HPP

#include <vector>

#include "occlutrack/config/classification.hpp"
#include "occlutrack/config/geometry.hpp"
#include "occlutrack/tracking/tracked_segment_store.hpp"
#include "occlutrack/types.hpp"

namespace occlutrack {

/**
 * @brief Fraction of the recent window in which the lineage was observed.
 *
 * stability = match_count / window, clamped to [0, 1], where window is
 * history_size, or min(frames processed, history_size) when
 * normalize_during_warmup is set.
 */
double computeStability(const TrackedSegment& track,
                        const TrackedSegmentStore& store,
                        const config::Classification& config);

/**
 * @brief Classify the lineages matched in the current frame.
 *
 * A lineage is an occlusion iff stability >= persistence_threshold and its
 * angular width >= min_occlusion_width_deg. Failing lineages are returned
 * with is_occlusion = false; they stay tracked.
 *
 * @param assignments Lineage of each current-frame candidate
 * @param store Tracking history after matching
 * @return One entry per assignment, in the same order
 */
std::vector<ClassifiedSegment> classifySegments(
    const std::vector<TrackId>& assignments, const TrackedSegmentStore& store,
    const config::Geometry& geometry, const config::Classification& config);

}  // namespace occlutrack

#endif  // OCCLUTRACK_CLASSIFICATION_STABILITY_CLASSIFIER_HPP
