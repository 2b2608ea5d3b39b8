// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * segment_extractor.hpp
 *
 * Blocked-beam run extraction with gap merging on the circular scan.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef OCCLUTRACK_EXTRACTION_SEGMENT_EXTRACTOR_HPP
#define OCCLUTRACK_EXTRACTION_SEGMENT_EXTRACTOR_HPP

#include <vector>

#include "occlutrack/config/extraction.hpp"
#include "occlutrack/scan_frame.hpp"
#include "occlutrack/types.hpp"

namespace occlutrack {

/**
 * @brief Extract candidate segments from a blocked-beam mask.
 *
 * 1. Collect maximal runs of blocked beams, walking the ring once. A run
 *    crossing beam 359 -> 0 is a single wrapping segment.
 * 2. Merge runs separated by <= gap_merge_beams clear beams (transitive,
 *    including the gap that crosses the ring boundary).
 * 3. Drop segments narrower than min_segment_beams.
 *
 * A fully blocked ring yields the single segment 0-359.
 *
 * @param blocked Per-beam "no return" flags
 * @param config Extraction configuration
 * @return Disjoint segments in ascending start_beam order
 */
std::vector<Segment> extractSegments(const BeamMask& blocked,
                                     const config::Extraction& config);

/// Convenience overload: builds the mask from the frame first.
std::vector<Segment> extractSegments(const ScanFrame& frame,
                                     const config::Extraction& config);

}  // namespace occlutrack

#endif  // OCCLUTRACK_EXTRACTION_SEGMENT_EXTRACTOR_HPP
