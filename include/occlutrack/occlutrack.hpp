// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * occlutrack.hpp
 *
 * occlutrack: persistent occlusion vs. transient out-of-range detection
 * for 360-beam range scans.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef OCCLUTRACK_OCCLUTRACK_HPP
#define OCCLUTRACK_OCCLUTRACK_HPP

// Configs
#include "occlutrack/config/occlutrack.hpp"

// Data types
#include "occlutrack/exceptions.hpp"
#include "occlutrack/scan_frame.hpp"
#include "occlutrack/types.hpp"

// Stages
#include "occlutrack/classification/stability_classifier.hpp"
#include "occlutrack/extraction/segment_extractor.hpp"
#include "occlutrack/geometry/beam_geometry.hpp"
#include "occlutrack/tracking/temporal_matcher.hpp"
#include "occlutrack/tracking/tracked_segment_store.hpp"

// Engine
#include "occlutrack/frame_processor.hpp"

#endif  // OCCLUTRACK_OCCLUTRACK_HPP
