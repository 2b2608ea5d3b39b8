// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * geometry.hpp
 *
 * Beam-to-angle mapping of the scanner.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef OCCLUTRACK_CONFIG_GEOMETRY_HPP
#define OCCLUTRACK_CONFIG_GEOMETRY_HPP

namespace occlutrack::config {

struct Geometry {
  double angle_min_deg = -180.0;  ///< Angle of beam 0 [deg]
  double angle_span_deg = 360.0;  ///< Angle covered by all beams [deg], > 0
};

}  // namespace occlutrack::config

#endif  // OCCLUTRACK_CONFIG_GEOMETRY_HPP
