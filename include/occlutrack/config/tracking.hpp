// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef OCCLUTRACK_CONFIG_TRACKING_HPP
#define OCCLUTRACK_CONFIG_TRACKING_HPP

namespace occlutrack::config {

/// Temporal matching parameters.
struct Tracking {
  int history_size = 30;          ///< Sliding window length [frames], >= 1
  int drift_tolerance_beams = 3;  ///< Max center movement per match, >= 0
};

}  // namespace occlutrack::config

#endif  // OCCLUTRACK_CONFIG_TRACKING_HPP
