// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "occlutrack/scan_frame.hpp"

#include <cmath>
#include <string>

#include "occlutrack/exceptions.hpp"

namespace occlutrack {

namespace {

// Readings within this margin of max_range count as max-range returns.
constexpr float kMaxRangeMargin = 1e-6f;

}  // namespace

ScanFrame::ScanFrame(int64_t timestep, const BeamArray& ranges)
    : timestep_(timestep), ranges_(ranges) {
  validate();
}

ScanFrame::ScanFrame(int64_t timestep, const std::vector<float>& ranges)
    : timestep_(timestep) {
  if (ranges.size() != static_cast<size_t>(kNumBeams)) {
    throw MalformedFrame("expected " + std::to_string(kNumBeams) +
                             " range values, got " +
                             std::to_string(ranges.size()),
                         timestep);
  }
  ranges_ = Eigen::Map<const BeamArray>(ranges.data());
  validate();
}

void ScanFrame::validate() const {
  for (int i = 0; i < kNumBeams; ++i) {
    const float r = ranges_(i);
    if (std::isnan(r)) {
      throw MalformedFrame("beam " + std::to_string(i) + " is NaN",
                           timestep_);
    }
    if (std::isfinite(r) && r < 0.0f) {
      throw MalformedFrame("beam " + std::to_string(i) +
                               " has negative range " + std::to_string(r),
                           timestep_);
    }
  }
}

BeamMask ScanFrame::blockedMask(bool treat_max_as_blocked,
                                float max_range) const {
  BeamMask mask = ranges_.isInf();
  if (treat_max_as_blocked) {
    mask = mask || (ranges_ >= max_range - kMaxRangeMargin);
  }
  return mask;
}

}  // namespace occlutrack
