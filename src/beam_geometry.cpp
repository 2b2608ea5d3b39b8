// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "occlutrack/geometry/beam_geometry.hpp"

#include <cmath>
#include <cstdlib>

namespace occlutrack {

double normalizeDegrees(double degrees) noexcept {
  double wrapped = std::fmod(degrees + 180.0, 360.0);
  if (wrapped < 0.0) wrapped += 360.0;
  return wrapped - 180.0;
}

double beamToDegrees(int beam, double angle_min_deg,
                     double angle_span_deg) noexcept {
  return normalizeDegrees(angle_min_deg +
                          beam * (angle_span_deg / kNumBeams));
}

double beamsToDegrees(int width_beams, double angle_span_deg) noexcept {
  return width_beams * (std::abs(angle_span_deg) / kNumBeams);
}

int circularDistance(int a, int b) noexcept {
  const int d = std::abs(wrapBeam(a) - wrapBeam(b));
  return d < kNumBeams - d ? d : kNumBeams - d;
}

}  // namespace occlutrack
