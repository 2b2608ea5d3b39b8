// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * segment_extractor.cpp
 *
 * Algorithm:
 * 1. Pick a clear beam c. Walking from c + 1 for kNumBeams steps visits
 *    every beam once and ends on c, so no run straddles the walk origin.
 * 2. Runs are recorded as walk offsets [first, last], which never wrap.
 * 3. Consecutive runs merge when the clear gap between them is small.
 * 4. The closing gap (last run -> c -> first run) is checked separately:
 *    it merges the last run into the first, or closes the whole ring.
 * 5. Offsets map back to beams as (c + 1 + offset) mod kNumBeams.
 */

#include "occlutrack/extraction/segment_extractor.hpp"

#include <algorithm>

namespace occlutrack {

namespace {

struct Run {
  int first;  // walk offset, inclusive (negative after a closing merge)
  int last;   // walk offset, inclusive
  int width() const { return last - first + 1; }
};

std::vector<Run> collectRuns(const BeamMask& blocked, int origin) {
  std::vector<Run> runs;
  for (int k = 0; k < kNumBeams; ++k) {
    if (!blocked(wrapBeam(origin + k))) continue;
    if (!runs.empty() && runs.back().last == k - 1) {
      runs.back().last = k;
    } else {
      runs.push_back({k, k});
    }
  }
  return runs;
}

std::vector<Run> mergeGaps(const std::vector<Run>& runs, int max_gap) {
  std::vector<Run> merged;
  merged.reserve(runs.size());
  for (const auto& run : runs) {
    if (!merged.empty() && run.first - merged.back().last - 1 <= max_gap) {
      merged.back().last = run.last;
    } else {
      merged.push_back(run);
    }
  }
  return merged;
}

}  // namespace

std::vector<Segment> extractSegments(const BeamMask& blocked,
                                     const config::Extraction& config) {
  const int min_width = config.min_segment_beams;
  std::vector<Segment> segments;

  const auto n_blocked = blocked.count();
  if (n_blocked == 0) return segments;

  const Segment full_ring = Segment::fromRange(0, kNumBeams - 1);
  if (n_blocked == kNumBeams) {
    if (kNumBeams >= min_width) segments.push_back(full_ring);
    return segments;
  }

  int clear = 0;
  while (blocked(clear)) ++clear;
  const int origin = clear + 1;

  auto runs = mergeGaps(collectRuns(blocked, origin), config.gap_merge_beams);

  const int closing_gap =
      (kNumBeams - 1 - runs.back().last) + runs.front().first;
  if (closing_gap <= config.gap_merge_beams) {
    if (runs.size() == 1) {
      if (kNumBeams >= min_width) segments.push_back(full_ring);
      return segments;
    }
    runs.front().first = runs.back().first - kNumBeams;
    runs.pop_back();
  }

  segments.reserve(runs.size());
  for (const auto& run : runs) {
    if (run.width() < min_width) continue;
    segments.push_back(
        Segment::fromRange(origin + run.first, origin + run.last));
  }

  std::sort(segments.begin(), segments.end(),
            [](const Segment& a, const Segment& b) {
              return a.start_beam < b.start_beam;
            });
  return segments;
}

std::vector<Segment> extractSegments(const ScanFrame& frame,
                                     const config::Extraction& config) {
  return extractSegments(frame.blockedMask(config.treat_max_range_as_blocked,
                                           config.max_range),
                         config);
}

}  // namespace occlutrack
