// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "occlutrack/tracking/temporal_matcher.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <tuple>
#include <unordered_set>

#include "occlutrack/geometry/beam_geometry.hpp"

namespace occlutrack {

namespace {

struct MatchPair {
  int distance;
  int match_count;
  TrackId track;
  size_t candidate;
};

// Nearest first, then stronger history, then older lineage, then candidate
// order. Total order keeps the assignment deterministic.
bool betterPair(const MatchPair& a, const MatchPair& b) {
  return std::make_tuple(a.distance, -a.match_count, a.track, a.candidate) <
         std::make_tuple(b.distance, -b.match_count, b.track, b.candidate);
}

}  // namespace

MatchResult matchSegments(const std::vector<Segment>& candidates,
                          TrackedSegmentStore& store, int64_t timestep,
                          const config::Tracking& config) {
  MatchResult result;
  result.assignments.assign(candidates.size(), 0);

  store.beginFrame();

  // 1. Collect all pairs within drift tolerance
  std::vector<MatchPair> pairs;
  for (const auto& [id, track] : store.entries()) {
    for (size_t i = 0; i < candidates.size(); ++i) {
      const int d = circularDistance(candidates[i].center_beam,
                                     track.current_position.center_beam);
      if (d <= config.drift_tolerance_beams) {
        pairs.push_back({d, track.match_count, id, i});
      }
    }
  }
  std::sort(pairs.begin(), pairs.end(), betterPair);

  // 2. Greedy one-to-one assignment
  std::vector<bool> candidate_taken(candidates.size(), false);
  std::unordered_set<TrackId> matched_tracks;
  for (const auto& p : pairs) {
    if (candidate_taken[p.candidate] || matched_tracks.count(p.track)) continue;
    candidate_taken[p.candidate] = true;
    matched_tracks.insert(p.track);
    result.assignments[p.candidate] = p.track;
  }

  // 3. Update existing lineages (before creating new ones)
  for (const auto& entry : store.entries()) {
    if (!matched_tracks.count(entry.first)) store.recordMiss(entry.first);
  }
  for (size_t i = 0; i < candidates.size(); ++i) {
    if (candidate_taken[i]) {
      store.recordMatch(result.assignments[i], candidates[i], timestep);
    }
  }

  // 4. New lineages for unmatched candidates
  for (size_t i = 0; i < candidates.size(); ++i) {
    if (candidate_taken[i]) continue;
    const TrackId id = store.create(candidates[i], timestep);
    result.assignments[i] = id;
    result.created.push_back(id);
    spdlog::debug("[TemporalMatcher] New track {} at beams {}-{}", id,
                  candidates[i].start_beam, candidates[i].end_beam);
  }

  // 5. Age out stale lineages
  result.evicted = store.evictStale();
  for (TrackId id : result.evicted) {
    spdlog::debug("[TemporalMatcher] Evicted track {}", id);
  }

  return result;
}

}  // namespace occlutrack
