// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * tracked_segment_store.hpp
 *
 * Sliding-window history of segment lineages across frames.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef OCCLUTRACK_TRACKING_TRACKED_SEGMENT_STORE_HPP
#define OCCLUTRACK_TRACKING_TRACKED_SEGMENT_STORE_HPP

#include <cstdint>
#include <deque>
#include <map>
#include <vector>

#include "occlutrack/types.hpp"

namespace occlutrack {

/**
 * @brief Candidate real-world occlusion observed across frames.
 *
 * hits holds one flag per frame since the lineage was created, limited to
 * the last history_size frames. match_count is the number of set flags.
 */
struct TrackedSegment {
  TrackId id = 0;
  Segment current_position;
  int match_count = 0;
  int64_t first_seen_timestep = 0;
  int64_t last_seen_timestep = 0;
  uint64_t last_seen_frame = 0;  ///< Store frame index of the last match
  std::deque<bool> hits;

  /// Frames since first observed, capped at history size.
  int ageInWindow() const { return static_cast<int>(hits.size()); }
};

/**
 * @brief Owner of all tracked segments plus the processed-frame counter.
 *
 * Entries are keyed by a stable TrackId and iterate in creation order.
 * Ids are never reused within a store's lifetime (reset() included).
 * Eviction keeps the store proportional to the number of distinct
 * occlusion-like regions, not to elapsed time.
 */
class TrackedSegmentStore {
 public:
  using Entries = std::map<TrackId, TrackedSegment>;

  explicit TrackedSegmentStore(int history_size);

  /// Begin a new frame. Returns its frame index (1-based).
  uint64_t beginFrame();

  /// Create a lineage from an unmatched candidate in the current frame.
  TrackId create(const Segment& segment, int64_t timestep);

  /// Record that the lineage matched segment in the current frame.
  void recordMatch(TrackId id, const Segment& segment, int64_t timestep);

  /// Record that the lineage was not seen in the current frame.
  void recordMiss(TrackId id);

  /// Drop lineages unmatched for history_size frames. Returns evicted ids.
  std::vector<TrackId> evictStale();

  /// Frames processed, capped at history_size (window length so far).
  int framesInWindow() const;

  uint64_t frameCount() const noexcept { return frame_count_; }
  int historySize() const noexcept { return history_size_; }

  const TrackedSegment* find(TrackId id) const;
  const TrackedSegment& at(TrackId id) const;
  const Entries& entries() const noexcept { return entries_; }
  size_t size() const noexcept { return entries_.size(); }
  bool empty() const noexcept { return entries_.empty(); }

  void reset();

 private:
  TrackedSegment& get(TrackId id);
  void pushHit(TrackedSegment& track, bool hit) const;

  int history_size_;
  uint64_t frame_count_ = 0;
  TrackId next_id_ = 1;
  Entries entries_;
};

}  // namespace occlutrack

#endif  // OCCLUTRACK_TRACKING_TRACKED_SEGMENT_STORE_HPP
