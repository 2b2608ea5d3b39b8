// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "occlutrack/tracking/tracked_segment_store.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "occlutrack/exceptions.hpp"

namespace occlutrack {

TrackedSegmentStore::TrackedSegmentStore(int history_size)
    : history_size_(history_size) {
  if (history_size_ < 1) {
    throw InvalidConfiguration("history_size must be >= 1, got " +
                               std::to_string(history_size_));
  }
}

uint64_t TrackedSegmentStore::beginFrame() { return ++frame_count_; }

TrackId TrackedSegmentStore::create(const Segment& segment, int64_t timestep) {
  const TrackId id = next_id_++;
  TrackedSegment& track = entries_[id];
  track.id = id;
  track.current_position = segment;
  track.first_seen_timestep = timestep;
  track.last_seen_timestep = timestep;
  track.last_seen_frame = frame_count_;
  pushHit(track, true);
  return id;
}

void TrackedSegmentStore::recordMatch(TrackId id, const Segment& segment,
                                      int64_t timestep) {
  TrackedSegment& track = get(id);
  track.current_position = segment;
  track.last_seen_timestep = timestep;
  track.last_seen_frame = frame_count_;
  pushHit(track, true);
}

void TrackedSegmentStore::recordMiss(TrackId id) { pushHit(get(id), false); }

std::vector<TrackId> TrackedSegmentStore::evictStale() {
  std::vector<TrackId> evicted;
  for (auto it = entries_.begin(); it != entries_.end();) {
    const uint64_t missed = frame_count_ - it->second.last_seen_frame;
    if (missed >= static_cast<uint64_t>(history_size_)) {
      evicted.push_back(it->first);
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
  return evicted;
}

int TrackedSegmentStore::framesInWindow() const {
  return static_cast<int>(
      std::min<uint64_t>(frame_count_, static_cast<uint64_t>(history_size_)));
}

const TrackedSegment* TrackedSegmentStore::find(TrackId id) const {
  auto it = entries_.find(id);
  return it == entries_.end() ? nullptr : &it->second;
}

const TrackedSegment& TrackedSegmentStore::at(TrackId id) const {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    throw std::out_of_range("unknown track id " + std::to_string(id));
  }
  return it->second;
}

void TrackedSegmentStore::reset() {
  entries_.clear();
  frame_count_ = 0;
}

TrackedSegment& TrackedSegmentStore::get(TrackId id) {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    throw std::out_of_range("unknown track id " + std::to_string(id));
  }
  return it->second;
}

void TrackedSegmentStore::pushHit(TrackedSegment& track, bool hit) const {
  track.hits.push_back(hit);
  if (hit) ++track.match_count;
  while (track.hits.size() > static_cast<size_t>(history_size_)) {
    if (track.hits.front()) --track.match_count;
    track.hits.pop_front();
  }
}

}  // namespace occlutrack
