// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_stability_classifier.cpp
 *
 * Tests for stability scoring and the occlusion/noise decision.
 */

#include <gtest/gtest.h>

#include <vector>

#include "occlutrack/classification/stability_classifier.hpp"
#include "occlutrack/tracking/temporal_matcher.hpp"

using namespace occlutrack;

class StabilityClassifierTest : public ::testing::Test {
 protected:
  config::Geometry geometry;
  config::Tracking tracking;
  config::Classification classification;
  TrackedSegmentStore store{10};
  int64_t t = 0;

  void SetUp() override {
    tracking.history_size = 10;
    tracking.drift_tolerance_beams = 3;
    classification.persistence_threshold = 0.7;
    classification.min_occlusion_width_deg = 5.0;
  }

  /// Run n frames in which the segment is (or is not) observed.
  std::vector<TrackId> feed(const Segment& segment, int n, bool seen = true) {
    std::vector<TrackId> assignments;
    for (int i = 0; i < n; ++i) {
      std::vector<Segment> candidates;
      if (seen) candidates.push_back(segment);
      assignments =
          matchSegments(candidates, store, ++t, tracking).assignments;
    }
    return assignments;
  }

  std::vector<ClassifiedSegment> classify(const std::vector<TrackId>& ids) {
    return classifySegments(ids, store, geometry, classification);
  }
};

// ─── Stability ──────────────────────────────────────────────────────────────

TEST_F(StabilityClassifierTest, StabilityUsesFullWindowByDefault) {
  const auto ids = feed(Segment::fromRange(15, 30), 3);
  ASSERT_EQ(ids.size(), 1u);
  EXPECT_DOUBLE_EQ(computeStability(store.at(ids[0]), store, classification),
                   0.3);
}

TEST_F(StabilityClassifierTest, WarmupNormalization) {
  classification.normalize_during_warmup = true;
  const auto ids = feed(Segment::fromRange(15, 30), 3);
  EXPECT_DOUBLE_EQ(computeStability(store.at(ids[0]), store, classification),
                   1.0);
}

TEST_F(StabilityClassifierTest, StabilityStaysInUnitInterval) {
  const auto seg = Segment::fromRange(15, 30);
  const auto ids = feed(seg, 25);
  EXPECT_DOUBLE_EQ(computeStability(store.at(ids[0]), store, classification),
                   1.0);

  classification.normalize_during_warmup = true;
  EXPECT_DOUBLE_EQ(computeStability(store.at(ids[0]), store, classification),
                   1.0);
}

// ─── Classification ─────────────────────────────────────────────────────────

TEST_F(StabilityClassifierTest, ThresholdIsInclusive) {
  const auto seg = Segment::fromRange(15, 30);

  auto ids = feed(seg, 6);
  auto out = classify(ids);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_DOUBLE_EQ(out[0].stability, 0.6);
  EXPECT_FALSE(out[0].is_occlusion);

  ids = feed(seg, 1);
  out = classify(ids);
  EXPECT_DOUBLE_EQ(out[0].stability, 0.7);
  EXPECT_TRUE(out[0].is_occlusion);
}

TEST_F(StabilityClassifierTest, JustBelowThresholdIsNoise) {
  classification.persistence_threshold = 0.71;
  const auto ids = feed(Segment::fromRange(15, 30), 7);
  const auto out = classify(ids);
  EXPECT_DOUBLE_EQ(out[0].stability, 0.7);
  EXPECT_FALSE(out[0].is_occlusion);
}

TEST_F(StabilityClassifierTest, NarrowSegmentIsNoise) {
  classification.persistence_threshold = 0.0;
  // 4 beams = 4 deg
  auto out = classify(feed(Segment::fromRange(100, 103), 10));
  ASSERT_EQ(out.size(), 1u);
  EXPECT_DOUBLE_EQ(out[0].width_deg, 4.0);
  EXPECT_FALSE(out[0].is_occlusion);

  classification.min_occlusion_width_deg = 4.0;
  out = classify({out[0].track_id});
  EXPECT_TRUE(out[0].is_occlusion);
}

TEST_F(StabilityClassifierTest, ReportsAnglesOfCurrentPosition) {
  const auto out = classify(feed(Segment::fromRange(15, 30), 10));
  ASSERT_EQ(out.size(), 1u);
  const auto& s = out[0];
  EXPECT_EQ(s.start_beam, 15);
  EXPECT_EQ(s.end_beam, 30);
  EXPECT_EQ(s.width_beams, 16);
  EXPECT_DOUBLE_EQ(s.start_deg, -165.0);
  EXPECT_DOUBLE_EQ(s.end_deg, -150.0);
  EXPECT_DOUBLE_EQ(s.width_deg, 16.0);
  EXPECT_DOUBLE_EQ(s.stability, 1.0);
  EXPECT_TRUE(s.is_occlusion);
}

TEST_F(StabilityClassifierTest, WrappingSegmentKeepsLiteralAngles) {
  const auto out = classify(feed(Segment::fromRange(355, 4), 10));
  ASSERT_EQ(out.size(), 1u);
  EXPECT_DOUBLE_EQ(out[0].start_deg, 175.0);
  EXPECT_DOUBLE_EQ(out[0].end_deg, -176.0);
  EXPECT_DOUBLE_EQ(out[0].width_deg, 10.0);
}

TEST_F(StabilityClassifierTest, PreservesAssignmentOrder) {
  std::vector<TrackId> ids;
  for (int i = 0; i < 10; ++i) {
    ids = matchSegments(
              {Segment::fromRange(10, 20), Segment::fromRange(200, 220)},
              store, ++t, tracking)
              .assignments;
  }
  const auto out = classify({ids[1], ids[0]});
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].track_id, ids[1]);
  EXPECT_EQ(out[0].start_beam, 200);
  EXPECT_EQ(out[1].track_id, ids[0]);
}
