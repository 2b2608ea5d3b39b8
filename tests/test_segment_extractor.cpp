// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_segment_extractor.cpp
 *
 * Tests for blocked-run extraction: wraparound, gap merging, width filter.
 */

#include <gtest/gtest.h>

#include <initializer_list>
#include <limits>
#include <utility>
#include <vector>

#include "occlutrack/extraction/segment_extractor.hpp"

using namespace occlutrack;

// ─── Fixture ────────────────────────────────────────────────────────────────

class SegmentExtractorTest : public ::testing::Test {
 protected:
  config::Extraction cfg;
  BeamMask mask;

  void SetUp() override {
    cfg.min_segment_beams = 1;
    cfg.gap_merge_beams = 0;
    mask.setConstant(false);
  }

  /// Block the inclusive beam range [first, last] (wrapping allowed).
  void block(int first, int last) {
    for (int b = first;; b = wrapBeam(b + 1)) {
      mask(b) = true;
      if (b == last) break;
    }
  }

  std::vector<Segment> extract() const { return extractSegments(mask, cfg); }
};

// ─── Basic runs ─────────────────────────────────────────────────────────────

TEST_F(SegmentExtractorTest, EmptyMaskYieldsNothing) {
  EXPECT_TRUE(extract().empty());
}

TEST_F(SegmentExtractorTest, SingleRun) {
  block(15, 30);
  auto segs = extract();
  ASSERT_EQ(segs.size(), 1u);
  EXPECT_EQ(segs[0].start_beam, 15);
  EXPECT_EQ(segs[0].end_beam, 30);
  EXPECT_EQ(segs[0].width_beams, 16);
  EXPECT_EQ(segs[0].center_beam, 22);
  EXPECT_FALSE(segs[0].wraps());
}

TEST_F(SegmentExtractorTest, DisjointRunsSortedByStart) {
  block(200, 210);
  block(10, 20);
  block(100, 105);
  auto segs = extract();
  ASSERT_EQ(segs.size(), 3u);
  EXPECT_EQ(segs[0].start_beam, 10);
  EXPECT_EQ(segs[1].start_beam, 100);
  EXPECT_EQ(segs[2].start_beam, 200);
}

TEST_F(SegmentExtractorTest, RunStartingAtBeamZeroDoesNotWrap) {
  block(0, 4);
  auto segs = extract();
  ASSERT_EQ(segs.size(), 1u);
  EXPECT_EQ(segs[0].start_beam, 0);
  EXPECT_EQ(segs[0].end_beam, 4);
  EXPECT_FALSE(segs[0].wraps());
}

TEST_F(SegmentExtractorTest, RunEndingAtLastBeamDoesNotWrap) {
  block(350, 359);
  auto segs = extract();
  ASSERT_EQ(segs.size(), 1u);
  EXPECT_EQ(segs[0].start_beam, 350);
  EXPECT_EQ(segs[0].end_beam, 359);
  EXPECT_FALSE(segs[0].wraps());
}

// ─── Wraparound ─────────────────────────────────────────────────────────────

TEST_F(SegmentExtractorTest, WrappingRunIsOneSegment) {
  block(358, 1);
  auto segs = extract();
  ASSERT_EQ(segs.size(), 1u);
  EXPECT_EQ(segs[0].start_beam, 358);
  EXPECT_EQ(segs[0].end_beam, 1);
  EXPECT_EQ(segs[0].width_beams, 4);
  EXPECT_TRUE(segs[0].wraps());
}

TEST_F(SegmentExtractorTest, WrappingRunSortsByStartBeam) {
  block(350, 5);
  block(100, 110);
  auto segs = extract();
  ASSERT_EQ(segs.size(), 2u);
  EXPECT_EQ(segs[0].start_beam, 100);
  EXPECT_EQ(segs[1].start_beam, 350);
  EXPECT_EQ(segs[1].width_beams, 16);
}

TEST_F(SegmentExtractorTest, FullyBlockedRingIsOneSegment) {
  mask.setConstant(true);
  cfg.min_segment_beams = 5;
  auto segs = extract();
  ASSERT_EQ(segs.size(), 1u);
  EXPECT_EQ(segs[0].start_beam, 0);
  EXPECT_EQ(segs[0].end_beam, 359);
  EXPECT_EQ(segs[0].width_beams, 360);
}

// ─── Gap merging ────────────────────────────────────────────────────────────

TEST_F(SegmentExtractorTest, GapOfTwoMergesWithLimitTwo) {
  cfg.gap_merge_beams = 2;
  block(10, 14);
  block(17, 20);  // clear: 15, 16
  auto segs = extract();
  ASSERT_EQ(segs.size(), 1u);
  EXPECT_EQ(segs[0].start_beam, 10);
  EXPECT_EQ(segs[0].end_beam, 20);
  EXPECT_EQ(segs[0].width_beams, 11);
}

TEST_F(SegmentExtractorTest, GapOfThreeStaysSplitWithLimitTwo) {
  cfg.gap_merge_beams = 2;
  block(10, 14);
  block(18, 22);  // clear: 15, 16, 17
  auto segs = extract();
  ASSERT_EQ(segs.size(), 2u);
  EXPECT_EQ(segs[0].end_beam, 14);
  EXPECT_EQ(segs[1].start_beam, 18);
}

TEST_F(SegmentExtractorTest, MergingIsTransitive) {
  cfg.gap_merge_beams = 1;
  block(10, 11);
  block(13, 14);
  block(16, 17);
  block(19, 20);
  auto segs = extract();
  ASSERT_EQ(segs.size(), 1u);
  EXPECT_EQ(segs[0].start_beam, 10);
  EXPECT_EQ(segs[0].end_beam, 20);
}

TEST_F(SegmentExtractorTest, GapAcrossRingBoundaryMerges) {
  cfg.gap_merge_beams = 2;
  block(350, 358);  // clear: 359, 0
  block(1, 5);
  auto segs = extract();
  ASSERT_EQ(segs.size(), 1u);
  EXPECT_EQ(segs[0].start_beam, 350);
  EXPECT_EQ(segs[0].end_beam, 5);
  EXPECT_EQ(segs[0].width_beams, 16);
  EXPECT_TRUE(segs[0].wraps());
}

TEST_F(SegmentExtractorTest, MergeChainClosingTheRing) {
  cfg.gap_merge_beams = 2;
  block(0, 357);  // clear: 358, 359
  auto segs = extract();
  ASSERT_EQ(segs.size(), 1u);
  EXPECT_EQ(segs[0].width_beams, 360);
  EXPECT_EQ(segs[0].start_beam, 0);
  EXPECT_EQ(segs[0].end_beam, 359);
}

// ─── Width filter ───────────────────────────────────────────────────────────

TEST_F(SegmentExtractorTest, RunShorterThanMinimumIsDropped) {
  cfg.min_segment_beams = 5;
  block(40, 43);  // 4 beams
  EXPECT_TRUE(extract().empty());

  block(44, 44);  // now 5 beams
  EXPECT_EQ(extract().size(), 1u);
}

TEST_F(SegmentExtractorTest, WidthFilterAppliesAfterMerging) {
  cfg.min_segment_beams = 5;
  cfg.gap_merge_beams = 2;
  block(10, 11);
  block(14, 15);  // merged 10-15 = 6 beams
  block(100, 101);
  auto segs = extract();
  ASSERT_EQ(segs.size(), 1u);
  EXPECT_EQ(segs[0].start_beam, 10);
  EXPECT_EQ(segs[0].end_beam, 15);
}

// ─── Frame overload ─────────────────────────────────────────────────────────

TEST_F(SegmentExtractorTest, ExtractsFromScanFrame) {
  std::vector<float> ranges(kNumBeams, 1.0f);
  for (int b : {358, 359, 0, 1}) {
    ranges[b] = std::numeric_limits<float>::infinity();
  }
  cfg.min_segment_beams = 1;
  auto segs = extractSegments(ScanFrame(1, ranges), cfg);
  ASSERT_EQ(segs.size(), 1u);
  EXPECT_EQ(segs[0].width_beams, 4);
  EXPECT_TRUE(segs[0].wraps());
}

TEST_F(SegmentExtractorTest, FrameOverloadHonorsMaxRange) {
  std::vector<float> ranges(kNumBeams, 1.0f);
  for (int b = 50; b < 60; ++b) ranges[b] = 3.5f;
  ScanFrame frame(1, ranges);

  EXPECT_TRUE(extractSegments(frame, cfg).empty());

  cfg.treat_max_range_as_blocked = true;
  cfg.max_range = 3.5f;
  auto segs = extractSegments(frame, cfg);
  ASSERT_EQ(segs.size(), 1u);
  EXPECT_EQ(segs[0].start_beam, 50);
  EXPECT_EQ(segs[0].end_beam, 59);
}
