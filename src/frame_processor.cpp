// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "occlutrack/frame_processor.hpp"

#include <spdlog/spdlog.h>

#include <utility>

#include "occlutrack/classification/stability_classifier.hpp"
#include "occlutrack/exceptions.hpp"
#include "occlutrack/extraction/segment_extractor.hpp"
#include "occlutrack/tracking/temporal_matcher.hpp"

namespace occlutrack {

namespace {

const Config& validated(const Config& cfg) {
  validate(cfg);
  return cfg;
}

}  // namespace

FrameProcessor::FrameProcessor() : FrameProcessor(Config{}) {}

FrameProcessor::FrameProcessor(const Config& cfg)
    : cfg_(validated(cfg)), store_(cfg_.tracking.history_size) {}

FrameResult FrameProcessor::process(const ScanFrame& frame) {
  const int64_t timestep = frame.timestep();
  if (last_timestep_ && timestep <= *last_timestep_) {
    throw OutOfOrderFrame(timestep, *last_timestep_);
  }

  // 1. Extract candidate segments
  const auto candidates = extractSegments(frame, cfg_.extraction);

  // 2. Match against history (advances the store by one frame)
  const auto matches =
      matchSegments(candidates, store_, timestep, cfg_.tracking);
  last_timestep_ = timestep;

  // 3. Classify
  auto classified = classifySegments(matches.assignments, store_,
                                     cfg_.geometry, cfg_.classification);
  if (on_classified_) {
    on_classified_(timestep, classified);
  }

  FrameResult result;
  result.timestep = timestep;
  for (const auto& seg : classified) {
    if (seg.is_occlusion) result.segments.push_back(seg);
  }
  result.has_occlusion = !result.segments.empty();

  spdlog::debug(
      "[FrameProcessor] t={} candidates={} tracked={} occlusions={}",
      timestep, candidates.size(), store_.size(), result.segments.size());
  return result;
}

void FrameProcessor::reset() {
  store_.reset();
  last_timestep_.reset();
}

void FrameProcessor::onClassified(ClassifiedCallback callback) {
  on_classified_ = std::move(callback);
}

}  // namespace occlutrack
