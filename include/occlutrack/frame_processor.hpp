// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * frame_processor.hpp
 *
 * Streaming occlusion tracking: one call per scan frame.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef OCCLUTRACK_FRAME_PROCESSOR_HPP
#define OCCLUTRACK_FRAME_PROCESSOR_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "occlutrack/config/occlutrack.hpp"
#include "occlutrack/scan_frame.hpp"
#include "occlutrack/tracking/tracked_segment_store.hpp"
#include "occlutrack/types.hpp"

namespace occlutrack {

/**
 * @brief Occlusion tracking engine.
 *
 * Per frame: extract segments -> match against history -> classify.
 * Frames must arrive in strictly increasing timestep order and must not be
 * skipped, since every frame advances the stability window.
 *
 * ## Thread safety
 *
 * **Not thread-safe.** The tracking history is private mutable state of one
 * instance. Use one FrameProcessor per input stream.
 *
 * ## Errors
 *
 * - Constructor: InvalidConfiguration.
 * - process(): OutOfOrderFrame. The frame is rejected before any state
 *   changes, so the caller may skip it and continue.
 */
class FrameProcessor {
 public:
  using ClassifiedCallback =
      std::function<void(int64_t, const std::vector<ClassifiedSegment>&)>;

  /// Construct with default config
  FrameProcessor();

  /// Construct with explicit config (validated)
  explicit FrameProcessor(const Config& cfg);

  // Non-copyable
  FrameProcessor(const FrameProcessor&) = delete;
  FrameProcessor& operator=(const FrameProcessor&) = delete;

  /// Process the next frame and return its occlusion report.
  FrameResult process(const ScanFrame& frame);

  /// Drop all history, e.g. at the start of a new input source.
  void reset();

  /// Set callback receiving every classified candidate, noise included.
  void onClassified(ClassifiedCallback callback);

  const Config& config() const noexcept { return cfg_; }
  const TrackedSegmentStore& store() const noexcept { return store_; }
  uint64_t frameCount() const noexcept { return store_.frameCount(); }
  std::optional<int64_t> lastTimestep() const noexcept {
    return last_timestep_;
  }

 private:
  Config cfg_;
  TrackedSegmentStore store_;
  std::optional<int64_t> last_timestep_;

  ClassifiedCallback on_classified_;
};

}  // namespace occlutrack

#endif  // OCCLUTRACK_FRAME_PROCESSOR_HPP
