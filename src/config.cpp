// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * config.cpp
 *
 * YAML configuration loading and validation.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <sstream>

#include "occlutrack/config/occlutrack.hpp"
#include "occlutrack/exceptions.hpp"
#include "occlutrack/scan_frame.hpp"

namespace occlutrack {
namespace detail {

template <typename T>
void load(const YAML::Node& node, const std::string& key, T& value) {
  if (node[key]) {
    value = node[key].as<T>();
  }
}

template <typename T>
[[noreturn]] void fail(const std::string& name, T value,
                       const std::string& requirement) {
  std::ostringstream oss;
  oss << name << " (" << value << ") " << requirement;
  throw InvalidConfiguration(oss.str());
}

Config parse(const YAML::Node& root) {
  Config cfg;

  if (auto n = root["geometry"]) {
    load(n, "angle_min_deg", cfg.geometry.angle_min_deg);
    load(n, "angle_span_deg", cfg.geometry.angle_span_deg);
  }

  if (auto n = root["extraction"]) {
    load(n, "min_segment_beams", cfg.extraction.min_segment_beams);
    load(n, "gap_merge_beams", cfg.extraction.gap_merge_beams);
    load(n, "treat_max_range_as_blocked",
         cfg.extraction.treat_max_range_as_blocked);
    load(n, "max_range", cfg.extraction.max_range);
  }

  if (auto n = root["tracking"]) {
    load(n, "history_size", cfg.tracking.history_size);
    load(n, "drift_tolerance_beams", cfg.tracking.drift_tolerance_beams);
  }

  if (auto n = root["classification"]) {
    load(n, "persistence_threshold",
         cfg.classification.persistence_threshold);
    load(n, "min_occlusion_width_deg",
         cfg.classification.min_occlusion_width_deg);
    load(n, "normalize_during_warmup",
         cfg.classification.normalize_during_warmup);
  }

  return cfg;
}

}  // namespace detail

void validate(const Config& cfg) {
  using detail::fail;

  // --- Fatal: values outside their domain ---
  const auto& g = cfg.geometry;
  if (!std::isfinite(g.angle_min_deg)) {
    fail("geometry.angle_min_deg", g.angle_min_deg, "must be finite");
  }
  if (!std::isfinite(g.angle_span_deg) || g.angle_span_deg <= 0.0) {
    fail("geometry.angle_span_deg", g.angle_span_deg, "must be > 0");
  }

  const auto& e = cfg.extraction;
  if (e.min_segment_beams < 1) {
    fail("extraction.min_segment_beams", e.min_segment_beams, "must be >= 1");
  }
  if (e.gap_merge_beams < 0) {
    fail("extraction.gap_merge_beams", e.gap_merge_beams, "must be >= 0");
  }
  if (e.treat_max_range_as_blocked &&
      (std::isnan(e.max_range) || e.max_range <= 0.0f)) {
    fail("extraction.max_range", e.max_range,
         "must be > 0 when treat_max_range_as_blocked is set");
  }

  const auto& t = cfg.tracking;
  if (t.history_size < 1) {
    fail("tracking.history_size", t.history_size, "must be >= 1");
  }
  if (t.drift_tolerance_beams < 0) {
    fail("tracking.drift_tolerance_beams", t.drift_tolerance_beams,
         "must be >= 0");
  }

  const auto& c = cfg.classification;
  if (!(c.persistence_threshold >= 0.0 && c.persistence_threshold <= 1.0)) {
    fail("classification.persistence_threshold", c.persistence_threshold,
         "must be in [0, 1]");
  }
  if (!(c.min_occlusion_width_deg >= 0.0)) {
    fail("classification.min_occlusion_width_deg", c.min_occlusion_width_deg,
         "must be >= 0");
  }

  // --- Non-fatal: legal but almost certainly unintended ---
  if (e.min_segment_beams > kNumBeams) {
    spdlog::warn(
        "[Config] extraction.min_segment_beams ({}) exceeds beam count {}, "
        "no segment can ever be extracted",
        e.min_segment_beams, kNumBeams);
  }
  if (t.drift_tolerance_beams >= kNumBeams / 2) {
    spdlog::warn(
        "[Config] tracking.drift_tolerance_beams ({}) covers the whole ring, "
        "every segment will match every track",
        t.drift_tolerance_beams);
  }
}

Config parseConfig(const YAML::Node& root) {
  auto cfg = detail::parse(root);
  validate(cfg);
  return cfg;
}

Config loadConfig(const std::string& path) {
  try {
    return parseConfig(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw InvalidConfiguration("Failed to load config: " + path + " - " +
                               e.what());
  }
}

}  // namespace occlutrack
