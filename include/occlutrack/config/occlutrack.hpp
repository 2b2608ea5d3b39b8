// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef OCCLUTRACK_CONFIG_OCCLUTRACK_HPP
#define OCCLUTRACK_CONFIG_OCCLUTRACK_HPP

#include <string>

namespace YAML {
class Node;
}

#include "occlutrack/config/classification.hpp"
#include "occlutrack/config/extraction.hpp"
#include "occlutrack/config/geometry.hpp"
#include "occlutrack/config/tracking.hpp"

namespace occlutrack {

/// Engine configuration for occlusion tracking.
struct Config {
  config::Geometry geometry;
  config::Extraction extraction;
  config::Tracking tracking;
  config::Classification classification;
};

/// Throws InvalidConfiguration if any knob is outside its domain.
void validate(const Config& cfg);

Config parseConfig(const YAML::Node& root);
Config loadConfig(const std::string& path);

}  // namespace occlutrack

#endif  // OCCLUTRACK_CONFIG_OCCLUTRACK_HPP
