// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * scan2occlusion — Annotate a CSV of 360-beam scans with occlusion reports.
 *
 * Pipeline: read row → extract segments → match history → classify → write
 *
 * Usage:
 *   ./scan2occlusion input.csv output.csv [config.yaml] [--strict] [--verbose]
 *
 *   --strict   abort on a malformed or out-of-order row instead of skipping
 *   --verbose  debug logging
 *
 * Example:
 *   ./scan2occlusion scans.csv occlusions.csv config/default.yaml
 */

#include <occlutrack/io/scan_csv.hpp>
#include <occlutrack/occlutrack.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <vector>

using namespace occlutrack;

int main(int argc, char** argv) {
  std::vector<std::string> positional;
  bool strict = false;
  bool verbose = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--strict") {
      strict = true;
    } else if (arg == "--verbose") {
      verbose = true;
    } else if (arg.rfind("--", 0) == 0) {
      std::cerr << "Unknown option: " << arg << "\n";
      return 1;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.size() < 2 || positional.size() > 3) {
    std::cerr << "Usage: scan2occlusion <input.csv> <output.csv> [config.yaml]"
                 " [--strict] [--verbose]\n"
              << "  config.yaml: engine configuration (default: built-in)\n";
    return 1;
  }
  if (verbose) spdlog::set_level(spdlog::level::debug);

  const std::string& input_path = positional[0];
  const std::string& output_path = positional[1];

  try {
    Config config;
    if (positional.size() == 3) {
      config = loadConfig(positional[2]);
      spdlog::info("Loaded config {}", positional[2]);
    }

    FrameProcessor processor(config);
    io::ScanCsvReader reader(input_path);
    io::ResultCsvWriter writer(output_path);

    spdlog::info("Reading {} (history={} frames, threshold={})", input_path,
                 config.tracking.history_size,
                 config.classification.persistence_threshold);

    io::StreamSummary summary;
    try {
      summary = io::processStream(reader, processor, writer, strict);
    } catch (const FrameError& e) {
      spdlog::error("Rejected frame: {}", e.what());
      return 1;
    }

    spdlog::info("Frames read: {}, processed: {}, skipped: {}, occluded: {}",
                 summary.rows_read, summary.frames_processed,
                 summary.frames_skipped, summary.frames_occluded);
    spdlog::info("Saved to {}", output_path);
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return 1;
  }

  return 0;
}
