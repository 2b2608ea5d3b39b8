// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * scan_csv.hpp
 *
 * Row-oriented CSV source of scan frames and sink of frame results.
 *
 * Input:  timestep,lidar_0,...,lidar_359   (lidar_* in any column order)
 * Output: timestep,has_occlusion,num_segments,angle_ranges_deg,
 *         beam_indices,stabilities
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef OCCLUTRACK_IO_SCAN_CSV_HPP
#define OCCLUTRACK_IO_SCAN_CSV_HPP

#include <fstream>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "occlutrack/frame_processor.hpp"
#include "occlutrack/scan_frame.hpp"
#include "occlutrack/types.hpp"

namespace occlutrack {
namespace io {

/// Segment separator inside multi-valued output fields.
constexpr auto kSegmentSeparator = "; ";

/// "<start> to <end>; ..." with one decimal, literal start/end angles.
std::string formatAngleRanges(const std::vector<ClassifiedSegment>& segments);

/// "<start>-<end>; ..." beam indices.
std::string formatBeamRanges(const std::vector<ClassifiedSegment>& segments);

/// "<stability>; ..." with two decimals.
std::string formatStabilities(const std::vector<ClassifiedSegment>& segments);

/**
 * @brief Parse one range token.
 *
 * "inf", "+inf", "-inf", "infinity" (any case) give infinity; other tokens
 * must parse completely as a number.
 *
 * @throws std::invalid_argument if the token is not a number or sentinel,
 *         or overflows float
 */
float parseRange(const std::string& token);

/// Split one CSV line into fields (double-quoted fields supported).
std::vector<std::string> splitCsvLine(const std::string& line);

/**
 * @brief Reads one ScanFrame per CSV row.
 *
 * The header must contain lidar_0 ... lidar_359 exactly once each and a
 * "timestep" column (the first column is used when it is not named).
 * Construction throws std::runtime_error on an unusable file or header.
 */
class ScanCsvReader {
 public:
  explicit ScanCsvReader(const std::string& path);
  explicit ScanCsvReader(std::istream& input);

  /**
   * @brief Read the next frame.
   *
   * @return Frame, or std::nullopt at end of input
   * @throws MalformedFrame for a bad row; the next call continues with the
   *         following row
   */
  std::optional<ScanFrame> next();

  /// Line number of the row returned (or rejected) last, 1-based.
  size_t lineNumber() const noexcept { return line_number_; }

 private:
  void readHeader();
  ScanFrame parseRow(const std::string& line) const;

  std::unique_ptr<std::ifstream> file_;
  std::istream& input_;
  int timestep_column_ = 0;
  std::vector<int> beam_columns_;  ///< Column index of lidar_i
  size_t column_count_ = 0;
  size_t line_number_ = 0;
};

/// Writes one CSV row per FrameResult, header first.
class ResultCsvWriter {
 public:
  explicit ResultCsvWriter(const std::string& path);
  explicit ResultCsvWriter(std::ostream& output);

  void write(const FrameResult& result);
  void flush();

 private:
  void writeHeader();

  std::unique_ptr<std::ofstream> file_;
  std::ostream& output_;
};

/// Row counts of one pass over a scan file.
struct StreamSummary {
  size_t rows_read = 0;  ///< Data rows consumed, rejected ones included
  size_t frames_processed = 0;
  size_t frames_skipped = 0;
  size_t frames_occluded = 0;
};

/**
 * @brief Feed every row of reader through processor into writer.
 *
 * Malformed rows and out-of-order frames are logged and skipped. With
 * strict set, the first such FrameError is rethrown instead.
 */
StreamSummary processStream(ScanCsvReader& reader, FrameProcessor& processor,
                            ResultCsvWriter& writer, bool strict = false);

}  // namespace io
}  // namespace occlutrack

#endif  // OCCLUTRACK_IO_SCAN_CSV_HPP
