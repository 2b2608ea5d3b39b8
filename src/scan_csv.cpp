// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * scan_csv.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "occlutrack/io/scan_csv.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "occlutrack/exceptions.hpp"

namespace occlutrack {
namespace io {

namespace detail {

constexpr auto kBeamPrefix = "lidar_";
constexpr auto kTimestepColumn = "timestep";

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

/// Beam index of a "lidar_<n>" column name, or -1.
int beamIndexOf(const std::string& name) {
  const std::string prefix = kBeamPrefix;
  if (name.compare(0, prefix.size(), prefix) != 0) return -1;
  const std::string suffix = name.substr(prefix.size());
  if (suffix.empty() ||
      !std::all_of(suffix.begin(), suffix.end(),
                   [](unsigned char c) { return std::isdigit(c); })) {
    return -1;
  }
  if (suffix.size() > 6) return -1;
  return std::stoi(suffix);
}

int64_t parseTimestep(const std::string& token) {
  const std::string s = trim(token);
  if (s.empty()) throw std::invalid_argument("empty timestep");
  errno = 0;
  char* end = nullptr;
  const long long value = std::strtoll(s.c_str(), &end, 10);
  if (errno == ERANGE || end != s.c_str() + s.size()) {
    throw std::invalid_argument("invalid timestep '" + s + "'");
  }
  return static_cast<int64_t>(value);
}

/// Quote a field when it contains a delimiter, quote or newline.
std::string csvField(const std::string& field) {
  if (field.find_first_of(",\"\n") == std::string::npos) return field;
  std::string quoted = "\"";
  for (char c : field) {
    if (c == '"') quoted += '"';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

template <typename F>
std::string join(const std::vector<ClassifiedSegment>& segments, F&& format) {
  std::ostringstream oss;
  oss << std::fixed;
  for (size_t i = 0; i < segments.size(); ++i) {
    if (i > 0) oss << kSegmentSeparator;
    format(oss, segments[i]);
  }
  return oss.str();
}

}  // namespace detail

// ─── Formatting ─────────────────────────────────────────────────────────────

std::string formatAngleRanges(const std::vector<ClassifiedSegment>& segments) {
  return detail::join(segments, [](std::ostream& os, const auto& s) {
    os << std::setprecision(1) << s.start_deg << " to " << s.end_deg;
  });
}

std::string formatBeamRanges(const std::vector<ClassifiedSegment>& segments) {
  return detail::join(segments, [](std::ostream& os, const auto& s) {
    os << s.start_beam << "-" << s.end_beam;
  });
}

std::string formatStabilities(const std::vector<ClassifiedSegment>& segments) {
  return detail::join(segments, [](std::ostream& os, const auto& s) {
    os << std::setprecision(2) << s.stability;
  });
}

// ─── Parsing ────────────────────────────────────────────────────────────────

float parseRange(const std::string& token) {
  const std::string s = detail::toLower(detail::trim(token));
  if (s == "inf" || s == "+inf" || s == "infinity" || s == "+infinity") {
    return std::numeric_limits<float>::infinity();
  }
  if (s == "-inf" || s == "-infinity") {
    return -std::numeric_limits<float>::infinity();
  }
  if (s.empty()) throw std::invalid_argument("empty range value");

  errno = 0;
  char* end = nullptr;
  const float value = std::strtof(s.c_str(), &end);
  if (end != s.c_str() + s.size()) {
    throw std::invalid_argument("invalid range value '" + s + "'");
  }
  // Overflow must not turn into the "no return" sentinel
  if (errno == ERANGE && std::isinf(value)) {
    throw std::invalid_argument("range value '" + s + "' overflows float");
  }
  return value;
}

std::vector<std::string> splitCsvLine(const std::string& line) {
  std::vector<std::string> fields;
  std::string field;
  bool quoted = false;
  for (size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        field += '"';
        ++i;
      } else if (c == '"') {
        quoted = false;
      } else {
        field += c;
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.push_back(std::move(field));
      field.clear();
    } else if (c != '\r') {
      field += c;
    }
  }
  fields.push_back(std::move(field));
  return fields;
}

// ─── ScanCsvReader ──────────────────────────────────────────────────────────

ScanCsvReader::ScanCsvReader(const std::string& path)
    : file_(std::make_unique<std::ifstream>(path)), input_(*file_) {
  if (!file_->is_open()) {
    throw std::runtime_error("Failed to open scan file: " + path);
  }
  readHeader();
}

ScanCsvReader::ScanCsvReader(std::istream& input) : input_(input) {
  readHeader();
}

void ScanCsvReader::readHeader() {
  std::string line;
  if (!std::getline(input_, line)) {
    throw std::runtime_error("Scan file has no header");
  }
  ++line_number_;

  const auto names = splitCsvLine(line);
  column_count_ = names.size();
  beam_columns_.assign(kNumBeams, -1);

  bool has_timestep = false;
  int n_beam_columns = 0;
  for (size_t col = 0; col < names.size(); ++col) {
    const std::string name = detail::trim(names[col]);
    if (name == detail::kTimestepColumn) {
      timestep_column_ = static_cast<int>(col);
      has_timestep = true;
      continue;
    }
    const int beam = detail::beamIndexOf(name);
    if (beam < 0) continue;
    ++n_beam_columns;
    if (beam >= kNumBeams || beam_columns_[beam] >= 0) {
      throw std::runtime_error("Unexpected or duplicate column '" + name +
                               "' in scan header");
    }
    beam_columns_[beam] = static_cast<int>(col);
  }

  if (n_beam_columns != kNumBeams) {
    throw std::runtime_error("Scan header has " +
                             std::to_string(n_beam_columns) + " " +
                             detail::kBeamPrefix + "* columns, expected " +
                             std::to_string(kNumBeams));
  }
  if (!has_timestep) {
    if (detail::beamIndexOf(detail::trim(names[0])) >= 0) {
      throw std::runtime_error("Scan header has no '" +
                               std::string(detail::kTimestepColumn) +
                               "' column and column 0 is a beam column");
    }
    spdlog::warn("[ScanCsv] No '{}' column, using column 0",
                 detail::kTimestepColumn);
    timestep_column_ = 0;
  }
}

std::optional<ScanFrame> ScanCsvReader::next() {
  std::string line;
  while (std::getline(input_, line)) {
    ++line_number_;
    if (detail::trim(line).empty()) continue;
    return parseRow(line);
  }
  return std::nullopt;
}

ScanFrame ScanCsvReader::parseRow(const std::string& line) const {
  const std::string where = "line " + std::to_string(line_number_) + ": ";
  const auto fields = splitCsvLine(line);
  if (fields.size() != column_count_) {
    throw MalformedFrame(where + "expected " + std::to_string(column_count_) +
                         " fields, got " + std::to_string(fields.size()));
  }

  int64_t timestep = 0;
  try {
    timestep = detail::parseTimestep(fields[timestep_column_]);
  } catch (const std::invalid_argument& e) {
    throw MalformedFrame(where + e.what());
  }

  BeamArray ranges;
  for (int beam = 0; beam < kNumBeams; ++beam) {
    try {
      ranges(beam) = parseRange(fields[beam_columns_[beam]]);
    } catch (const std::invalid_argument& e) {
      throw MalformedFrame(
          where + detail::kBeamPrefix + std::to_string(beam) + ": " + e.what(),
          timestep);
    }
  }

  try {
    return ScanFrame(timestep, ranges);
  } catch (const MalformedFrame& e) {
    throw MalformedFrame(where + e.what(), timestep);
  }
}

// ─── ResultCsvWriter ────────────────────────────────────────────────────────

ResultCsvWriter::ResultCsvWriter(const std::string& path)
    : file_(std::make_unique<std::ofstream>(path)), output_(*file_) {
  if (!file_->is_open()) {
    throw std::runtime_error("Failed to open output file: " + path);
  }
  writeHeader();
}

ResultCsvWriter::ResultCsvWriter(std::ostream& output) : output_(output) {
  writeHeader();
}

void ResultCsvWriter::writeHeader() {
  output_ << "timestep,has_occlusion,num_segments,angle_ranges_deg,"
             "beam_indices,stabilities\n";
}

void ResultCsvWriter::write(const FrameResult& result) {
  output_ << result.timestep << ',' << (result.has_occlusion ? 1 : 0) << ','
          << result.segments.size() << ','
          << detail::csvField(formatAngleRanges(result.segments)) << ','
          << detail::csvField(formatBeamRanges(result.segments)) << ','
          << detail::csvField(formatStabilities(result.segments)) << '\n';
  if (!output_) {
    throw std::runtime_error("Failed to write result for timestep " +
                             std::to_string(result.timestep));
  }
}

void ResultCsvWriter::flush() { output_.flush(); }

// ─── Streaming ──────────────────────────────────────────────────────────────

StreamSummary processStream(ScanCsvReader& reader, FrameProcessor& processor,
                            ResultCsvWriter& writer, bool strict) {
  StreamSummary summary;
  while (true) {
    std::optional<ScanFrame> frame;
    FrameResult result;
    try {
      frame = reader.next();
      if (!frame) break;
      ++summary.rows_read;
      result = processor.process(*frame);
    } catch (const FrameError& e) {
      // A row rejected by the reader was not counted above
      if (!frame) ++summary.rows_read;
      if (strict) throw;
      ++summary.frames_skipped;
      spdlog::warn("[ScanCsv] Skipping frame: {}", e.what());
      continue;
    }

    ++summary.frames_processed;
    if (result.has_occlusion) ++summary.frames_occluded;
    writer.write(result);
  }
  writer.flush();
  return summary;
}

}  // namespace io
}  // namespace occlutrack
