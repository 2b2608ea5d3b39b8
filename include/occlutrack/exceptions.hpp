// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * exceptions.hpp
 *
 * Exception hierarchy for occlusion tracking.
 *
 * Exception hierarchy:
 *   InvalidConfiguration (std::invalid_argument)
 *     - Knob outside its domain. Fatal: no engine is constructed.
 *   FrameError (std::runtime_error)
 *   ├── MalformedFrame   - Frame rejected at the row boundary
 *   └── OutOfOrderFrame  - Timestep not strictly increasing
 *
 * Both FrameError kinds leave the tracking history untouched, so the caller
 * can skip the frame and keep feeding the same engine.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef OCCLUTRACK_EXCEPTIONS_HPP
#define OCCLUTRACK_EXCEPTIONS_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace occlutrack {

/**
 * @brief Configuration knob outside its stated domain.
 */
class InvalidConfiguration : public std::invalid_argument {
 public:
  explicit InvalidConfiguration(const std::string& message)
      : std::invalid_argument(message) {}
};

/**
 * @brief Base exception for frames the engine refuses to process.
 */
class FrameError : public std::runtime_error {
 public:
  explicit FrameError(const std::string& message)
      : std::runtime_error(message) {}
};

/**
 * @brief Frame with the wrong beam count or an invalid range value.
 *
 * The timestep is carried when it was parsed before the error was found.
 */
class MalformedFrame : public FrameError {
 public:
  explicit MalformedFrame(const std::string& message,
                          std::optional<int64_t> timestep = std::nullopt)
      : FrameError(message), timestep_(timestep) {}

  const std::optional<int64_t>& timestep() const { return timestep_; }

 private:
  std::optional<int64_t> timestep_;
};

/**
 * @brief Frame whose timestep does not advance past the last processed one.
 */
class OutOfOrderFrame : public FrameError {
 public:
  OutOfOrderFrame(int64_t timestep, int64_t last_timestep)
      : FrameError("timestep " + std::to_string(timestep) +
                   " is not greater than last processed timestep " +
                   std::to_string(last_timestep)),
        timestep_(timestep),
        last_timestep_(last_timestep) {}

  int64_t timestep() const { return timestep_; }
  int64_t lastTimestep() const { return last_timestep_; }

 private:
  int64_t timestep_;
  int64_t last_timestep_;
};

}  // namespace occlutrack

#endif  // OCCLUTRACK_EXCEPTIONS_HPP
