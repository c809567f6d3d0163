/*
 * Copyright 2025 Jinwoo Sung
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <string>

#include "serlink/base/constants.hpp"
#include "serlink/util/input_validator.hpp"

namespace serlink {
namespace config {

enum class Parity { None, Even, Odd, Mark, Space };
enum class StopBits { One, OnePointFive, Two };

inline char to_char(Parity parity) {
  switch (parity) {
    case Parity::None:
      return 'N';
    case Parity::Even:
      return 'E';
    case Parity::Odd:
      return 'O';
    case Parity::Mark:
      return 'M';
    case Parity::Space:
      return 'S';
  }
  return '?';
}

inline const char* to_cstr(StopBits stop_bits) {
  switch (stop_bits) {
    case StopBits::One:
      return "1";
    case StopBits::OnePointFive:
      return "1.5";
    case StopBits::Two:
      return "2";
  }
  return "?";
}

/**
 * @brief Parses "N", "e", "odd", "Mark" ...
 * @throws diagnostics::ValidationException
 */
inline Parity parse_parity(const std::string& text) {
  util::InputValidator::validate_parity(text);
  switch (text[0]) {
    case 'E':
    case 'e':
      return Parity::Even;
    case 'O':
    case 'o':
      return Parity::Odd;
    case 'M':
    case 'm':
      return Parity::Mark;
    case 'S':
    case 's':
      return Parity::Space;
    default:
      return Parity::None;
  }
}

/**
 * @throws diagnostics::ValidationException
 */
inline StopBits parse_stop_bits(const std::string& text) {
  util::InputValidator::validate_stop_bits(text);
  if (text == "1.5") return StopBits::OnePointFive;
  if (text == "2") return StopBits::Two;
  return StopBits::One;
}

struct SerialConfig {
  std::string device;
  unsigned baud_rate = base::constants::DEFAULT_BAUD_RATE;
  unsigned data_bits = base::constants::DEFAULT_DATA_BITS;  // 5,6,7,8
  Parity parity = Parity::None;
  StopBits stop_bits = StopBits::One;
  unsigned timeout_ms = base::constants::DEFAULT_SERIAL_TIMEOUT_MS;  // stall warning threshold for writes

  /**
   * @throws diagnostics::ValidationException
   */
  void validate() const {
    util::InputValidator::validate_device_path(device);
    util::InputValidator::validate_baud_rate(baud_rate);
    util::InputValidator::validate_data_bits(static_cast<uint8_t>(data_bits > 255 ? 255 : data_bits));
    util::InputValidator::validate_range(static_cast<int64_t>(timeout_ms),
                                         static_cast<int64_t>(base::constants::MIN_SERIAL_TIMEOUT_MS),
                                         static_cast<int64_t>(base::constants::MAX_SERIAL_TIMEOUT_MS), "timeout_ms");
  }

  bool is_valid() const {
    try {
      validate();
      return true;
    } catch (const diagnostics::ValidationException&) {
      return false;
    }
  }

  /**
   * @brief "9600 8N1" style summary
   */
  std::string describe() const {
    return std::to_string(baud_rate) + " " + std::to_string(data_bits) + to_char(parity) + to_cstr(stop_bits);
  }
};

}  // namespace config
}  // namespace serlink
