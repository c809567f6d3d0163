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

#include <sys/types.h>

#include <cstdint>
#include <string>
#include <string_view>

#include "serlink/base/constants.hpp"
#include "serlink/diagnostics/exceptions.hpp"

namespace serlink {
namespace util {

/**
 * @brief Input validation utility class
 *
 * Throws ValidationException for invalid settings and InvalidPathException
 * for unsafe virtual device paths.
 */
class InputValidator {
 public:
  // Network validation
  static void validate_host(const std::string& host);
  static void validate_port(uint16_t port);
  static void validate_ipv4_address(const std::string& address);

  // Serial validation
  static void validate_device_path(const std::string& device);
  static void validate_baud_rate(uint32_t baud_rate);
  static void validate_data_bits(uint8_t data_bits);
  static void validate_parity(const std::string& parity);
  static void validate_stop_bits(const std::string& stop_bits);

  // Virtual device validation
  /**
   * @brief Lexical checks on a path the virtual device will be published at
   *
   * The path must be absolute, must not contain a ".." segment, must not
   * name a directory and, when @p allowed_root is non-empty, must lie under it.
   * @throws diagnostics::InvalidPathException
   */
  static void validate_device_link_path(const std::string& path, const std::string& allowed_root);
  static void validate_permissions(mode_t mode);

  // Timeouts, intervals and counts
  static void validate_retry_count(int retry_count);

  // String validation
  static void validate_non_empty_string(const std::string& str, const std::string& field_name);
  static void validate_string_length(const std::string& str, size_t max_length, const std::string& field_name);

  // Numeric validation
  static void validate_range(int64_t value, int64_t min, int64_t max, const std::string& field_name);
  static void validate_range(size_t value, size_t min, size_t max, const std::string& field_name);

  /**
   * @brief True if @p path equals @p root or lies below it, compared per path segment
   */
  static bool is_within_root(const std::string& path, const std::string& root);

 private:
  static bool is_valid_ipv4(std::string_view address);
  static bool is_valid_hostname(std::string_view hostname);
  static bool is_valid_device_path(const std::string& device);
};

inline void InputValidator::validate_non_empty_string(const std::string& str, const std::string& field_name) {
  if (str.empty()) {
    throw diagnostics::ValidationException(field_name + " cannot be empty", field_name, "non-empty string");
  }
}

inline void InputValidator::validate_string_length(const std::string& str, size_t max_length,
                                                   const std::string& field_name) {
  if (str.length() > max_length) {
    throw diagnostics::ValidationException(field_name + " length exceeds maximum allowed length", field_name,
                                           "length <= " + std::to_string(max_length));
  }
}

inline void InputValidator::validate_range(int64_t value, int64_t min, int64_t max, const std::string& field_name) {
  if (value < min || value > max) {
    throw diagnostics::ValidationException(field_name + " out of range", field_name,
                                           std::to_string(min) + " <= value <= " + std::to_string(max));
  }
}

inline void InputValidator::validate_range(size_t value, size_t min, size_t max, const std::string& field_name) {
  if (value < min || value > max) {
    throw diagnostics::ValidationException(field_name + " out of range", field_name,
                                           std::to_string(min) + " <= value <= " + std::to_string(max));
  }
}

inline void InputValidator::validate_port(uint16_t port) {
  if (port == 0) {
    throw diagnostics::ValidationException("port cannot be zero", "port", "1..65535");
  }
}

inline void InputValidator::validate_baud_rate(uint32_t baud_rate) {
  validate_range(static_cast<int64_t>(baud_rate), static_cast<int64_t>(base::constants::MIN_BAUD_RATE),
                 static_cast<int64_t>(base::constants::MAX_BAUD_RATE), "baud_rate");
}

inline void InputValidator::validate_data_bits(uint8_t data_bits) {
  validate_range(static_cast<int64_t>(data_bits), static_cast<int64_t>(base::constants::MIN_DATA_BITS),
                 static_cast<int64_t>(base::constants::MAX_DATA_BITS), "data_bits");
}

inline void InputValidator::validate_retry_count(int retry_count) {
  if (retry_count < -1 || retry_count > base::constants::MAX_RETRIES_LIMIT) {
    throw diagnostics::ValidationException("max_retries out of range", "max_retries",
                                           "-1 (unlimited) or 0.." + std::to_string(base::constants::MAX_RETRIES_LIMIT));
  }
}

inline void InputValidator::validate_permissions(mode_t mode) {
  if ((mode & ~static_cast<mode_t>(0777)) != 0) {
    throw diagnostics::ValidationException("permissions must be a plain octal mode", "permissions", "0000..0777");
  }
}

}  // namespace util
}  // namespace serlink
