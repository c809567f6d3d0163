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

#include <algorithm>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <string>

#include "serlink/base/error_codes.hpp"

namespace serlink {
namespace diagnostics {

/**
 * @brief Error severity levels
 */
enum class ErrorLevel {
  INFO = 0,     // Informational (client rejected, reconnect scheduled)
  WARNING = 1,  // Recoverable issue
  ERROR = 2,    // Operation failed
  CRITICAL = 3  // Process cannot continue
};

/**
 * @brief Error categories for classification
 */
enum class ErrorCategory {
  CONNECTION = 0,     // TCP connect/accept/bind
  COMMUNICATION = 1,  // Relay read/write
  CONFIGURATION = 2,  // Invalid settings
  DEVICE = 3,         // Serial port or virtual device
  SYSTEM = 4,         // OS level errors
  UNKNOWN = 5
};

/**
 * @brief Error record kept by the ErrorHandler
 */
struct ErrorInfo {
  ErrorLevel level;
  ErrorCategory category;
  std::string component;  // bridge, client, echo, relay, registry, vdev ...
  std::string operation;  // read, write, connect, bind, accept ...
  std::string message;
  ErrorCode code;
  boost::system::error_code boost_error;
  std::chrono::system_clock::time_point timestamp;
  bool retryable;
  uint32_t retry_count;

  ErrorInfo(ErrorLevel l, ErrorCategory c, const std::string& comp, const std::string& op, const std::string& msg,
            ErrorCode error_code = ErrorCode::Success)
      : level(l),
        category(c),
        component(comp),
        operation(op),
        message(msg),
        code(error_code),
        timestamp(std::chrono::system_clock::now()),
        retryable(false),
        retry_count(0) {}

  ErrorInfo(ErrorLevel l, ErrorCategory c, const std::string& comp, const std::string& op, const std::string& msg,
            const boost::system::error_code& ec, bool retry = false, ErrorCode error_code = ErrorCode::Success)
      : level(l),
        category(c),
        component(comp),
        operation(op),
        message(msg),
        code(error_code),
        boost_error(ec),
        timestamp(std::chrono::system_clock::now()),
        retryable(retry),
        retry_count(0) {}

  std::string get_timestamp_string() const {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
  }

  std::string get_level_string() const {
    switch (level) {
      case ErrorLevel::INFO:
        return "INFO";
      case ErrorLevel::WARNING:
        return "WARNING";
      case ErrorLevel::ERROR:
        return "ERROR";
      case ErrorLevel::CRITICAL:
        return "CRITICAL";
    }
    return "UNKNOWN";
  }

  std::string get_category_string() const {
    switch (category) {
      case ErrorCategory::CONNECTION:
        return "CONNECTION";
      case ErrorCategory::COMMUNICATION:
        return "COMMUNICATION";
      case ErrorCategory::CONFIGURATION:
        return "CONFIGURATION";
      case ErrorCategory::DEVICE:
        return "DEVICE";
      case ErrorCategory::SYSTEM:
        return "SYSTEM";
      case ErrorCategory::UNKNOWN:
        return "UNKNOWN";
    }
    return "UNKNOWN";
  }

  /**
   * @brief One-line summary, e.g. "[ERROR] [client] [connect] Connection refused (code: 111) [RETRYABLE]"
   */
  std::string get_summary() const {
    std::ostringstream oss;
    oss << "[" << get_level_string() << "] " << "[" << component << "] " << "[" << operation << "] " << message;

    if (code != ErrorCode::Success) {
      oss << " <" << to_string(code) << ">";
    }

    if (boost_error) {
      oss << " (" << boost_error.message() << ", code: " << boost_error.value() << ")";
    }

    if (retryable) {
      oss << " [RETRYABLE, count: " << retry_count << "]";
    }

    return oss.str();
  }
};

/**
 * @brief Error statistics
 */
struct ErrorStats {
  size_t total_errors = 0;
  size_t errors_by_level[4] = {0, 0, 0, 0};
  size_t errors_by_category[6] = {0, 0, 0, 0, 0, 0};
  size_t retryable_errors = 0;

  std::chrono::system_clock::time_point first_error;
  std::chrono::system_clock::time_point last_error;

  void reset() {
    total_errors = 0;
    std::fill(std::begin(errors_by_level), std::end(errors_by_level), 0);
    std::fill(std::begin(errors_by_category), std::end(errors_by_category), 0);
    retryable_errors = 0;
    first_error = std::chrono::system_clock::time_point{};
    last_error = std::chrono::system_clock::time_point{};
  }
};

}  // namespace diagnostics
}  // namespace serlink
