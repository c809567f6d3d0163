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

#include <stdexcept>
#include <string>

#include "serlink/base/error_codes.hpp"

namespace serlink {
namespace diagnostics {

/**
 * @brief Base exception class for all serlink errors
 *
 * Carries the component and operation that failed plus the ErrorCode the
 * process exit status is derived from.
 */
class SerlinkException : public std::runtime_error {
 public:
  explicit SerlinkException(const std::string& message, ErrorCode code, const std::string& component = "",
                            const std::string& operation = "")
      : std::runtime_error(message), code_(code), component_(component), operation_(operation) {}

  ErrorCode get_code() const noexcept { return code_; }
  const std::string& get_component() const noexcept { return component_; }
  const std::string& get_operation() const noexcept { return operation_; }

  std::string get_full_message() const {
    std::string full_msg = what();
    if (!component_.empty()) {
      full_msg = "[" + component_ + "] " + full_msg;
    }
    if (!operation_.empty()) {
      full_msg += " (operation: " + operation_ + ")";
    }
    return full_msg;
  }

 private:
  ErrorCode code_;
  std::string component_;
  std::string operation_;
};

/**
 * @brief Bad command line, configuration file or serial settings
 *
 * Always raised before any device or socket is opened.
 */
class ConfigurationException : public SerlinkException {
 public:
  explicit ConfigurationException(const std::string& message, const std::string& config_section = "",
                                  const std::string& operation = "")
      : SerlinkException(message, ErrorCode::InvalidConfiguration, "configuration", operation),
        config_section_(config_section) {}

  const std::string& get_config_section() const noexcept { return config_section_; }

 private:
  std::string config_section_;
};

/**
 * @brief A single parameter failed validation
 */
class ValidationException : public ConfigurationException {
 public:
  explicit ValidationException(const std::string& message, const std::string& parameter = "",
                               const std::string& expected = "")
      : ConfigurationException(message, "", "validate"), parameter_(parameter), expected_(expected) {}

  const std::string& get_parameter() const noexcept { return parameter_; }
  const std::string& get_expected() const noexcept { return expected_; }

  std::string get_full_message() const {
    std::string full_msg = SerlinkException::get_full_message();
    if (!parameter_.empty()) {
      full_msg += " (parameter: " + parameter_ + ")";
    }
    if (!expected_.empty()) {
      full_msg += " (expected: " + expected_ + ")";
    }
    return full_msg;
  }

 private:
  std::string parameter_;
  std::string expected_;
};

/**
 * @brief Requested virtual device path is unsafe or cannot be published
 */
class InvalidPathException : public SerlinkException {
 public:
  explicit InvalidPathException(const std::string& message, const std::string& path = "")
      : SerlinkException(message, ErrorCode::InvalidPath, "vdev", "validate_path"), path_(path) {}

  const std::string& get_path() const noexcept { return path_; }

 private:
  std::string path_;
};

/**
 * @brief The pseudo-terminal pair could not be allocated or configured
 */
class DeviceCreationException : public SerlinkException {
 public:
  explicit DeviceCreationException(const std::string& message, const std::string& operation = "", int sys_errno = 0)
      : SerlinkException(message, ErrorCode::DeviceCreationFailed, "vdev", operation), errno_(sys_errno) {}

  int get_errno() const noexcept { return errno_; }

 private:
  int errno_;
};

/**
 * @brief Startup failure of a network or serial leg (bind, listen, serial open)
 */
class ConnectionException : public SerlinkException {
 public:
  explicit ConnectionException(const std::string& message, ErrorCode code, const std::string& connection_type = "",
                               const std::string& operation = "")
      : SerlinkException(message, code, "connection", operation), connection_type_(connection_type) {}

  const std::string& get_connection_type() const noexcept { return connection_type_; }

  std::string get_full_message() const {
    std::string full_msg = SerlinkException::get_full_message();
    if (!connection_type_.empty()) {
      full_msg = "[" + connection_type_ + "] " + full_msg;
    }
    return full_msg;
  }

 private:
  std::string connection_type_;
};

}  // namespace diagnostics
}  // namespace serlink
