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

#include <chrono>
#include <string>

#include "serlink/base/constants.hpp"
#include "serlink/config/logging_config.hpp"
#include "serlink/util/input_validator.hpp"

namespace serlink {
namespace config {

/**
 * @brief Settings of the echo test device
 */
struct EchoConfig {
  std::string device_path;
  std::string allowed_root;
  mode_t permissions = base::constants::DEFAULT_DEVICE_PERMISSIONS;
  unsigned baud_rate = base::constants::DEFAULT_BAUD_RATE;
  size_t read_chunk = base::constants::DEFAULT_READ_CHUNK;
  unsigned poll_interval_ms = base::constants::DEFAULT_POLL_INTERVAL_MS;
  LoggingConfig logging;

  /**
   * @throws diagnostics::ValidationException
   * @throws diagnostics::InvalidPathException
   */
  void validate() const {
    util::InputValidator::validate_device_link_path(device_path, allowed_root);
    util::InputValidator::validate_permissions(permissions);
    util::InputValidator::validate_baud_rate(baud_rate);
    util::InputValidator::validate_range(read_chunk, base::constants::MIN_READ_CHUNK, base::constants::MAX_READ_CHUNK,
                                         "read_chunk");
    util::InputValidator::validate_range(static_cast<int64_t>(poll_interval_ms),
                                         static_cast<int64_t>(base::constants::MIN_POLL_INTERVAL_MS),
                                         static_cast<int64_t>(base::constants::MAX_POLL_INTERVAL_MS),
                                         "poll_interval_ms");
  }

  std::chrono::milliseconds poll_interval() const { return std::chrono::milliseconds(poll_interval_ms); }
};

}  // namespace config
}  // namespace serlink
