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
#include <cstdint>
#include <string>

#include "serlink/base/constants.hpp"
#include "serlink/config/logging_config.hpp"
#include "serlink/util/input_validator.hpp"

namespace serlink {
namespace config {

/**
 * @brief Settings of the network-to-virtual-device client
 */
struct ClientConfig {
  std::string host;
  uint16_t port = 0;
  std::string device_path;   // empty: expose the raw pty slave path only
  std::string allowed_root;  // empty: no root restriction
  mode_t permissions = base::constants::DEFAULT_DEVICE_PERMISSIONS;
  unsigned baud_rate = base::constants::DEFAULT_BAUD_RATE;

  unsigned backoff_base_ms = base::constants::DEFAULT_BACKOFF_BASE_MS;
  unsigned backoff_cap_ms = base::constants::DEFAULT_BACKOFF_CAP_MS;
  int max_retries = base::constants::DEFAULT_MAX_RETRIES;  // -1 for unlimited
  unsigned connect_timeout_ms = base::constants::DEFAULT_CONNECT_TIMEOUT_MS;

  bool keepalive = true;
  int keepalive_idle_s = base::constants::DEFAULT_KEEPALIVE_IDLE_S;
  int keepalive_interval_s = base::constants::DEFAULT_KEEPALIVE_INTERVAL_S;
  int keepalive_count = base::constants::DEFAULT_KEEPALIVE_COUNT;

  size_t read_chunk = base::constants::DEFAULT_READ_CHUNK;
  unsigned poll_interval_ms = base::constants::DEFAULT_POLL_INTERVAL_MS;
  LoggingConfig logging;

  /**
   * @throws diagnostics::ValidationException
   * @throws diagnostics::InvalidPathException for an unsafe device path
   */
  void validate() const {
    util::InputValidator::validate_host(host);
    util::InputValidator::validate_port(port);
    if (!device_path.empty()) {
      util::InputValidator::validate_device_link_path(device_path, allowed_root);
    }
    util::InputValidator::validate_permissions(permissions);
    util::InputValidator::validate_baud_rate(baud_rate);
    util::InputValidator::validate_range(static_cast<int64_t>(backoff_base_ms),
                                         static_cast<int64_t>(base::constants::MIN_BACKOFF_MS),
                                         static_cast<int64_t>(base::constants::MAX_BACKOFF_MS), "backoff_base_ms");
    util::InputValidator::validate_range(static_cast<int64_t>(backoff_cap_ms), static_cast<int64_t>(backoff_base_ms),
                                         static_cast<int64_t>(base::constants::MAX_BACKOFF_MS), "backoff_cap_ms");
    util::InputValidator::validate_retry_count(max_retries);
    util::InputValidator::validate_range(static_cast<int64_t>(connect_timeout_ms),
                                         static_cast<int64_t>(base::constants::MIN_CONNECT_TIMEOUT_MS),
                                         static_cast<int64_t>(base::constants::MAX_CONNECT_TIMEOUT_MS),
                                         "connect_timeout_ms");
    if (keepalive) {
      util::InputValidator::validate_range(static_cast<int64_t>(keepalive_idle_s), 1, 32767, "keepalive_idle_s");
      util::InputValidator::validate_range(static_cast<int64_t>(keepalive_interval_s), 1, 32767,
                                           "keepalive_interval_s");
      util::InputValidator::validate_range(static_cast<int64_t>(keepalive_count), 1, 127, "keepalive_count");
    }
    util::InputValidator::validate_range(read_chunk, base::constants::MIN_READ_CHUNK, base::constants::MAX_READ_CHUNK,
                                         "read_chunk");
    util::InputValidator::validate_range(static_cast<int64_t>(poll_interval_ms),
                                         static_cast<int64_t>(base::constants::MIN_POLL_INTERVAL_MS),
                                         static_cast<int64_t>(base::constants::MAX_POLL_INTERVAL_MS),
                                         "poll_interval_ms");
  }

  bool is_valid() const {
    try {
      validate();
      return true;
    } catch (const diagnostics::SerlinkException&) {
      return false;
    }
  }

  std::chrono::milliseconds poll_interval() const { return std::chrono::milliseconds(poll_interval_ms); }
  std::chrono::milliseconds connect_timeout() const { return std::chrono::milliseconds(connect_timeout_ms); }
};

}  // namespace config
}  // namespace serlink
