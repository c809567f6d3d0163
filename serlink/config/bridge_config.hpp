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

#include <chrono>
#include <cstdint>
#include <string>

#include "serlink/base/constants.hpp"
#include "serlink/config/logging_config.hpp"
#include "serlink/config/serial_config.hpp"
#include "serlink/util/input_validator.hpp"

namespace serlink {
namespace config {

/**
 * @brief Settings of the serial-to-network bridge (server mode)
 */
struct BridgeConfig {
  SerialConfig serial;
  uint16_t port = 0;
  std::string bind_address = "0.0.0.0";
  size_t max_clients = base::constants::DEFAULT_MAX_CLIENTS;
  int listen_backlog = base::constants::DEFAULT_LISTEN_BACKLOG;
  size_t read_chunk = base::constants::DEFAULT_READ_CHUNK;
  unsigned poll_interval_ms = base::constants::DEFAULT_POLL_INTERVAL_MS;
  unsigned client_write_timeout_ms = base::constants::DEFAULT_CLIENT_WRITE_TIMEOUT_MS;
  bool send_welcome_banner = false;
  LoggingConfig logging;

  /**
   * @throws diagnostics::ValidationException
   */
  void validate() const {
    serial.validate();
    util::InputValidator::validate_port(port);
    util::InputValidator::validate_ipv4_address(bind_address);
    util::InputValidator::validate_range(max_clients, static_cast<size_t>(1), base::constants::MAX_MAX_CLIENTS,
                                         "max_clients");
    util::InputValidator::validate_range(static_cast<int64_t>(listen_backlog), 1, 4096, "listen_backlog");
    util::InputValidator::validate_range(read_chunk, base::constants::MIN_READ_CHUNK, base::constants::MAX_READ_CHUNK,
                                         "read_chunk");
    util::InputValidator::validate_range(static_cast<int64_t>(poll_interval_ms),
                                         static_cast<int64_t>(base::constants::MIN_POLL_INTERVAL_MS),
                                         static_cast<int64_t>(base::constants::MAX_POLL_INTERVAL_MS),
                                         "poll_interval_ms");
    util::InputValidator::validate_range(static_cast<int64_t>(client_write_timeout_ms),
                                         static_cast<int64_t>(base::constants::MIN_CLIENT_WRITE_TIMEOUT_MS),
                                         static_cast<int64_t>(base::constants::MAX_CLIENT_WRITE_TIMEOUT_MS),
                                         "client_write_timeout_ms");
  }

  bool is_valid() const {
    try {
      validate();
      return true;
    } catch (const diagnostics::ValidationException&) {
      return false;
    }
  }

  std::chrono::milliseconds poll_interval() const { return std::chrono::milliseconds(poll_interval_ms); }
  std::chrono::milliseconds client_write_timeout() const { return std::chrono::milliseconds(client_write_timeout_ms); }
};

}  // namespace config
}  // namespace serlink
