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

#include <cstddef>
#include <cstdint>
#include <sys/types.h>

namespace serlink {
namespace base {
namespace constants {

// Serial line defaults
constexpr uint32_t DEFAULT_BAUD_RATE = 9600;
constexpr uint32_t MIN_BAUD_RATE = 50;       // Minimum baud rate
constexpr uint32_t MAX_BAUD_RATE = 4000000;  // Maximum baud rate
constexpr uint8_t DEFAULT_DATA_BITS = 8;
constexpr uint8_t MIN_DATA_BITS = 5;  // Minimum data bits
constexpr uint8_t MAX_DATA_BITS = 8;  // Maximum data bits
constexpr unsigned DEFAULT_SERIAL_TIMEOUT_MS = 1000;
constexpr unsigned MIN_SERIAL_TIMEOUT_MS = 1;
constexpr unsigned MAX_SERIAL_TIMEOUT_MS = 60000;

// Relay and polling
constexpr size_t DEFAULT_READ_CHUNK = 4096;  // 4KB per transfer chunk
constexpr size_t MIN_READ_CHUNK = 1;
constexpr size_t MAX_READ_CHUNK = 1024 * 1024;
constexpr unsigned DEFAULT_POLL_INTERVAL_MS = 100;  // Upper bound on shutdown latency
constexpr unsigned MIN_POLL_INTERVAL_MS = 1;
constexpr unsigned MAX_POLL_INTERVAL_MS = 5000;
constexpr size_t TRAFFIC_PREVIEW_BYTES = 50;

// Server side
constexpr size_t DEFAULT_MAX_CLIENTS = 10;
constexpr size_t MAX_MAX_CLIENTS = 10000;
constexpr int DEFAULT_LISTEN_BACKLOG = 5;
constexpr unsigned DEFAULT_CLIENT_WRITE_TIMEOUT_MS = 1000;
constexpr unsigned MIN_CLIENT_WRITE_TIMEOUT_MS = 10;
constexpr unsigned MAX_CLIENT_WRITE_TIMEOUT_MS = 60000;

// Client side reconnect
constexpr unsigned DEFAULT_BACKOFF_BASE_MS = 1000;
constexpr unsigned DEFAULT_BACKOFF_CAP_MS = 30000;
constexpr unsigned MIN_BACKOFF_MS = 1;
constexpr unsigned MAX_BACKOFF_MS = 300000;  // 5 minutes maximum
constexpr int DEFAULT_MAX_RETRIES = -1;      // Unlimited retries
constexpr int MAX_RETRIES_LIMIT = 100000;
constexpr unsigned DEFAULT_CONNECT_TIMEOUT_MS = 10000;
constexpr unsigned MIN_CONNECT_TIMEOUT_MS = 100;
constexpr unsigned MAX_CONNECT_TIMEOUT_MS = 300000;
constexpr int DEFAULT_KEEPALIVE_IDLE_S = 30;
constexpr int DEFAULT_KEEPALIVE_INTERVAL_S = 5;
constexpr int DEFAULT_KEEPALIVE_COUNT = 3;

// Virtual device
constexpr mode_t DEFAULT_DEVICE_PERMISSIONS = 0660;

// Validation constants
constexpr size_t MAX_HOSTNAME_LENGTH = 253;     // Maximum hostname length (RFC 1123)
constexpr size_t MAX_DEVICE_PATH_LENGTH = 4096;  // PATH_MAX on Linux

// Error handling
constexpr size_t DEFAULT_MAX_RECENT_ERRORS = 1000;
constexpr size_t MAX_COMPONENT_ERRORS = 100;

}  // namespace constants
}  // namespace base
}  // namespace serlink
