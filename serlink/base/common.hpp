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

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace serlink {
namespace base {

/**
 * @brief Lifecycle of the serial-to-network bridge
 */
enum class BridgeState { Starting, Listening, ShuttingDown, Stopped };

/**
 * @brief Lifecycle of the network-to-virtual-device client
 */
enum class ClientState { Disconnected, Connecting, Connected, ShuttingDown };

inline const char* to_cstr(BridgeState s) {
  switch (s) {
    case BridgeState::Starting:
      return "Starting";
    case BridgeState::Listening:
      return "Listening";
    case BridgeState::ShuttingDown:
      return "ShuttingDown";
    case BridgeState::Stopped:
      return "Stopped";
  }
  return "?";
}

inline const char* to_cstr(ClientState s) {
  switch (s) {
    case ClientState::Disconnected:
      return "Disconnected";
    case ClientState::Connecting:
      return "Connecting";
    case ClientState::Connected:
      return "Connected";
    case ClientState::ShuttingDown:
      return "ShuttingDown";
  }
  return "?";
}

// Safe type conversion utilities
namespace safe_convert {

inline std::string uint8_to_string(const uint8_t* data, size_t size) {
  if (!data || size == 0) {
    return std::string{};
  }
  return std::string(data, data + size);
}

inline std::vector<uint8_t> string_to_uint8(const std::string& str) {
  return std::vector<uint8_t>(str.begin(), str.end());
}

/**
 * @brief View of std::string as byte array without allocation
 */
inline std::pair<const uint8_t*, size_t> string_to_bytes(const std::string& str) {
  return {reinterpret_cast<const uint8_t*>(str.data()), str.size()};
}

}  // namespace safe_convert

}  // namespace base
}  // namespace serlink
