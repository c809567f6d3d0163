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

namespace serlink {

/**
 * @brief Error codes shared by the bridge, the client and the echo device
 */
enum class ErrorCode {
  Success = 0,
  InvalidConfiguration,

  // Virtual device
  InvalidPath,
  DeviceCreationFailed,

  // Startup
  DeviceOpenFailed,
  PortInUse,
  BindFailed,
  ConnectionRefused,

  // Runtime
  ConnectionLimitExceeded,
  SourceError,
  SinkError,
  DeviceFailure,
  RetriesExhausted,

  // Lifecycle
  Stopped
};

/**
 * @brief Converts an ErrorCode to a human-readable string.
 */
inline std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Success:
      return "Success";
    case ErrorCode::InvalidConfiguration:
      return "Invalid Configuration";
    case ErrorCode::InvalidPath:
      return "Invalid Device Path";
    case ErrorCode::DeviceCreationFailed:
      return "Virtual Device Creation Failed";
    case ErrorCode::DeviceOpenFailed:
      return "Serial Device Open Failed";
    case ErrorCode::PortInUse:
      return "Port Already In Use";
    case ErrorCode::BindFailed:
      return "Failed to Bind Listener";
    case ErrorCode::ConnectionRefused:
      return "Connection Refused";
    case ErrorCode::ConnectionLimitExceeded:
      return "Connection Limit Exceeded";
    case ErrorCode::SourceError:
      return "Relay Source Error";
    case ErrorCode::SinkError:
      return "Relay Sink Error";
    case ErrorCode::DeviceFailure:
      return "Device Failure";
    case ErrorCode::RetriesExhausted:
      return "Reconnect Attempts Exhausted";
    case ErrorCode::Stopped:
      return "Stopped";
  }
  return "Unknown Error Code";
}

/**
 * @brief Process exit status for a terminal error code.
 *
 * 0 for a clean stop, 2 for configuration problems, 1 for everything else.
 */
inline int to_exit_code(ErrorCode code) {
  switch (code) {
    case ErrorCode::Success:
    case ErrorCode::Stopped:
      return 0;
    case ErrorCode::InvalidConfiguration:
      return 2;
    default:
      return 1;
  }
}

}  // namespace serlink
