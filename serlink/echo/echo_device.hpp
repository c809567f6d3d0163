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

#include <atomic>
#include <boost/asio.hpp>
#include <cstdint>
#include <memory>
#include <string>

#include "serlink/base/error_codes.hpp"
#include "serlink/concurrency/shutdown_token.hpp"
#include "serlink/config/echo_config.hpp"
#include "serlink/transport/pty/virtual_device.hpp"

namespace serlink {
namespace echo {

namespace net = boost::asio;

/**
 * @brief Virtual serial device that writes back every byte it receives
 *
 * Runs until a stop request or a device-level I/O error. There is no
 * reconnect machinery: a failed device ends the run.
 */
class EchoDevice {
 public:
  EchoDevice(const config::EchoConfig& cfg, std::shared_ptr<concurrency::ShutdownToken> token);
  ~EchoDevice();

  EchoDevice(const EchoDevice&) = delete;
  EchoDevice& operator=(const EchoDevice&) = delete;

  /**
   * @throws diagnostics::InvalidPathException
   * @throws diagnostics::DeviceCreationException
   */
  void start();

  /**
   * @return Stopped, or DeviceFailure when the device broke
   */
  ErrorCode wait();

  ErrorCode run();
  void stop();

  std::string device_path() const;
  uint64_t bytes_echoed() const noexcept { return bytes_.load(); }

 private:
  void teardown();

  config::EchoConfig cfg_;
  std::shared_ptr<concurrency::ShutdownToken> token_;
  net::io_context ioc_;
  std::unique_ptr<transport::VirtualDevice> device_;
  std::atomic<uint64_t> bytes_{0};
};

}  // namespace echo
}  // namespace serlink
