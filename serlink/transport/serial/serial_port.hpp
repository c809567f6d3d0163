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

#include <boost/asio.hpp>
#include <string>

#include "serlink/config/serial_config.hpp"
#include "serlink/interface/stream_endpoint.hpp"

namespace serlink {
namespace transport {

namespace net = boost::asio;

/**
 * @brief Physical serial line opened exclusively by the bridge
 */
class SerialPort : public interface::StreamEndpoint {
 public:
  SerialPort(net::io_context& ioc, const config::SerialConfig& cfg);
  ~SerialPort() override;

  SerialPort(const SerialPort&) = delete;
  SerialPort& operator=(const SerialPort&) = delete;

  /**
   * @brief Open the device and apply baud, data bits, parity and stop bits
   * @throws diagnostics::ConnectionException with DeviceOpenFailed
   */
  void open();

  int native_handle() override;
  std::size_t read_some(const net::mutable_buffer& buffer, boost::system::error_code& ec) override;
  std::size_t write_some(const net::const_buffer& buffer, boost::system::error_code& ec) override;
  bool is_open() const override;
  void close(boost::system::error_code& ec) override;
  std::string name() const override;

  const config::SerialConfig& config() const noexcept { return cfg_; }

 private:
  void configure(boost::system::error_code& ec);
  void apply_mark_space(boost::system::error_code& ec);
  [[noreturn]] void fail(const std::string& what, const boost::system::error_code& ec);

  config::SerialConfig cfg_;
  net::serial_port port_;
};

}  // namespace transport
}  // namespace serlink
