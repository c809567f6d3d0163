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

#include "serlink/transport/serial/serial_port.hpp"

#include <termios.h>

#include <cerrno>

#include "serlink/diagnostics/error_handler.hpp"
#include "serlink/diagnostics/exceptions.hpp"
#include "serlink/diagnostics/logger.hpp"

namespace serlink {
namespace transport {

SerialPort::SerialPort(net::io_context& ioc, const config::SerialConfig& cfg) : cfg_(cfg), port_(ioc) {}

SerialPort::~SerialPort() {
  boost::system::error_code ec;
  close(ec);
}

void SerialPort::open() {
  boost::system::error_code ec;
  port_.open(cfg_.device, ec);
  if (ec) {
    fail("Failed to open serial device " + cfg_.device, ec);
  }

  configure(ec);
  if (ec) {
    boost::system::error_code ignored;
    port_.close(ignored);
    fail("Failed to configure serial device " + cfg_.device + " (" + cfg_.describe() + ")", ec);
  }

  SERLINK_LOG_INFO("serial", "open", "Opened " + cfg_.device + " at " + cfg_.describe());
}

void SerialPort::configure(boost::system::error_code& ec) {
  port_.set_option(net::serial_port_base::baud_rate(cfg_.baud_rate), ec);
  if (ec) return;

  port_.set_option(net::serial_port_base::character_size(cfg_.data_bits), ec);
  if (ec) return;

  using sb = net::serial_port_base::stop_bits;
  sb::type stop = sb::one;
  if (cfg_.stop_bits == config::StopBits::Two) {
    stop = sb::two;
  } else if (cfg_.stop_bits == config::StopBits::OnePointFive) {
    // termios has no 1.5 stop bits, CSTOPB is the closest setting
    SERLINK_LOG_WARNING("serial", "configure", "1.5 stop bits not supported by termios, using 2");
    stop = sb::two;
  }
  port_.set_option(sb(stop), ec);
  if (ec) return;

  using pa = net::serial_port_base::parity;
  switch (cfg_.parity) {
    case config::Parity::None:
      port_.set_option(pa(pa::none), ec);
      break;
    case config::Parity::Even:
      port_.set_option(pa(pa::even), ec);
      break;
    case config::Parity::Odd:
      port_.set_option(pa(pa::odd), ec);
      break;
    case config::Parity::Mark:
    case config::Parity::Space:
      apply_mark_space(ec);
      break;
  }
  if (ec) return;

  using fc = net::serial_port_base::flow_control;
  port_.set_option(fc(fc::none), ec);
}

void SerialPort::apply_mark_space(boost::system::error_code& ec) {
  // Asio only knows none/odd/even; stick parity needs CMSPAR
  const int fd = port_.native_handle();
  termios tio{};
  if (::tcgetattr(fd, &tio) != 0) {
    ec = boost::system::error_code(errno, boost::system::system_category());
    return;
  }
  tio.c_cflag |= PARENB | CMSPAR;
  if (cfg_.parity == config::Parity::Mark) {
    tio.c_cflag |= PARODD;
  } else {
    tio.c_cflag &= ~PARODD;
  }
  tio.c_iflag &= ~(INPCK | ISTRIP);
  if (::tcsetattr(fd, TCSANOW, &tio) != 0) {
    ec = boost::system::error_code(errno, boost::system::system_category());
  }
}

void SerialPort::fail(const std::string& what, const boost::system::error_code& ec) {
  const std::string message = what + ": " + ec.message();
  SERLINK_LOG_ERROR("serial", "open", message);
  diagnostics::error_reporting::report_device_error("serial", "open", message, ErrorCode::DeviceOpenFailed, ec);
  throw diagnostics::ConnectionException(message, ErrorCode::DeviceOpenFailed, "serial", "open");
}

int SerialPort::native_handle() { return port_.is_open() ? port_.native_handle() : -1; }

std::size_t SerialPort::read_some(const net::mutable_buffer& buffer, boost::system::error_code& ec) {
  return port_.read_some(buffer, ec);
}

std::size_t SerialPort::write_some(const net::const_buffer& buffer, boost::system::error_code& ec) {
  return port_.write_some(buffer, ec);
}

bool SerialPort::is_open() const { return port_.is_open(); }

void SerialPort::close(boost::system::error_code& ec) {
  ec.clear();
  if (port_.is_open()) {
    port_.close(ec);
    SERLINK_LOG_INFO("serial", "close", "Closed " + cfg_.device);
  }
}

std::string SerialPort::name() const { return "serial:" + cfg_.device; }

}  // namespace transport
}  // namespace serlink
