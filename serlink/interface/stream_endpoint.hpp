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
#include <cstddef>
#include <string>

namespace serlink {
namespace interface {

namespace net = boost::asio;

/**
 * @brief A pollable byte stream: TCP socket, serial port or pty master.
 *
 * Reads are only issued after the descriptor polled readable, so read_some
 * returns without waiting. A non-blocking endpoint reports would_block
 * from write_some when the peer applies backpressure.
 */
class StreamEndpoint {
 public:
  virtual ~StreamEndpoint() = default;

  virtual int native_handle() = 0;
  virtual std::size_t read_some(const net::mutable_buffer& buffer, boost::system::error_code& ec) = 0;
  virtual std::size_t write_some(const net::const_buffer& buffer, boost::system::error_code& ec) = 0;
  virtual bool is_open() const = 0;
  virtual void close(boost::system::error_code& ec) = 0;

  /**
   * @brief Label used in traffic logs ("serial:/dev/ttyUSB0", "tcp:10.0.0.2:51234")
   */
  virtual std::string name() const = 0;
};

}  // namespace interface
}  // namespace serlink
