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

#include <gmock/gmock.h>

#include <boost/asio.hpp>
#include <string>

#include "serlink/interface/stream_endpoint.hpp"

namespace serlink {
namespace test {
namespace mocks {

/**
 * @brief Mock relay endpoint
 *
 * native_handle() must still return a descriptor poll() accepts; tests
 * hand it one end of a Pipe so readiness is under their control.
 */
class MockStreamEndpoint : public interface::StreamEndpoint {
 public:
  MOCK_METHOD(int, native_handle, (), (override));
  MOCK_METHOD(std::size_t, read_some, (const boost::asio::mutable_buffer&, boost::system::error_code&), (override));
  MOCK_METHOD(std::size_t, write_some, (const boost::asio::const_buffer&, boost::system::error_code&), (override));
  MOCK_METHOD(bool, is_open, (), (const, override));
  MOCK_METHOD(void, close, (boost::system::error_code&), (override));
  MOCK_METHOD(std::string, name, (), (const, override));
};

}  // namespace mocks
}  // namespace test
}  // namespace serlink
