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

#include "serlink/server/client_connection.hpp"

#include "serlink/diagnostics/logger.hpp"

namespace serlink {
namespace server {

ClientConnection::ClientConnection(Id id, std::unique_ptr<transport::TcpStream> stream)
    : id_(id),
      stream_(std::move(stream)),
      remote_(stream_->remote_address()),
      joined_at_(std::chrono::system_clock::now()) {}

boost::system::error_code ClientConnection::send(const uint8_t* data, size_t size, const transport::WaitContext& ctx,
                                                 std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(send_mutex_);
  return transport::write_all(*stream_, data, size, ctx, timeout);
}

void ClientConnection::shutdown() {
  if (shut_down_.exchange(true)) {
    return;
  }
  stream_->shutdown();
}

void ClientConnection::close() {
  shut_down_.store(true);
  boost::system::error_code ec;
  stream_->close(ec);
  if (ec) {
    SERLINK_LOG_DEBUG("registry", "close", "Error closing " + remote_ + ": " + ec.message());
  }
}

}  // namespace server
}  // namespace serlink
