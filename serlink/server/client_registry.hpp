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
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "serlink/server/client_connection.hpp"
#include "serlink/transport/stream_io.hpp"

namespace serlink {
namespace server {

enum class AcceptResult { Accepted, ConnectionLimitExceeded };

/**
 * @brief Bounded set of connected peers with fan-out writes
 *
 * A single reentrant lock guards membership only. broadcast() writes to a
 * snapshot outside the lock, so a slow peer never blocks accept or remove,
 * and a peer that joins mid-broadcast may miss that chunk.
 */
class ClientRegistry {
 public:
  explicit ClientRegistry(size_t max_clients);

  /**
   * @brief Register a connection, or close it immediately when full
   */
  AcceptResult accept(const std::shared_ptr<ClientConnection>& connection);

  /**
   * @brief Write a chunk to every registered peer
   *
   * A peer whose write fails or times out is removed; delivery to the
   * others continues.
   * @return number of peers that received the whole chunk
   */
  size_t broadcast(const uint8_t* data, size_t size, const transport::WaitContext& ctx,
                   std::chrono::milliseconds timeout);

  /**
   * @brief Unregister and shut down a peer
   * @return false if it was not registered
   */
  bool remove(ClientConnection::Id id);

  /**
   * @brief Shut down every peer socket, waking their workers; membership is kept
   */
  void shutdown_all();

  /**
   * @brief Drop all members and return them
   */
  std::vector<std::shared_ptr<ClientConnection>> clear();

  std::vector<std::shared_ptr<ClientConnection>> snapshot() const;
  size_t size() const;
  bool empty() const;
  size_t max_clients() const noexcept { return max_clients_; }

 private:
  const size_t max_clients_;
  mutable std::recursive_mutex mutex_;
  std::map<ClientConnection::Id, std::shared_ptr<ClientConnection>> clients_;
};

}  // namespace server
}  // namespace serlink
