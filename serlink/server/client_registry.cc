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

#include "serlink/server/client_registry.hpp"

#include <boost/asio/error.hpp>
#include <string>

#include "serlink/diagnostics/error_handler.hpp"
#include "serlink/diagnostics/logger.hpp"

namespace serlink {
namespace server {

ClientRegistry::ClientRegistry(size_t max_clients) : max_clients_(max_clients) {}

AcceptResult ClientRegistry::accept(const std::shared_ptr<ClientConnection>& connection) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (clients_.size() >= max_clients_) {
    const std::string message = "Client connection rejected - server at capacity (" +
                                std::to_string(clients_.size()) + "/" + std::to_string(max_clients_) +
                                "): " + connection->remote_address();
    SERLINK_LOG_WARNING("registry", "accept", message);
    diagnostics::error_reporting::report_warning("registry", "accept", message, ErrorCode::ConnectionLimitExceeded);
    connection->close();
    return AcceptResult::ConnectionLimitExceeded;
  }

  clients_.emplace(connection->id(), connection);
  SERLINK_LOG_INFO("registry", "accept",
                   "Client connected: " + connection->remote_address() + " (" + std::to_string(clients_.size()) +
                       "/" + std::to_string(max_clients_) + ")");
  return AcceptResult::Accepted;
}

size_t ClientRegistry::broadcast(const uint8_t* data, size_t size, const transport::WaitContext& ctx,
                                 std::chrono::milliseconds timeout) {
  size_t delivered = 0;
  for (const auto& client : snapshot()) {
    const auto ec = client->send(data, size, ctx, timeout);
    if (!ec) {
      ++delivered;
      continue;
    }
    if (ec == boost::asio::error::operation_aborted) {
      break;  // shutting down
    }

    SERLINK_LOG_WARNING("registry", "broadcast",
                        "Dropping client " + client->remote_address() + " after failed write: " + ec.message());
    diagnostics::error_reporting::report_communication_error("registry", "broadcast",
                                                             "write to " + client->remote_address() + " failed", ec,
                                                             ErrorCode::SinkError);
    remove(client->id());
  }
  return delivered;
}

bool ClientRegistry::remove(ClientConnection::Id id) {
  std::shared_ptr<ClientConnection> removed;
  {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = clients_.find(id);
    if (it == clients_.end()) {
      return false;
    }
    removed = it->second;
    clients_.erase(it);
    SERLINK_LOG_INFO("registry", "remove",
                     "Client removed: " + removed->remote_address() + " (" + std::to_string(clients_.size()) + "/" +
                         std::to_string(max_clients_) + ")");
  }
  removed->shutdown();
  return true;
}

void ClientRegistry::shutdown_all() {
  for (const auto& client : snapshot()) {
    client->shutdown();
  }
}

std::vector<std::shared_ptr<ClientConnection>> ClientRegistry::clear() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  std::vector<std::shared_ptr<ClientConnection>> dropped;
  dropped.reserve(clients_.size());
  for (auto& entry : clients_) {
    dropped.push_back(entry.second);
  }
  clients_.clear();
  return dropped;
}

std::vector<std::shared_ptr<ClientConnection>> ClientRegistry::snapshot() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  std::vector<std::shared_ptr<ClientConnection>> members;
  members.reserve(clients_.size());
  for (const auto& entry : clients_) {
    members.push_back(entry.second);
  }
  return members;
}

size_t ClientRegistry::size() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return clients_.size();
}

bool ClientRegistry::empty() const { return size() == 0; }

}  // namespace server
}  // namespace serlink
