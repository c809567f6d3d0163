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

#include <gtest/gtest.h>
#include <poll.h>
#include <sys/socket.h>

#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "serlink/concurrency/shutdown_token.hpp"
#include "serlink/diagnostics/error_handler.hpp"
#include "serlink/server/client_registry.hpp"
#include "utils/test_utils.hpp"

using namespace serlink;
using namespace serlink::server;
using namespace std::chrono_literals;
using serlink::test::LoopbackPair;
using serlink::test::TestUtils;

namespace {

bool peer_closed(int fd, int timeout_ms = 1000) {
  return TestUtils::waitForCondition(
      [fd] {
        pollfd pfd{fd, POLLIN, 0};
        if (::poll(&pfd, 1, 0) <= 0) return false;
        char c;
        return ::recv(fd, &c, 1, MSG_PEEK | MSG_DONTWAIT) <= 0;
      },
      timeout_ms);
}

}  // namespace

class ClientRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    diagnostics::ErrorHandler::instance().reset_stats();
    ctx_.token = &token_;
    ctx_.poll_interval = 20ms;
  }

  // Registry side of a fresh loopback pair; the test keeps the peer side
  std::shared_ptr<ClientConnection> make_connection() {
    auto pair = LoopbackPair::make(ioc_);
    peers_.push_back(std::move(pair.left));
    return std::make_shared<ClientConnection>(next_id_++, std::move(pair.right));
  }

  int peer_fd(size_t index) { return peers_.at(index)->native_handle(); }

  boost::asio::io_context ioc_;
  concurrency::ShutdownToken token_;
  transport::WaitContext ctx_;
  std::vector<std::unique_ptr<transport::TcpStream>> peers_;
  ClientConnection::Id next_id_ = 1;
};

TEST_F(ClientRegistryTest, AcceptsUpToCapacity) {
  ClientRegistry registry(2);
  EXPECT_TRUE(registry.empty());

  EXPECT_EQ(registry.accept(make_connection()), AcceptResult::Accepted);
  EXPECT_EQ(registry.accept(make_connection()), AcceptResult::Accepted);
  EXPECT_EQ(registry.size(), 2u);
  EXPECT_EQ(registry.max_clients(), 2u);
}

TEST_F(ClientRegistryTest, RejectsAndClosesOverCapacity) {
  ClientRegistry registry(1);
  ASSERT_EQ(registry.accept(make_connection()), AcceptResult::Accepted);

  auto extra = make_connection();
  EXPECT_EQ(registry.accept(extra), AcceptResult::ConnectionLimitExceeded);
  EXPECT_EQ(registry.size(), 1u);
  EXPECT_TRUE(extra->is_shut_down());
  EXPECT_TRUE(peer_closed(peer_fd(1)));

  auto last = diagnostics::ErrorHandler::instance().get_errors_by_component("registry");
  ASSERT_FALSE(last.empty());
  EXPECT_EQ(last.back().code, ErrorCode::ConnectionLimitExceeded);
  EXPECT_EQ(last.back().level, diagnostics::ErrorLevel::WARNING);

  // The admitted peer is untouched
  const std::string data = "still here";
  EXPECT_EQ(registry.broadcast(reinterpret_cast<const uint8_t*>(data.data()), data.size(), ctx_, 1000ms), 1u);
  EXPECT_EQ(TestUtils::readExactly(peer_fd(0), data.size()), data);
}

TEST_F(ClientRegistryTest, BroadcastReachesEveryClient) {
  ClientRegistry registry(4);
  for (int i = 0; i < 3; ++i) {
    ASSERT_EQ(registry.accept(make_connection()), AcceptResult::Accepted);
  }

  const std::string data = "PING";
  EXPECT_EQ(registry.broadcast(reinterpret_cast<const uint8_t*>(data.data()), data.size(), ctx_, 1000ms), 3u);
  for (size_t i = 0; i < 3; ++i) {
    EXPECT_EQ(TestUtils::readExactly(peer_fd(i), data.size()), data) << "client " << i;
  }
}

TEST_F(ClientRegistryTest, FailedClientIsDroppedOthersKeepReceiving) {
  ClientRegistry registry(4);
  auto healthy = make_connection();
  auto broken = make_connection();
  ASSERT_EQ(registry.accept(healthy), AcceptResult::Accepted);
  ASSERT_EQ(registry.accept(broken), AcceptResult::Accepted);

  // Writes to a socket whose sending side is shut down fail with broken_pipe
  broken->stream().shutdown();

  const std::string first = "one";
  EXPECT_EQ(registry.broadcast(reinterpret_cast<const uint8_t*>(first.data()), first.size(), ctx_, 1000ms), 1u);
  EXPECT_EQ(registry.size(), 1u);
  EXPECT_TRUE(broken->is_shut_down());

  const std::string second = "two";
  EXPECT_EQ(registry.broadcast(reinterpret_cast<const uint8_t*>(second.data()), second.size(), ctx_, 1000ms), 1u);
  EXPECT_EQ(TestUtils::readExactly(peer_fd(0), 6), "onetwo");
}

TEST_F(ClientRegistryTest, BroadcastToEmptyRegistryDeliversNothing) {
  ClientRegistry registry(2);
  const uint8_t byte = 0x55;
  EXPECT_EQ(registry.broadcast(&byte, 1, ctx_, 100ms), 0u);
}

TEST_F(ClientRegistryTest, RemoveShutsConnectionDown) {
  ClientRegistry registry(2);
  auto connection = make_connection();
  ASSERT_EQ(registry.accept(connection), AcceptResult::Accepted);

  EXPECT_TRUE(registry.remove(connection->id()));
  EXPECT_FALSE(registry.remove(connection->id()));
  EXPECT_TRUE(registry.empty());
  EXPECT_TRUE(connection->is_shut_down());
  EXPECT_TRUE(peer_closed(peer_fd(0)));
}

TEST_F(ClientRegistryTest, ShutdownAllKeepsMembershipUntilCleared) {
  ClientRegistry registry(3);
  ASSERT_EQ(registry.accept(make_connection()), AcceptResult::Accepted);
  ASSERT_EQ(registry.accept(make_connection()), AcceptResult::Accepted);

  registry.shutdown_all();
  EXPECT_EQ(registry.size(), 2u);
  for (const auto& client : registry.snapshot()) {
    EXPECT_TRUE(client->is_shut_down());
  }
  EXPECT_TRUE(peer_closed(peer_fd(0)));
  EXPECT_TRUE(peer_closed(peer_fd(1)));

  auto dropped = registry.clear();
  EXPECT_EQ(dropped.size(), 2u);
  EXPECT_TRUE(registry.empty());
}

TEST_F(ClientRegistryTest, SlotFreedByRemoveCanBeReused) {
  ClientRegistry registry(1);
  auto first = make_connection();
  ASSERT_EQ(registry.accept(first), AcceptResult::Accepted);
  ASSERT_EQ(registry.accept(make_connection()), AcceptResult::ConnectionLimitExceeded);

  registry.remove(first->id());
  EXPECT_EQ(registry.accept(make_connection()), AcceptResult::Accepted);
}
