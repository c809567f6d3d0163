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

#include <boost/asio.hpp>
#include <chrono>
#include <csignal>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "pty_helper.hpp"
#include "serlink/concurrency/shutdown_token.hpp"
#include "serlink/concurrency/signal_watcher.hpp"
#include "serlink/diagnostics/exceptions.hpp"
#include "serlink/server/serial_bridge.hpp"
#include "utils/test_utils.hpp"

using namespace serlink;
using namespace std::chrono_literals;
using serlink::test::PtyHelper;
using serlink::test::TcpPeer;
using serlink::test::TestUtils;

/**
 * @brief Bridge wired to a pseudo-terminal standing in for the serial line
 *
 * The bridge opens the pty slave as its serial device; the test plays the
 * remote serial equipment through the master.
 */
class BridgeIntegrationTest : public serlink::test::NetworkTest {
 protected:
  void SetUp() override {
    NetworkTest::SetUp();
    pty_.init();
    token_ = std::make_shared<concurrency::ShutdownToken>();

    cfg_.serial.device = pty_.slave_name();
    cfg_.serial.baud_rate = 115200;
    cfg_.port = test_port_;
    cfg_.bind_address = "127.0.0.1";
    cfg_.max_clients = 3;
    cfg_.poll_interval_ms = 50;
    cfg_.client_write_timeout_ms = 1000;
  }

  void TearDown() override {
    if (bridge_) {
      token_->request_stop();
      if (running_.valid()) running_.wait_for(5s);
      bridge_.reset();
    }
    NetworkTest::TearDown();
  }

  void start_bridge() {
    bridge_ = std::make_unique<server::SerialBridge>(cfg_, token_);
    bridge_->start();
    ASSERT_EQ(bridge_->state(), base::BridgeState::Listening);
    running_ = std::async(std::launch::async, [this] { return bridge_->wait(); });
  }

  bool wait_for_clients(size_t count) {
    return TestUtils::waitForCondition([&] { return bridge_->client_count() == count; }, 3000);
  }

  PtyHelper pty_;
  std::shared_ptr<concurrency::ShutdownToken> token_;
  config::BridgeConfig cfg_;
  std::unique_ptr<server::SerialBridge> bridge_;
  std::future<ErrorCode> running_;
};

TEST_F(BridgeIntegrationTest, SerialDataReachesEveryClient) {
  start_bridge();

  TcpPeer first;
  TcpPeer second;
  ASSERT_TRUE(first.connect(test_port_));
  ASSERT_TRUE(second.connect(test_port_));
  ASSERT_TRUE(wait_for_clients(2));

  ASSERT_TRUE(TestUtils::writeAll(pty_.master_fd(), "PING"));
  EXPECT_EQ(first.receive(4), "PING");
  EXPECT_EQ(second.receive(4), "PING");
}

TEST_F(BridgeIntegrationTest, ClientDataReachesSerialOnly) {
  start_bridge();

  TcpPeer sender;
  TcpPeer listener;
  ASSERT_TRUE(sender.connect(test_port_));
  ASSERT_TRUE(listener.connect(test_port_));
  ASSERT_TRUE(wait_for_clients(2));

  ASSERT_TRUE(sender.send("AT\r\n"));
  EXPECT_EQ(TestUtils::readExactly(pty_.master_fd(), 4), "AT\r\n");

  // No fan-out between clients
  EXPECT_EQ(listener.receive(1, 300), "");
}

TEST_F(BridgeIntegrationTest, LargeSerialBurstArrivesInOrder) {
  cfg_.read_chunk = 256;
  start_bridge();

  TcpPeer peer;
  ASSERT_TRUE(peer.connect(test_port_));
  ASSERT_TRUE(wait_for_clients(1));

  const std::string payload = TestUtils::generateTestData(32 * 1024);
  std::thread writer([&] { TestUtils::writeAll(pty_.master_fd(), payload); });
  EXPECT_EQ(peer.receive(payload.size(), 10000), payload);
  writer.join();
}

TEST_F(BridgeIntegrationTest, SerialBackpressureDoesNotStopBridge) {
  cfg_.serial.timeout_ms = 200;
  start_bridge();

  TcpPeer peer;
  ASSERT_TRUE(peer.connect(test_port_));
  ASSERT_TRUE(wait_for_clients(1));

  // More than the pty buffers hold, so the bridge stalls until the master drains it
  const std::string payload = TestUtils::generateTestData(256 * 1024);
  std::thread sender([&] { peer.send(payload); });

  std::this_thread::sleep_for(1s);
  EXPECT_NE(running_.wait_for(0s), std::future_status::ready);
  EXPECT_EQ(bridge_->state(), base::BridgeState::Listening);
  EXPECT_EQ(bridge_->client_count(), 1u);

  EXPECT_EQ(TestUtils::readExactly(pty_.master_fd(), payload.size(), 10000), payload);
  sender.join();
  EXPECT_NE(running_.wait_for(0s), std::future_status::ready);
}

TEST_F(BridgeIntegrationTest, ExtraClientRejectedExistingUnaffected) {
  cfg_.max_clients = 2;
  start_bridge();

  TcpPeer a;
  TcpPeer b;
  ASSERT_TRUE(a.connect(test_port_));
  ASSERT_TRUE(b.connect(test_port_));
  ASSERT_TRUE(wait_for_clients(2));

  TcpPeer extra;
  ASSERT_TRUE(extra.connect(test_port_));
  EXPECT_TRUE(extra.wait_closed());
  EXPECT_EQ(bridge_->client_count(), 2u);

  ASSERT_TRUE(TestUtils::writeAll(pty_.master_fd(), "OK"));
  EXPECT_EQ(a.receive(2), "OK");
  EXPECT_EQ(b.receive(2), "OK");
}

TEST_F(BridgeIntegrationTest, DisconnectedClientFreesSlot) {
  cfg_.max_clients = 1;
  start_bridge();

  TcpPeer first;
  ASSERT_TRUE(first.connect(test_port_));
  ASSERT_TRUE(wait_for_clients(1));
  first.close();
  ASSERT_TRUE(wait_for_clients(0));

  TcpPeer second;
  ASSERT_TRUE(second.connect(test_port_));
  ASSERT_TRUE(wait_for_clients(1));
  ASSERT_TRUE(TestUtils::writeAll(pty_.master_fd(), "hi"));
  EXPECT_EQ(second.receive(2), "hi");
}

TEST_F(BridgeIntegrationTest, WelcomeBannerPrecedesData) {
  cfg_.send_welcome_banner = true;
  start_bridge();

  TcpPeer peer;
  ASSERT_TRUE(peer.connect(test_port_));
  ASSERT_TRUE(wait_for_clients(1));
  ASSERT_TRUE(TestUtils::writeAll(pty_.master_fd(), "DATA"));

  const std::string banner = "Connected to " + cfg_.serial.device + " at 115200 baud\r\n";
  EXPECT_EQ(peer.receive(banner.size() + 4), banner + "DATA");
}

TEST_F(BridgeIntegrationTest, TerminationSignalClosesClientsPromptly) {
  concurrency::SignalWatcher watcher(token_, {SIGTERM});
  watcher.start();
  start_bridge();

  TcpPeer a;
  TcpPeer b;
  ASSERT_TRUE(a.connect(test_port_));
  ASSERT_TRUE(b.connect(test_port_));
  ASSERT_TRUE(wait_for_clients(2));

  const auto start = std::chrono::steady_clock::now();
  ASSERT_EQ(std::raise(SIGTERM), 0);

  ASSERT_EQ(running_.wait_for(3s), std::future_status::ready);
  EXPECT_EQ(running_.get(), ErrorCode::Stopped);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
  EXPECT_EQ(watcher.last_signal(), SIGTERM);
  EXPECT_EQ(bridge_->state(), base::BridgeState::Stopped);
  EXPECT_TRUE(a.wait_closed(1000));
  EXPECT_TRUE(b.wait_closed(1000));

  // Listener is gone
  TcpPeer late;
  EXPECT_FALSE(late.connect(test_port_, 200));
  watcher.stop();
}

TEST_F(BridgeIntegrationTest, SerialHangupIsFatal) {
  start_bridge();

  TcpPeer peer;
  ASSERT_TRUE(peer.connect(test_port_));
  ASSERT_TRUE(wait_for_clients(1));

  pty_.close_master();

  ASSERT_EQ(running_.wait_for(5s), std::future_status::ready);
  EXPECT_EQ(running_.get(), ErrorCode::DeviceFailure);
  EXPECT_EQ(to_exit_code(ErrorCode::DeviceFailure), 1);
  EXPECT_TRUE(peer.wait_closed(1000));
}

TEST_F(BridgeIntegrationTest, OccupiedPortFailsStartup) {
  boost::asio::io_context ioc;
  boost::asio::ip::tcp::acceptor blocker(
      ioc, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), test_port_));

  bridge_ = std::make_unique<server::SerialBridge>(cfg_, token_);
  try {
    bridge_->start();
    FAIL() << "start() should fail on an occupied port";
  } catch (const diagnostics::ConnectionException& e) {
    EXPECT_EQ(e.get_code(), ErrorCode::PortInUse);
  }
  EXPECT_EQ(bridge_->state(), base::BridgeState::Stopped);
}

TEST_F(BridgeIntegrationTest, MissingSerialDeviceFailsStartup) {
  cfg_.serial.device = "/dev/serlink-no-such-device";
  bridge_ = std::make_unique<server::SerialBridge>(cfg_, token_);
  try {
    bridge_->start();
    FAIL() << "start() should fail without a serial device";
  } catch (const diagnostics::ConnectionException& e) {
    EXPECT_EQ(e.get_code(), ErrorCode::DeviceOpenFailed);
  }
  EXPECT_EQ(bridge_->state(), base::BridgeState::Stopped);
}
