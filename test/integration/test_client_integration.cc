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

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <boost/asio.hpp>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "serlink/client/network_client.hpp"
#include "serlink/concurrency/shutdown_token.hpp"
#include "utils/test_utils.hpp"

using namespace serlink;
using namespace std::chrono_literals;
using serlink::test::TempDir;
using serlink::test::TestUtils;

namespace fs = std::filesystem;
namespace net = boost::asio;

/**
 * @brief Plays the remote TCP server the client dials
 */
class FakeServer {
 public:
  explicit FakeServer(uint16_t port)
      : acceptor_(ioc_, net::ip::tcp::endpoint(net::ip::make_address("127.0.0.1"), port)) {
    acceptor_.non_blocking(true);
  }

  bool accept(int timeout_ms = 5000) {
    return TestUtils::waitForCondition(
        [this] {
          boost::system::error_code ec;
          net::ip::tcp::socket socket(ioc_);
          acceptor_.accept(socket, ec);
          if (ec) return false;
          socket_ = std::make_unique<net::ip::tcp::socket>(std::move(socket));
          return true;
        },
        timeout_ms);
  }

  int fd() { return socket_->native_handle(); }

  void drop() {
    boost::system::error_code ec;
    socket_->close(ec);
    socket_.reset();
  }

 private:
  net::io_context ioc_;
  net::ip::tcp::acceptor acceptor_;
  std::unique_ptr<net::ip::tcp::socket> socket_;
};

class ClientIntegrationTest : public serlink::test::NetworkTest {
 protected:
  void SetUp() override {
    NetworkTest::SetUp();
    token_ = std::make_shared<concurrency::ShutdownToken>();

    cfg_.host = "127.0.0.1";
    cfg_.port = test_port_;
    cfg_.device_path = dir_.file("ttyNET0");
    cfg_.backoff_base_ms = 50;
    cfg_.backoff_cap_ms = 200;
    cfg_.max_retries = -1;
    cfg_.connect_timeout_ms = 500;
    cfg_.poll_interval_ms = 50;
  }

  void TearDown() override {
    if (app_fd_ >= 0) ::close(app_fd_);
    token_->request_stop();
    if (running_.valid()) running_.wait_for(5s);
    client_.reset();
    NetworkTest::TearDown();
  }

  void start_client() {
    client_ = std::make_unique<client::NetworkClient>(cfg_, token_);
    client_->on_retry([this](uint32_t failures, std::chrono::milliseconds delay) {
      std::lock_guard<std::mutex> lock(mutex_);
      retries_.push_back({failures, delay});
    });
    client_->start();
    running_ = std::async(std::launch::async, [this] { return client_->wait(); });
  }

  void open_device() {
    app_fd_ = ::open(cfg_.device_path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    ASSERT_GE(app_fd_, 0) << "cannot open " << cfg_.device_path;
  }

  size_t retry_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return retries_.size();
  }

  TempDir dir_;
  std::shared_ptr<concurrency::ShutdownToken> token_;
  config::ClientConfig cfg_;
  std::unique_ptr<client::NetworkClient> client_;
  std::future<ErrorCode> running_;
  int app_fd_ = -1;

  std::mutex mutex_;
  std::vector<std::pair<uint32_t, std::chrono::milliseconds>> retries_;
};

TEST_F(ClientIntegrationTest, DevicePublishedBeforeServerIsReachable) {
  start_client();
  EXPECT_EQ(client_->device_path(), cfg_.device_path);
  EXPECT_TRUE(fs::is_symlink(cfg_.device_path));
  EXPECT_TRUE(TestUtils::waitForCondition([this] { return retry_count() >= 1; }, 2000));
  EXPECT_NE(client_->state(), base::ClientState::Connected);
}

TEST_F(ClientIntegrationTest, BacksOffThenConnectsAndRelays) {
  start_client();
  ASSERT_TRUE(TestUtils::waitForCondition([this] { return retry_count() >= 4; }, 5000));

  {
    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(retries_[0].first, 1u);
    EXPECT_EQ(retries_[0].second, 50ms);
    EXPECT_EQ(retries_[1].second, 100ms);
    EXPECT_EQ(retries_[2].second, 200ms);
    EXPECT_EQ(retries_[3].second, 200ms);  // capped
  }

  FakeServer server(test_port_);
  ASSERT_TRUE(server.accept());
  ASSERT_TRUE(TestUtils::waitForCondition([this] { return client_->state() == base::ClientState::Connected; }));

  open_device();
  ASSERT_TRUE(TestUtils::writeAll(server.fd(), "hello"));
  EXPECT_EQ(TestUtils::readExactly(app_fd_, 5), "hello");

  ASSERT_TRUE(TestUtils::writeAll(app_fd_, "world"));
  EXPECT_EQ(TestUtils::readExactly(server.fd(), 5), "world");
}

TEST_F(ClientIntegrationTest, DeviceSurvivesReconnect) {
  FakeServer server(test_port_);
  start_client();
  ASSERT_TRUE(server.accept());
  open_device();

  const auto attempts_before = client_->connect_attempts();
  server.drop();

  // Same device, new connection
  ASSERT_TRUE(server.accept());
  EXPECT_GT(client_->connect_attempts(), attempts_before);
  EXPECT_TRUE(fs::is_symlink(cfg_.device_path));

  ASSERT_TRUE(TestUtils::waitForCondition([this] { return client_->state() == base::ClientState::Connected; }));
  ASSERT_TRUE(TestUtils::writeAll(server.fd(), "again"));
  EXPECT_EQ(TestUtils::readExactly(app_fd_, 5), "again");

  // A successful connection resets the backoff
  std::lock_guard<std::mutex> lock(mutex_);
  ASSERT_FALSE(retries_.empty());
  EXPECT_EQ(retries_.back().first, 1u);
  EXPECT_EQ(retries_.back().second, 50ms);
}

TEST_F(ClientIntegrationTest, GivesUpAfterMaxRetries) {
  cfg_.max_retries = 2;
  cfg_.backoff_base_ms = 10;
  cfg_.backoff_cap_ms = 20;
  start_client();

  ASSERT_EQ(running_.wait_for(5s), std::future_status::ready);
  EXPECT_EQ(running_.get(), ErrorCode::RetriesExhausted);
  EXPECT_EQ(retry_count(), 2u);
  EXPECT_EQ(client_->connect_attempts(), 3u);
  EXPECT_EQ(to_exit_code(ErrorCode::RetriesExhausted), 1);
  EXPECT_FALSE(fs::exists(fs::symlink_status(cfg_.device_path)));
}

TEST_F(ClientIntegrationTest, NoRetriesMeansSingleAttempt) {
  cfg_.max_retries = 0;
  start_client();

  ASSERT_EQ(running_.wait_for(5s), std::future_status::ready);
  EXPECT_EQ(running_.get(), ErrorCode::RetriesExhausted);
  EXPECT_EQ(retry_count(), 0u);
  EXPECT_EQ(client_->connect_attempts(), 1u);
}

TEST_F(ClientIntegrationTest, StopWhileConnectedRemovesDevice) {
  FakeServer server(test_port_);
  start_client();
  ASSERT_TRUE(server.accept());
  ASSERT_TRUE(TestUtils::waitForCondition([this] { return client_->state() == base::ClientState::Connected; }));

  client_->stop();
  ASSERT_EQ(running_.wait_for(2s), std::future_status::ready);
  EXPECT_EQ(running_.get(), ErrorCode::Stopped);
  EXPECT_FALSE(fs::exists(fs::symlink_status(cfg_.device_path)));
  EXPECT_EQ(client_->state(), base::ClientState::Disconnected);
}

TEST_F(ClientIntegrationTest, StateChangesFollowConnectionLifecycle) {
  std::mutex states_mutex;
  std::vector<base::ClientState> states;

  FakeServer server(test_port_);
  client_ = std::make_unique<client::NetworkClient>(cfg_, token_);
  client_->on_state_change([&](base::ClientState state) {
    std::lock_guard<std::mutex> lock(states_mutex);
    states.push_back(state);
  });
  client_->start();
  running_ = std::async(std::launch::async, [this] { return client_->wait(); });

  ASSERT_TRUE(server.accept());
  ASSERT_TRUE(TestUtils::waitForCondition([this] { return client_->state() == base::ClientState::Connected; }));
  client_->stop();
  ASSERT_EQ(running_.wait_for(2s), std::future_status::ready);
  EXPECT_EQ(running_.get(), ErrorCode::Stopped);

  std::lock_guard<std::mutex> lock(states_mutex);
  const std::vector<base::ClientState> expected = {base::ClientState::Connecting, base::ClientState::Connected,
                                                   base::ClientState::ShuttingDown,
                                                   base::ClientState::Disconnected};
  EXPECT_EQ(states, expected);
}

TEST_F(ClientIntegrationTest, StopDuringBackoffIsPrompt) {
  cfg_.backoff_base_ms = 5000;
  cfg_.backoff_cap_ms = 5000;
  start_client();
  ASSERT_TRUE(TestUtils::waitForCondition([this] { return retry_count() >= 1; }, 2000));

  const auto start = std::chrono::steady_clock::now();
  client_->stop();
  ASSERT_EQ(running_.wait_for(2s), std::future_status::ready);
  EXPECT_EQ(running_.get(), ErrorCode::Stopped);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}
