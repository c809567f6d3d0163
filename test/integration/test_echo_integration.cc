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

#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <string>

#include "serlink/concurrency/shutdown_token.hpp"
#include "serlink/diagnostics/exceptions.hpp"
#include "serlink/echo/echo_device.hpp"
#include "utils/test_utils.hpp"

using namespace serlink;
using namespace std::chrono_literals;
using serlink::test::TempDir;
using serlink::test::TestUtils;

namespace fs = std::filesystem;

class EchoIntegrationTest : public serlink::test::BaseTest {
 protected:
  void SetUp() override {
    BaseTest::SetUp();
    token_ = std::make_shared<concurrency::ShutdownToken>();
    cfg_.device_path = dir_.file("t1");
    cfg_.poll_interval_ms = 50;
  }

  void TearDown() override {
    if (app_fd_ >= 0) ::close(app_fd_);
    token_->request_stop();
    if (running_.valid()) running_.wait_for(5s);
    echo_.reset();
    BaseTest::TearDown();
  }

  void start_echo() {
    echo_ = std::make_unique<echo::EchoDevice>(cfg_, token_);
    echo_->start();
    running_ = std::async(std::launch::async, [this] { return echo_->wait(); });
    app_fd_ = ::open(cfg_.device_path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    ASSERT_GE(app_fd_, 0) << "cannot open " << cfg_.device_path;
  }

  TempDir dir_;
  std::shared_ptr<concurrency::ShutdownToken> token_;
  config::EchoConfig cfg_;
  std::unique_ptr<echo::EchoDevice> echo_;
  std::future<ErrorCode> running_;
  int app_fd_ = -1;
};

TEST_F(EchoIntegrationTest, WrittenBytesComeBack) {
  start_echo();
  EXPECT_EQ(echo_->device_path(), cfg_.device_path);

  ASSERT_TRUE(TestUtils::writeAll(app_fd_, "abc"));
  EXPECT_EQ(TestUtils::readExactly(app_fd_, 3), "abc");
}

TEST_F(EchoIntegrationTest, BinaryPayloadEchoedInOrder) {
  start_echo();

  const std::string payload = TestUtils::generateTestData(2048);
  std::string received;
  for (size_t offset = 0; offset < payload.size(); offset += 256) {
    const std::string chunk = payload.substr(offset, 256);
    ASSERT_TRUE(TestUtils::writeAll(app_fd_, chunk));
    received += TestUtils::readExactly(app_fd_, chunk.size());
  }
  EXPECT_EQ(received, payload);
}

TEST_F(EchoIntegrationTest, StopRemovesDeviceAndReportsCount) {
  start_echo();
  ASSERT_TRUE(TestUtils::writeAll(app_fd_, "xyz"));
  ASSERT_EQ(TestUtils::readExactly(app_fd_, 3), "xyz");

  echo_->stop();
  ASSERT_EQ(running_.wait_for(2s), std::future_status::ready);
  EXPECT_EQ(running_.get(), ErrorCode::Stopped);
  EXPECT_EQ(echo_->bytes_echoed(), 3u);
  EXPECT_FALSE(fs::exists(fs::symlink_status(cfg_.device_path)));
}

TEST_F(EchoIntegrationTest, ReopenAfterApplicationCloses) {
  start_echo();
  ::close(app_fd_);
  app_fd_ = ::open(cfg_.device_path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
  ASSERT_GE(app_fd_, 0);

  ASSERT_TRUE(TestUtils::writeAll(app_fd_, "again"));
  EXPECT_EQ(TestUtils::readExactly(app_fd_, 5), "again");
}

TEST_F(EchoIntegrationTest, OccupiedPathRejected) {
  { std::ofstream(cfg_.device_path) << "file"; }
  echo_ = std::make_unique<echo::EchoDevice>(cfg_, token_);
  EXPECT_THROW(echo_->start(), diagnostics::InvalidPathException);
  EXPECT_TRUE(fs::is_regular_file(cfg_.device_path));
}
