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

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <boost/asio.hpp>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "serlink/transport/tcp/tcp_stream.hpp"

namespace serlink {
namespace test {

/**
 * @brief Common test utilities for serlink tests
 */
class TestUtils {
 public:
  /**
   * @brief Get a guaranteed available test port
   */
  static uint16_t getAvailableTestPort() {
    static std::atomic<uint16_t> port_counter{31000};

    for (int attempt = 0; attempt < 1024; ++attempt) {
      uint16_t candidate = port_counter.fetch_add(1);
      if (candidate > 60000) {
        port_counter.store(31000);
        candidate = port_counter.fetch_add(1);
      }
      if (isPortAvailable(candidate)) {
        return candidate;
      }
    }
    throw std::runtime_error("Unable to find available test port after many attempts");
  }

  /**
   * @brief Check if a port is available for binding
   */
  static bool isPortAvailable(uint16_t port) {
    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) return false;

    // Set SO_REUSEADDR to allow binding to recently used ports
    int reuse = 1;
    setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = INADDR_ANY;

    bool available = bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    close(sock);
    return available;
  }

  /**
   * @brief Wait for a condition with timeout
   * @return true if condition was met, false if timeout
   */
  template <typename Condition>
  static bool waitForCondition(Condition&& condition, int timeout_ms = 5000) {
    auto start = std::chrono::steady_clock::now();
    auto timeout = std::chrono::milliseconds(timeout_ms);

    while (std::chrono::steady_clock::now() - start < timeout) {
      if (condition()) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return condition();
  }

  static void waitFor(int ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); }

  /**
   * @brief Deterministic payload of the given size covering all byte values
   */
  static std::string generateTestData(size_t size) {
    std::string data;
    data.reserve(size);
    for (size_t i = 0; i < size; ++i) {
      data += static_cast<char>((i * 7 + 3) & 0xff);
    }
    return data;
  }

  /**
   * @brief Read from a blocking or non-blocking descriptor until @p size bytes
   *        arrived or the timeout expired
   */
  static std::string readExactly(int fd, size_t size, int timeout_ms = 3000) {
    std::string out;
    const auto give_up_at = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    char buf[4096];
    while (out.size() < size && std::chrono::steady_clock::now() < give_up_at) {
      pollfd pfd{fd, POLLIN, 0};
      if (::poll(&pfd, 1, 10) <= 0) continue;
      const ssize_t n = ::read(fd, buf, std::min(sizeof(buf), size - out.size()));
      if (n > 0) {
        out.append(buf, static_cast<size_t>(n));
      } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
        break;
      }
    }
    return out;
  }

  static bool writeAll(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
      const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
      if (n < 0) {
        if (errno == EAGAIN || errno == EINTR) {
          waitFor(1);
          continue;
        }
        return false;
      }
      written += static_cast<size_t>(n);
    }
    return true;
  }
};

/**
 * @brief Unique directory under the system temp directory, removed on destruction
 */
class TempDir {
 public:
  TempDir() {
    static std::atomic<unsigned> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("serlink_tests_" + std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1)));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::string file(const std::string& name) const { return (path_ / name).string(); }

 private:
  std::filesystem::path path_;
};

/**
 * @brief Anonymous pipe; both ends close on destruction
 */
class Pipe {
 public:
  Pipe() {
    if (::pipe2(fds_, O_CLOEXEC | O_NONBLOCK) != 0) {
      throw std::runtime_error("pipe2 failed");
    }
  }
  ~Pipe() {
    close_read();
    close_write();
  }

  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;

  int read_fd() const { return fds_[0]; }
  int write_fd() const { return fds_[1]; }

  void close_read() {
    if (fds_[0] >= 0) ::close(fds_[0]);
    fds_[0] = -1;
  }
  void close_write() {
    if (fds_[1] >= 0) ::close(fds_[1]);
    fds_[1] = -1;
  }

 private:
  int fds_[2] = {-1, -1};
};

/**
 * @brief Connected loopback TCP pair wrapped as relay endpoints
 */
struct LoopbackPair {
  std::unique_ptr<transport::TcpStream> left;
  std::unique_ptr<transport::TcpStream> right;

  static LoopbackPair make(boost::asio::io_context& ioc) {
    using boost::asio::ip::tcp;
    tcp::acceptor acceptor(ioc, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    tcp::socket client(ioc);
    client.connect(acceptor.local_endpoint());
    tcp::socket server = acceptor.accept();

    LoopbackPair pair;
    pair.left = std::make_unique<transport::TcpStream>(std::move(client));
    pair.right = std::make_unique<transport::TcpStream>(std::move(server));
    return pair;
  }
};

/**
 * @brief Blocking TCP peer used to drive the tools from the outside
 */
class TcpPeer {
 public:
  TcpPeer() : socket_(ioc_) {}

  bool connect(uint16_t port, int timeout_ms = 3000) {
    using boost::asio::ip::tcp;
    const tcp::endpoint endpoint(boost::asio::ip::address_v4::loopback(), port);
    return TestUtils::waitForCondition(
        [&] {
          boost::system::error_code ec;
          if (socket_.is_open()) socket_.close(ec);
          socket_.connect(endpoint, ec);
          return !ec;
        },
        timeout_ms);
  }

  bool send(const std::string& data) {
    boost::system::error_code ec;
    boost::asio::write(socket_, boost::asio::buffer(data), ec);
    return !ec;
  }

  std::string receive(size_t size, int timeout_ms = 3000) {
    return TestUtils::readExactly(socket_.native_handle(), size, timeout_ms);
  }

  /**
   * @brief True once the peer closed the connection
   */
  bool wait_closed(int timeout_ms = 3000) {
    const int fd = socket_.native_handle();
    return TestUtils::waitForCondition(
        [fd] {
          pollfd pfd{fd, POLLIN, 0};
          if (::poll(&pfd, 1, 0) <= 0) return false;
          char c;
          const ssize_t n = ::recv(fd, &c, 1, MSG_PEEK | MSG_DONTWAIT);
          return n == 0 || (n < 0 && errno != EAGAIN);
        },
        timeout_ms);
  }

  void close() {
    boost::system::error_code ec;
    socket_.close(ec);
  }

 private:
  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::socket socket_;
};

/**
 * @brief Base test class with common setup/teardown
 */
class BaseTest : public ::testing::Test {
 protected:
  void SetUp() override { test_start_time_ = std::chrono::steady_clock::now(); }

  void TearDown() override {
    auto test_duration = std::chrono::steady_clock::now() - test_start_time_;
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(test_duration).count();

    // Log test duration if it's unusually long
    if (duration_ms > 5000) {
      std::cout << "Warning: Test took " << duration_ms << "ms to complete" << std::endl;
    }
  }

  std::chrono::steady_clock::time_point test_start_time_;
};

/**
 * @brief Test class for network-related tests
 */
class NetworkTest : public BaseTest {
 protected:
  void SetUp() override {
    BaseTest::SetUp();
    test_port_ = TestUtils::getAvailableTestPort();
  }

  uint16_t test_port_ = 0;
};

}  // namespace test
}  // namespace serlink
