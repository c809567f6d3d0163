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

#include <fcntl.h>
#include <gtest/gtest.h>
#include <stdlib.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

namespace serlink {
namespace test {

/**
 * @brief Pseudo-terminal pair standing in for a physical serial line
 *
 * The slave path is what the code under test opens as its serial device;
 * the test plays the remote device through master_fd().
 */
class PtyHelper {
 public:
  PtyHelper() = default;

  void init() {
    master_fd_ = posix_openpt(O_RDWR | O_NOCTTY | O_CLOEXEC);
    ASSERT_NE(master_fd_, -1) << "Failed to open pseudo-terminal master: " << strerror(errno);
    ASSERT_EQ(grantpt(master_fd_), 0) << "grantpt failed: " << strerror(errno);
    ASSERT_EQ(unlockpt(master_fd_), 0) << "unlockpt failed: " << strerror(errno);

    char name[128];
    ASSERT_EQ(ptsname_r(master_fd_, name, sizeof(name)), 0) << "ptsname_r failed: " << strerror(errno);
    slave_name_ = name;

    // Raw line discipline so test payloads pass unmodified until the code under test configures the port
    int slave = ::open(slave_name_.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
    ASSERT_NE(slave, -1) << "open slave failed: " << strerror(errno);
    termios tio{};
    ASSERT_EQ(tcgetattr(slave, &tio), 0);
    cfmakeraw(&tio);
    ASSERT_EQ(tcsetattr(slave, TCSANOW, &tio), 0);
    ::close(slave);
  }

  ~PtyHelper() { close_master(); }

  PtyHelper(const PtyHelper&) = delete;
  PtyHelper& operator=(const PtyHelper&) = delete;

  int master_fd() const { return master_fd_; }
  const std::string& slave_name() const { return slave_name_; }

  /**
   * @brief Hang up the line; readers of the slave see EIO
   */
  void close_master() {
    if (master_fd_ != -1) {
      ::close(master_fd_);
      master_fd_ = -1;
    }
  }

 private:
  int master_fd_ = -1;
  std::string slave_name_;
};

}  // namespace test
}  // namespace serlink
