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

#include <sys/types.h>

#include <atomic>
#include <boost/asio.hpp>
#include <memory>
#include <mutex>
#include <string>

#include "serlink/base/constants.hpp"
#include "serlink/concurrency/cleanup_registry.hpp"
#include "serlink/interface/stream_endpoint.hpp"

namespace serlink {
namespace transport {

namespace net = boost::asio;

struct VirtualDeviceOptions {
  std::string link_path;     // empty: only the kernel slave path is exposed
  std::string allowed_root;  // empty: no root restriction
  mode_t permissions = base::constants::DEFAULT_DEVICE_PERMISSIONS;
  unsigned baud_rate = base::constants::DEFAULT_BAUD_RATE;
};

/**
 * @brief Pseudo-terminal pair published at a stable path
 *
 * The master side is the relay endpoint; local applications open the slave
 * through link_path(). The owner keeps a slave descriptor open so the master
 * does not report EIO while no application has the device open. The
 * published symlink is replaced atomically (temporary link + rename) and is
 * only removed by close() while it still points at this device's slave.
 * close() is registered with the CleanupRegistry and runs on every exit path.
 */
class VirtualDevice : public interface::StreamEndpoint {
 public:
  /**
   * @throws diagnostics::InvalidPathException if the requested path is unsafe
   *         or occupied by something that is not a symlink
   * @throws diagnostics::DeviceCreationException if the pty cannot be
   *         allocated, configured or published
   */
  static std::unique_ptr<VirtualDevice> create(net::io_context& ioc, const VirtualDeviceOptions& options);

  ~VirtualDevice() override;

  VirtualDevice(const VirtualDevice&) = delete;
  VirtualDevice& operator=(const VirtualDevice&) = delete;

  const std::string& slave_path() const noexcept { return slave_path_; }
  const std::string& link_path() const noexcept { return options_.link_path; }

  /**
   * @brief Path applications should open: the symlink if published, else the slave
   */
  const std::string& path() const noexcept { return options_.link_path.empty() ? slave_path_ : options_.link_path; }
  mode_t permissions() const noexcept { return options_.permissions; }

  /**
   * @brief True while the master descriptor is open and live
   */
  bool is_valid() const;

  /**
   * @brief Remove the owned symlink and release the pty pair. Idempotent.
   */
  void close();

  int native_handle() override;
  std::size_t read_some(const net::mutable_buffer& buffer, boost::system::error_code& ec) override;
  std::size_t write_some(const net::const_buffer& buffer, boost::system::error_code& ec) override;
  bool is_open() const override;
  void close(boost::system::error_code& ec) override;
  std::string name() const override;

 private:
  VirtualDevice(net::io_context& ioc, const VirtualDeviceOptions& options);

  void allocate();
  void publish();
  void release_locked();

  VirtualDeviceOptions options_;
  net::posix::stream_descriptor master_;
  int slave_fd_ = -1;
  std::string slave_path_;
  bool published_ = false;

  mutable std::mutex mutex_;
  std::atomic<bool> closed_{false};
  concurrency::CleanupRegistry::Handle cleanup_handle_ = 0;
};

/**
 * @brief Filesystem checks done before a device is published at @p path
 *
 * Parent must exist, be a writable directory and, when @p allowed_root is
 * set, resolve inside it. An existing entry at @p path must be a symlink.
 * @throws diagnostics::InvalidPathException
 */
void check_publish_target(const std::string& path, const std::string& allowed_root);

}  // namespace transport
}  // namespace serlink
