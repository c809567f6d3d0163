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

#include "serlink/transport/pty/virtual_device.hpp"

#include <fcntl.h>
#include <limits.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <vector>

#include "serlink/diagnostics/error_handler.hpp"
#include "serlink/diagnostics/exceptions.hpp"
#include "serlink/diagnostics/logger.hpp"
#include "serlink/util/input_validator.hpp"

namespace serlink {
namespace transport {

using diagnostics::DeviceCreationException;
using diagnostics::InvalidPathException;

namespace {

std::string errno_text(int err) { return std::strerror(err); }

std::string parent_directory(const std::string& path) {
  const auto slash = path.find_last_of('/');
  if (slash == 0 || slash == std::string::npos) {
    return "/";
  }
  return path.substr(0, slash);
}

std::string base_name(const std::string& path) {
  const auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool real_path(const std::string& path, std::string& out) {
  char buf[PATH_MAX];
  if (::realpath(path.c_str(), buf) == nullptr) {
    return false;
  }
  out = buf;
  return true;
}

bool read_link(const std::string& path, std::string& target) {
  std::vector<char> buf(PATH_MAX);
  const ssize_t n = ::readlink(path.c_str(), buf.data(), buf.size() - 1);
  if (n < 0) {
    return false;
  }
  target.assign(buf.data(), static_cast<size_t>(n));
  return true;
}

speed_t speed_for(unsigned baud) {
  switch (baud) {
    case 50: return B50;
    case 75: return B75;
    case 110: return B110;
    case 134: return B134;
    case 150: return B150;
    case 200: return B200;
    case 300: return B300;
    case 600: return B600;
    case 1200: return B1200;
    case 1800: return B1800;
    case 2400: return B2400;
    case 4800: return B4800;
    case 9600: return B9600;
    case 19200: return B19200;
    case 38400: return B38400;
    case 57600: return B57600;
    case 115200: return B115200;
    case 230400: return B230400;
    case 460800: return B460800;
    case 500000: return B500000;
    case 576000: return B576000;
    case 921600: return B921600;
    case 1000000: return B1000000;
    case 1152000: return B1152000;
    case 1500000: return B1500000;
    case 2000000: return B2000000;
    case 2500000: return B2500000;
    case 3000000: return B3000000;
    case 3500000: return B3500000;
    case 4000000: return B4000000;
    default: return B0;
  }
}

std::atomic<unsigned> g_publish_counter{0};

}  // namespace

void check_publish_target(const std::string& path, const std::string& allowed_root) {
  util::InputValidator::validate_device_link_path(path, allowed_root);

  const std::string parent = parent_directory(path);
  struct stat st {};
  if (::stat(parent.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
    throw InvalidPathException("parent directory " + parent + " does not exist", path);
  }
  if (::access(parent.c_str(), W_OK) != 0) {
    throw InvalidPathException("parent directory " + parent + " is not writable", path);
  }

  if (!allowed_root.empty()) {
    std::string real_parent;
    std::string real_root;
    if (!real_path(allowed_root, real_root)) {
      throw InvalidPathException("allowed root " + allowed_root + " does not exist", path);
    }
    if (!real_path(parent, real_parent) || !util::InputValidator::is_within_root(real_parent, real_root)) {
      throw InvalidPathException("device path " + path + " resolves outside allowed root " + allowed_root, path);
    }
  }

  struct stat lst {};
  if (::lstat(path.c_str(), &lst) == 0 && !S_ISLNK(lst.st_mode)) {
    throw InvalidPathException("refusing to replace " + path + ": it exists and is not a symlink", path);
  }
}

std::unique_ptr<VirtualDevice> VirtualDevice::create(net::io_context& ioc, const VirtualDeviceOptions& options) {
  util::InputValidator::validate_permissions(options.permissions);
  if (!options.link_path.empty()) {
    check_publish_target(options.link_path, options.allowed_root);
  }

  std::unique_ptr<VirtualDevice> device(new VirtualDevice(ioc, options));
  device->allocate();
  if (!options.link_path.empty()) {
    device->publish();
  }

  VirtualDevice* raw = device.get();
  device->cleanup_handle_ =
      concurrency::CleanupRegistry::instance().add("virtual device " + device->path(), [raw] { raw->close(); });

  SERLINK_LOG_INFO("vdev", "create", "Virtual device ready at " + device->path() + " (pty " + device->slave_path_ + ")");
  return device;
}

VirtualDevice::VirtualDevice(net::io_context& ioc, const VirtualDeviceOptions& options)
    : options_(options), master_(ioc) {}

VirtualDevice::~VirtualDevice() { close(); }

void VirtualDevice::allocate() {
  const int master_fd = ::posix_openpt(O_RDWR | O_NOCTTY);
  if (master_fd < 0) {
    const int err = errno;
    diagnostics::error_reporting::report_device_error("vdev", "openpt", errno_text(err),
                                                      ErrorCode::DeviceCreationFailed);
    throw DeviceCreationException("cannot allocate pseudo-terminal: " + errno_text(err), "openpt", err);
  }
  ::fcntl(master_fd, F_SETFD, FD_CLOEXEC);
  master_.assign(master_fd);

  auto fail = [this](const char* operation, int err) {
    const std::string message = std::string(operation) + " failed: " + errno_text(err);
    diagnostics::error_reporting::report_device_error("vdev", operation, message, ErrorCode::DeviceCreationFailed);
    release_locked();
    throw DeviceCreationException(message, operation, err);
  };

  if (::grantpt(master_fd) != 0) fail("grantpt", errno);
  if (::unlockpt(master_fd) != 0) fail("unlockpt", errno);

  char name[PATH_MAX];
  const int rc = ::ptsname_r(master_fd, name, sizeof(name));
  if (rc != 0) fail("ptsname", rc);
  slave_path_ = name;

  slave_fd_ = ::open(slave_path_.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
  if (slave_fd_ < 0) fail("open_slave", errno);

  termios tio{};
  if (::tcgetattr(slave_fd_, &tio) != 0) fail("tcgetattr", errno);
  ::cfmakeraw(&tio);
  tio.c_cflag |= CLOCAL | CREAD;
  const speed_t speed = speed_for(options_.baud_rate);
  if (speed != B0) {
    ::cfsetispeed(&tio, speed);
    ::cfsetospeed(&tio, speed);
  } else {
    SERLINK_LOG_WARNING("vdev", "configure",
                        "Baud rate " + std::to_string(options_.baud_rate) + " has no termios constant, left unchanged");
  }
  if (::tcsetattr(slave_fd_, TCSANOW, &tio) != 0) fail("tcsetattr", errno);

  if (::fchmod(slave_fd_, options_.permissions) != 0) {
    const int err = errno;
    SERLINK_LOG_WARNING("vdev", "chmod", "Cannot set permissions on " + slave_path_ + ": " + errno_text(err));
  }

  boost::system::error_code ec;
  master_.non_blocking(true, ec);
  if (ec) fail("set_non_blocking", ec.value());
}

void VirtualDevice::publish() {
  const std::string& target = options_.link_path;
  const std::string tmp = parent_directory(target) + "/." + base_name(target) + ".tmp." +
                          std::to_string(::getpid()) + "." + std::to_string(g_publish_counter.fetch_add(1));

  ::unlink(tmp.c_str());
  if (::symlink(slave_path_.c_str(), tmp.c_str()) != 0) {
    const int err = errno;
    release_locked();
    throw DeviceCreationException("cannot create temporary link " + tmp + ": " + errno_text(err), "publish", err);
  }

  // Re-check right before the swap so a file created meanwhile is not clobbered
  struct stat lst {};
  if (::lstat(target.c_str(), &lst) == 0 && !S_ISLNK(lst.st_mode)) {
    ::unlink(tmp.c_str());
    release_locked();
    throw InvalidPathException("refusing to replace " + target + ": it exists and is not a symlink", target);
  }

  if (::rename(tmp.c_str(), target.c_str()) != 0) {
    const int err = errno;
    ::unlink(tmp.c_str());
    release_locked();
    throw DeviceCreationException("cannot publish " + target + ": " + errno_text(err), "publish", err);
  }
  published_ = true;
}

bool VirtualDevice::is_valid() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_.load() || !master_.is_open()) {
    return false;
  }
  return ::fcntl(const_cast<net::posix::stream_descriptor&>(master_).native_handle(), F_GETFD) != -1;
}

void VirtualDevice::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_.exchange(true)) {
    return;
  }
  if (cleanup_handle_ != 0) {
    concurrency::CleanupRegistry::instance().remove(cleanup_handle_);
    cleanup_handle_ = 0;
  }

  if (published_) {
    std::string target;
    if (read_link(options_.link_path, target) && target == slave_path_) {
      if (::unlink(options_.link_path.c_str()) != 0) {
        SERLINK_LOG_WARNING("vdev", "close", "Cannot remove " + options_.link_path + ": " + errno_text(errno));
      }
    } else {
      SERLINK_LOG_WARNING("vdev", "close", options_.link_path + " no longer points at " + slave_path_ + ", left alone");
    }
    published_ = false;
  }

  release_locked();
  SERLINK_LOG_INFO("vdev", "close", "Virtual device " + path() + " closed");
}

void VirtualDevice::release_locked() {
  if (master_.is_open()) {
    boost::system::error_code ec;
    master_.close(ec);
  }
  if (slave_fd_ >= 0) {
    ::close(slave_fd_);
    slave_fd_ = -1;
  }
}

int VirtualDevice::native_handle() { return master_.is_open() ? master_.native_handle() : -1; }

std::size_t VirtualDevice::read_some(const net::mutable_buffer& buffer, boost::system::error_code& ec) {
  return master_.read_some(buffer, ec);
}

std::size_t VirtualDevice::write_some(const net::const_buffer& buffer, boost::system::error_code& ec) {
  return master_.write_some(buffer, ec);
}

bool VirtualDevice::is_open() const { return !closed_.load() && master_.is_open(); }

void VirtualDevice::close(boost::system::error_code& ec) {
  ec.clear();
  close();
}

std::string VirtualDevice::name() const { return "vdev:" + path(); }

}  // namespace transport
}  // namespace serlink
