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

#include "serlink/echo/echo_device.hpp"

#include <utility>

#include "serlink/diagnostics/error_handler.hpp"
#include "serlink/diagnostics/logger.hpp"
#include "serlink/relay/byte_relay.hpp"

namespace serlink {
namespace echo {

EchoDevice::EchoDevice(const config::EchoConfig& cfg, std::shared_ptr<concurrency::ShutdownToken> token)
    : cfg_(cfg), token_(std::move(token)) {}

EchoDevice::~EchoDevice() { teardown(); }

void EchoDevice::start() {
  if (device_) {
    return;
  }
  transport::VirtualDeviceOptions options;
  options.link_path = cfg_.device_path;
  options.allowed_root = cfg_.allowed_root;
  options.permissions = cfg_.permissions;
  options.baud_rate = cfg_.baud_rate;
  device_ = transport::VirtualDevice::create(ioc_, options);

  SERLINK_LOG_INFO("echo", "start", "Echo device ready at " + device_->path());
}

ErrorCode EchoDevice::wait() {
  if (!device_) {
    return ErrorCode::Stopped;
  }

  relay::RelayOptions options;
  options.max_chunk = cfg_.read_chunk;
  options.poll_interval = cfg_.poll_interval();

  transport::WaitContext ctx;
  ctx.token = token_.get();
  ctx.poll_interval = cfg_.poll_interval();

  // Reading and writing the same master: every chunk goes straight back
  const auto result = relay::pump(*device_, *device_, options, ctx);
  bytes_.fetch_add(result.bytes);

  ErrorCode code = ErrorCode::Stopped;
  if (result.outcome != relay::RelayOutcome::Shutdown) {
    const std::string reason = std::string(relay::to_cstr(result.outcome)) +
                               (result.error ? ": " + result.error.message() : std::string());
    SERLINK_LOG_CRITICAL("echo", "relay", "Echo device " + device_->path() + " failed: " + reason);
    diagnostics::error_reporting::report_device_error("echo", "relay", reason, ErrorCode::DeviceFailure,
                                                      result.error);
    code = ErrorCode::DeviceFailure;
  }

  SERLINK_LOG_INFO("echo", "stop", "Echoed " + std::to_string(bytes_.load()) + " bytes");
  teardown();
  return code;
}

ErrorCode EchoDevice::run() {
  start();
  return wait();
}

void EchoDevice::stop() { token_->request_stop(); }

std::string EchoDevice::device_path() const { return device_ ? device_->path() : std::string(); }

void EchoDevice::teardown() {
  if (!device_) {
    return;
  }
  device_->close();
  device_.reset();
}

}  // namespace echo
}  // namespace serlink
