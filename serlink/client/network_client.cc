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

#include "serlink/client/network_client.hpp"

#include <boost/asio/error.hpp>
#include <utility>

#include "serlink/diagnostics/error_handler.hpp"
#include "serlink/diagnostics/logger.hpp"

namespace serlink {
namespace client {

using base::ClientState;

NetworkClient::NetworkClient(const config::ClientConfig& cfg, std::shared_ptr<concurrency::ShutdownToken> token)
    : cfg_(cfg), token_(std::move(token)), connector_(ioc_), reconnect_(cfg) {
  relay_options_.max_chunk = cfg_.read_chunk;
  relay_options_.poll_interval = cfg_.poll_interval();
}

NetworkClient::~NetworkClient() { teardown(); }

void NetworkClient::start() {
  if (device_) {
    return;
  }

  transport::VirtualDeviceOptions options;
  options.link_path = cfg_.device_path;
  options.allowed_root = cfg_.allowed_root;
  options.permissions = cfg_.permissions;
  options.baud_rate = cfg_.baud_rate;
  device_ = transport::VirtualDevice::create(ioc_, options);

  stop_callback_ = token_->add_stop_callback([this] {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    if (stream_) {
      stream_->shutdown();
    }
  });
  stop_callback_registered_ = true;

  SERLINK_LOG_INFO("client", "start", "Virtual serial device ready at " + device_->path());
  SERLINK_LOG_INFO("client", "start",
                   "Open it with: screen " + device_->path() + " " + std::to_string(cfg_.baud_rate) +
                       "  or  minicom -D " + device_->path());
}

ErrorCode NetworkClient::wait() {
  if (!device_) {
    return ErrorCode::Stopped;
  }

  ErrorCode result = ErrorCode::Stopped;
  const std::string target = cfg_.host + ":" + std::to_string(cfg_.port);

  while (!token_->stop_requested()) {
    if (!device_->is_valid()) {
      SERLINK_LOG_CRITICAL("client", "relay", "Virtual device " + device_->path() + " is no longer usable");
      diagnostics::error_reporting::report_device_error("client", "relay", "virtual device lost",
                                                        ErrorCode::DeviceFailure);
      result = ErrorCode::DeviceFailure;
      break;
    }

    boost::system::error_code ec;
    if (!connect_once(ec)) {
      if (token_->stop_requested() || ec == net::error::operation_aborted) {
        break;
      }
      if (!back_off(ec, "Connection to " + target + " failed: " + ec.message())) {
        result = ErrorCode::RetriesExhausted;
        break;
      }
      continue;
    }

    const auto outcome = relay::relay(*stream_, *device_, relay_options_, token_.get());
    {
      std::lock_guard<std::mutex> lock(stream_mutex_);
      boost::system::error_code ignored;
      stream_->close(ignored);
      stream_.reset();
    }

    if (outcome.outcome == relay::RelayOutcome::Shutdown) {
      break;
    }
    if (outcome.side == relay::RelaySide::B) {
      SERLINK_LOG_CRITICAL("client", "relay", "Virtual device failed: " + outcome.describe());
      diagnostics::error_reporting::report_device_error("client", "relay", outcome.describe(),
                                                        ErrorCode::DeviceFailure, outcome.error);
      result = ErrorCode::DeviceFailure;
      break;
    }

    set_state(ClientState::Disconnected);
    const std::string reason = outcome.outcome == relay::RelayOutcome::EndOfStream
                                   ? "Connection closed by " + target
                                   : "Connection to " + target + " lost: " + outcome.error.message();
    diagnostics::error_reporting::report_communication_error("client", "relay", reason, outcome.error,
                                                             outcome.code(), true);
    if (!back_off(outcome.error ? outcome.error : net::error::make_error_code(net::error::eof), reason)) {
      result = ErrorCode::RetriesExhausted;
      break;
    }
  }

  teardown();
  return result;
}

ErrorCode NetworkClient::run() {
  start();
  return wait();
}

void NetworkClient::stop() { token_->request_stop(); }

std::string NetworkClient::device_path() const { return device_ ? device_->path() : std::string(); }

bool NetworkClient::connect_once(boost::system::error_code& ec) {
  set_state(ClientState::Connecting);
  attempts_.fetch_add(1);
  SERLINK_LOG_INFO("client", "connect", "Connecting to " + cfg_.host + ":" + std::to_string(cfg_.port));

  transport::WaitContext ctx;
  ctx.token = token_.get();
  ctx.poll_interval = cfg_.poll_interval();
  auto socket = connector_.connect(cfg_.host, cfg_.port, cfg_.connect_timeout(), ctx, ec);
  if (!socket) {
    set_state(ClientState::Disconnected);
    return false;
  }

  if (cfg_.keepalive) {
    transport::KeepaliveOptions keepalive;
    keepalive.idle_s = cfg_.keepalive_idle_s;
    keepalive.interval_s = cfg_.keepalive_interval_s;
    keepalive.count = cfg_.keepalive_count;
    boost::system::error_code keepalive_ec;
    transport::apply_keepalive(*socket, keepalive, keepalive_ec);
    if (keepalive_ec) {
      SERLINK_LOG_WARNING("client", "connect", "Could not enable TCP keepalive: " + keepalive_ec.message());
    }
  }

  {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    stream_ = std::make_unique<transport::TcpStream>(std::move(*socket));
  }
  // A stop request between connect and registration of the stream must not be lost
  if (token_->stop_requested()) {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    stream_->shutdown();
  }

  reconnect_.on_success();
  set_state(ClientState::Connected);
  SERLINK_LOG_INFO("client", "connect", "Connected to " + stream_->remote_address() + ", relaying to " +
                                            device_->path());
  return true;
}

bool NetworkClient::back_off(const boost::system::error_code& ec, const std::string& reason) {
  diagnostics::ErrorInfo info(diagnostics::ErrorLevel::ERROR, diagnostics::ErrorCategory::CONNECTION, "client",
                              "connect", reason, ec, true, ErrorCode::ConnectionRefused);
  const auto decision = reconnect_.on_failure(info);
  if (!decision.should_retry) {
    SERLINK_LOG_ERROR("client", "reconnect",
                      reason + "; giving up after " + std::to_string(reconnect_.failures()) + " failed attempts");
    diagnostics::error_reporting::report_connection_error("client", "reconnect", ec, false,
                                                          ErrorCode::RetriesExhausted);
    return false;
  }

  const auto delay = decision.delay.value_or(reconnect_.next_delay());
  SERLINK_LOG_WARNING("client", "reconnect",
                      reason + "; retrying in " + std::to_string(delay.count()) + " ms (failure " +
                          std::to_string(reconnect_.failures()) + ")");
  diagnostics::error_reporting::report_connection_error("client", "connect", ec, true, ErrorCode::ConnectionRefused);
  if (retry_callback_) {
    retry_callback_(reconnect_.failures(), delay);
  }
  token_->wait_for(delay);
  return true;
}

void NetworkClient::set_state(ClientState next) {
  const ClientState previous = state_.exchange(next);
  if (previous == next) {
    return;
  }
  SERLINK_LOG_DEBUG("client", "state", std::string(base::to_cstr(previous)) + " -> " + base::to_cstr(next));
  if (state_callback_) {
    state_callback_(next);
  }
}

void NetworkClient::teardown() {
  if (!device_) {
    return;
  }
  set_state(ClientState::ShuttingDown);

  if (stop_callback_registered_) {
    token_->remove_stop_callback(stop_callback_);
    stop_callback_registered_ = false;
  }
  {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    if (stream_) {
      boost::system::error_code ignored;
      stream_->close(ignored);
      stream_.reset();
    }
  }

  const std::string path = device_->path();
  device_->close();
  device_.reset();
  SERLINK_LOG_INFO("client", "stop", "Virtual device " + path + " removed");
  set_state(ClientState::Disconnected);
}

}  // namespace client
}  // namespace serlink
