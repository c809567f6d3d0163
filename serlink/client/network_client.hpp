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

#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "serlink/base/common.hpp"
#include "serlink/base/error_codes.hpp"
#include "serlink/client/reconnect_state.hpp"
#include "serlink/concurrency/atomic_state.hpp"
#include "serlink/concurrency/shutdown_token.hpp"
#include "serlink/config/client_config.hpp"
#include "serlink/relay/byte_relay.hpp"
#include "serlink/transport/pty/virtual_device.hpp"
#include "serlink/transport/tcp/tcp_connector.hpp"
#include "serlink/transport/tcp/tcp_stream.hpp"

namespace serlink {
namespace client {

namespace net = boost::asio;

/**
 * @brief Network-to-virtual-device client (client mode)
 *
 * The virtual device is created first and lives for the whole run, so local
 * applications keep their handle while the network leg reconnects. A
 * network-side relay failure or end of stream goes back to Connecting after
 * a backoff; a device-side failure ends the run.
 */
class NetworkClient {
 public:
  using StateCallback = std::function<void(base::ClientState)>;
  using RetryCallback = std::function<void(uint32_t failures, std::chrono::milliseconds delay)>;

  NetworkClient(const config::ClientConfig& cfg, std::shared_ptr<concurrency::ShutdownToken> token);
  ~NetworkClient();

  NetworkClient(const NetworkClient&) = delete;
  NetworkClient& operator=(const NetworkClient&) = delete;

  /**
   * @brief Create and publish the virtual device
   * @throws diagnostics::InvalidPathException
   * @throws diagnostics::DeviceCreationException
   */
  void start();

  /**
   * @brief Connect, relay and reconnect until stopped
   * @return Stopped, DeviceFailure or RetriesExhausted
   */
  ErrorCode wait();

  ErrorCode run();
  void stop();

  // Callbacks must be set before start()
  void on_state_change(StateCallback callback) { state_callback_ = std::move(callback); }
  void on_retry(RetryCallback callback) { retry_callback_ = std::move(callback); }

  base::ClientState state() const noexcept { return state_.get(); }

  /**
   * @brief Path local applications open; empty before start()
   */
  std::string device_path() const;

  uint32_t connect_attempts() const noexcept { return attempts_.load(); }

 private:
  bool connect_once(boost::system::error_code& ec);
  bool back_off(const boost::system::error_code& ec, const std::string& reason);
  void set_state(base::ClientState next);
  void teardown();

  config::ClientConfig cfg_;
  std::shared_ptr<concurrency::ShutdownToken> token_;
  net::io_context ioc_;
  std::unique_ptr<transport::VirtualDevice> device_;
  transport::TcpConnector connector_;
  ReconnectState reconnect_;
  relay::RelayOptions relay_options_;

  concurrency::AtomicState<base::ClientState> state_{base::ClientState::Disconnected};
  std::atomic<uint32_t> attempts_{0};
  StateCallback state_callback_;
  RetryCallback retry_callback_;

  std::unique_ptr<transport::TcpStream> stream_;
  std::mutex stream_mutex_;
  concurrency::ShutdownToken::CallbackId stop_callback_ = 0;
  bool stop_callback_registered_ = false;
};

}  // namespace client
}  // namespace serlink
