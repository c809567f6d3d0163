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
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

#include "serlink/base/common.hpp"
#include "serlink/base/error_codes.hpp"
#include "serlink/concurrency/atomic_state.hpp"
#include "serlink/concurrency/shutdown_token.hpp"
#include "serlink/config/bridge_config.hpp"
#include "serlink/interface/stream_endpoint.hpp"
#include "serlink/relay/byte_relay.hpp"
#include "serlink/server/client_registry.hpp"
#include "serlink/transport/tcp/tcp_listener.hpp"

namespace serlink {
namespace server {

namespace net = boost::asio;

/**
 * @brief Serial-to-network bridge (server mode)
 *
 * Threads: one accepts connections, one drains the serial line into a
 * broadcast to every client, and one worker per client copies that client's
 * bytes to the serial line. Client data goes to the serial line only, never
 * to other clients. A serial read or write failure is fatal for the bridge;
 * a client failure only drops that client.
 */
class SerialBridge {
 public:
  SerialBridge(const config::BridgeConfig& cfg, std::shared_ptr<concurrency::ShutdownToken> token);

  /**
   * @brief Use an already open endpoint instead of opening cfg.serial
   */
  SerialBridge(const config::BridgeConfig& cfg, std::shared_ptr<concurrency::ShutdownToken> token,
               std::unique_ptr<interface::StreamEndpoint> serial);

  ~SerialBridge();

  SerialBridge(const SerialBridge&) = delete;
  SerialBridge& operator=(const SerialBridge&) = delete;

  /**
   * @brief Starting -> Listening: open the serial line, bind, spawn threads
   * @throws diagnostics::ConnectionException (DeviceOpenFailed, PortInUse, BindFailed); state becomes Stopped
   */
  void start();

  /**
   * @brief Block until a stop request, then shut down; state becomes Stopped
   * @return Stopped after a requested stop, DeviceFailure after a fatal serial error
   */
  ErrorCode wait();

  /**
   * @brief start() followed by wait()
   */
  ErrorCode run();

  /**
   * @brief Request shutdown through the token
   */
  void stop();

  base::BridgeState state() const noexcept { return state_.get(); }
  uint16_t local_port() const { return listener_.local_port(); }
  size_t client_count() const { return registry_.size(); }
  ClientRegistry& registry() noexcept { return registry_; }

 private:
  struct Worker {
    ClientConnection::Id id;
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void accept_loop();
  void serial_loop();
  void client_loop(std::shared_ptr<ClientConnection> client, std::shared_ptr<std::atomic<bool>> done);
  boost::system::error_code write_serial(const uint8_t* data, size_t size);
  void on_new_client(net::ip::tcp::socket socket);
  void reap_workers(bool all);
  void fail(ErrorCode code, const std::string& operation, const std::string& message,
            const boost::system::error_code& ec);
  void shutdown();

  config::BridgeConfig cfg_;
  std::shared_ptr<concurrency::ShutdownToken> token_;
  net::io_context ioc_;
  std::unique_ptr<interface::StreamEndpoint> serial_;
  transport::TcpListener listener_;
  ClientRegistry registry_;
  relay::RelayOptions relay_options_;

  concurrency::AtomicState<base::BridgeState> state_{base::BridgeState::Starting};
  std::atomic<ErrorCode> failure_{ErrorCode::Success};
  concurrency::ShutdownToken::CallbackId stop_callback_ = 0;
  bool stop_callback_registered_ = false;

  std::mutex serial_write_mutex_;
  std::thread accept_thread_;
  std::thread serial_thread_;
  std::mutex workers_mutex_;
  std::list<Worker> workers_;
  ClientConnection::Id next_client_id_ = 1;
  std::mutex shutdown_mutex_;
};

}  // namespace server
}  // namespace serlink
