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

#include "serlink/server/serial_bridge.hpp"

#include <boost/asio/error.hpp>
#include <chrono>
#include <string>
#include <vector>

#include "serlink/diagnostics/error_handler.hpp"
#include "serlink/diagnostics/exceptions.hpp"
#include "serlink/diagnostics/logger.hpp"
#include "serlink/transport/serial/serial_port.hpp"
#include "serlink/transport/tcp/tcp_stream.hpp"

namespace serlink {
namespace server {

using base::BridgeState;

namespace {
bool is_transient(const boost::system::error_code& ec) {
  return ec == net::error::would_block || ec == net::error::try_again || ec == net::error::interrupted;
}
}  // namespace

SerialBridge::SerialBridge(const config::BridgeConfig& cfg, std::shared_ptr<concurrency::ShutdownToken> token)
    : SerialBridge(cfg, std::move(token), nullptr) {}

SerialBridge::SerialBridge(const config::BridgeConfig& cfg, std::shared_ptr<concurrency::ShutdownToken> token,
                           std::unique_ptr<interface::StreamEndpoint> serial)
    : cfg_(cfg),
      token_(std::move(token)),
      serial_(std::move(serial)),
      listener_(ioc_),
      registry_(cfg.max_clients) {
  relay_options_.max_chunk = cfg_.read_chunk;
  relay_options_.poll_interval = cfg_.poll_interval();
}

SerialBridge::~SerialBridge() {
  const auto current = state_.get();
  if (current == BridgeState::Listening || current == BridgeState::ShuttingDown) {
    token_->request_stop();
    shutdown();
  }
}

void SerialBridge::start() {
  if (!state_.is_state(BridgeState::Starting)) {
    return;
  }

  try {
    if (!serial_) {
      auto port = std::make_unique<transport::SerialPort>(ioc_, cfg_.serial);
      port->open();
      serial_ = std::move(port);
    }
    listener_.open(cfg_.bind_address, cfg_.port, cfg_.listen_backlog);
  } catch (const diagnostics::ConnectionException&) {
    if (serial_) {
      boost::system::error_code ec;
      serial_->close(ec);
    }
    state_.set(BridgeState::Stopped);
    throw;
  }

  stop_callback_ = token_->add_stop_callback([this] { registry_.shutdown_all(); });
  stop_callback_registered_ = true;

  state_.set(BridgeState::Listening);
  SERLINK_LOG_INFO("bridge", "start",
                   "Bridging " + serial_->name() + " to TCP port " + std::to_string(local_port()) + " (max " +
                       std::to_string(cfg_.max_clients) + " clients)");

  accept_thread_ = std::thread(&SerialBridge::accept_loop, this);
  serial_thread_ = std::thread(&SerialBridge::serial_loop, this);
}

ErrorCode SerialBridge::wait() {
  if (state_.is_state(BridgeState::Starting)) {
    return ErrorCode::Stopped;
  }
  while (!token_->wait_for(cfg_.poll_interval())) {
  }
  shutdown();

  const ErrorCode failure = failure_.load();
  return failure == ErrorCode::Success ? ErrorCode::Stopped : failure;
}

ErrorCode SerialBridge::run() {
  start();
  return wait();
}

void SerialBridge::stop() { token_->request_stop(); }

void SerialBridge::accept_loop() {
  transport::WaitContext ctx;
  ctx.token = token_.get();
  ctx.poll_interval = cfg_.poll_interval();

  while (!token_->stop_requested()) {
    reap_workers(false);

    boost::system::error_code ec;
    auto socket = listener_.accept(ctx, cfg_.poll_interval(), ec);
    if (ec) {
      if (token_->stop_requested()) break;
      SERLINK_LOG_ERROR("bridge", "accept", "Accept error: " + ec.message());
      diagnostics::error_reporting::report_connection_error("bridge", "accept", ec, true);
      token_->wait_for(cfg_.poll_interval());
      continue;
    }
    if (!socket) {
      continue;
    }
    on_new_client(std::move(*socket));
  }
}

void SerialBridge::on_new_client(net::ip::tcp::socket socket) {
  auto client =
      std::make_shared<ClientConnection>(next_client_id_++, std::make_unique<transport::TcpStream>(std::move(socket)));

  // Greet before registering so broadcast data never precedes the banner.
  // Only the accept thread adds members, so the capacity seen here cannot shrink.
  if (cfg_.send_welcome_banner && registry_.size() < registry_.max_clients()) {
    const std::string device = cfg_.serial.device.empty() ? serial_->name() : cfg_.serial.device;
    const std::string banner = "Connected to " + device + " at " + std::to_string(cfg_.serial.baud_rate) + " baud\r\n";

    transport::WaitContext ctx;
    ctx.token = token_.get();
    ctx.poll_interval = cfg_.poll_interval();
    const auto ec = client->send(reinterpret_cast<const uint8_t*>(banner.data()), banner.size(), ctx,
                                 cfg_.client_write_timeout());
    if (ec) {
      SERLINK_LOG_WARNING("bridge", "banner", "Failed to greet " + client->remote_address() + ": " + ec.message());
      client->close();
      return;
    }
  }

  if (registry_.accept(client) != AcceptResult::Accepted) {
    return;
  }

  auto done = std::make_shared<std::atomic<bool>>(false);
  std::lock_guard<std::mutex> lock(workers_mutex_);
  workers_.push_back(Worker{client->id(), std::thread(&SerialBridge::client_loop, this, client, done), done});
}

void SerialBridge::client_loop(std::shared_ptr<ClientConnection> client, std::shared_ptr<std::atomic<bool>> done) {
  transport::WaitContext ctx;
  ctx.token = token_.get();
  ctx.poll_interval = cfg_.poll_interval();

  const auto result = relay::pump(
      client->stream(), [this](const uint8_t* data, size_t size) { return write_serial(data, size); },
      serial_->name(), relay_options_, ctx);

  switch (result.outcome) {
    case relay::RelayOutcome::EndOfStream:
      if (!client->is_shut_down()) {
        SERLINK_LOG_INFO("bridge", "client", "Client disconnected: " + client->remote_address());
      }
      break;
    case relay::RelayOutcome::SourceError:
      if (!client->is_shut_down()) {
        SERLINK_LOG_WARNING("bridge", "client",
                            "Dropping client " + client->remote_address() + " after read error: " +
                                result.error.message());
        diagnostics::error_reporting::report_communication_error(
            "bridge", "read", "read from " + client->remote_address() + " failed", result.error,
            ErrorCode::SourceError);
      }
      break;
    case relay::RelayOutcome::SinkError:
      fail(ErrorCode::DeviceFailure, "write", "Serial write failed", result.error);
      break;
    case relay::RelayOutcome::Shutdown:
      break;
  }

  registry_.remove(client->id());
  done->store(true);
}

boost::system::error_code SerialBridge::write_serial(const uint8_t* data, size_t size) {
  transport::WaitContext ctx;
  ctx.token = token_.get();
  ctx.poll_interval = cfg_.poll_interval();

  // One client's chunk is never interleaved with another's
  std::lock_guard<std::mutex> lock(serial_write_mutex_);

  // A slow line only applies backpressure; a stop request still interrupts the wait
  const auto started = std::chrono::steady_clock::now();
  const auto ec = transport::write_all(*serial_, data, size, ctx, std::chrono::milliseconds(0));
  const auto stalled =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  if (!ec && stalled.count() > static_cast<int64_t>(cfg_.serial.timeout_ms)) {
    SERLINK_LOG_WARNING("bridge", "write",
                        "Serial line " + serial_->name() + " took " + std::to_string(stalled.count()) +
                            " ms to accept " + std::to_string(size) + " bytes");
  }
  return ec;
}

void SerialBridge::serial_loop() {
  transport::WaitContext ctx;
  ctx.token = token_.get();
  ctx.poll_interval = cfg_.poll_interval();
  std::vector<uint8_t> buffer(cfg_.read_chunk);
  const std::string source_name = serial_->name();

  while (!token_->stop_requested()) {
    // Serial data is only drained while someone is listening
    if (registry_.empty()) {
      token_->wait_for(cfg_.poll_interval());
      continue;
    }

    boost::system::error_code ec;
    const auto ready = transport::wait_readable(serial_->native_handle(), ctx, cfg_.poll_interval(), ec);
    if (ready == transport::WaitResult::Interrupted) {
      break;
    }
    if (ready == transport::WaitResult::Timeout) {
      continue;
    }
    if (ready == transport::WaitResult::Error) {
      fail(ErrorCode::DeviceFailure, "read", "Serial poll failed", ec);
      break;
    }

    const size_t n = serial_->read_some(net::buffer(buffer), ec);
    if (is_transient(ec)) {
      continue;
    }
    if (ec) {
      fail(ErrorCode::DeviceFailure, "read", "Serial read failed", ec);
      break;
    }
    if (n == 0) {
      continue;
    }

    SERLINK_LOG_DEBUG("bridge", "transfer",
                      source_name + " -> clients: " +
                          diagnostics::preview_bytes(buffer.data(), n, base::constants::TRAFFIC_PREVIEW_BYTES));
    registry_.broadcast(buffer.data(), n, ctx, cfg_.client_write_timeout());
  }
}

void SerialBridge::reap_workers(bool all) {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (all || it->done->load()) {
      if (it->thread.joinable()) {
        it->thread.join();
      }
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

void SerialBridge::fail(ErrorCode code, const std::string& operation, const std::string& message,
                        const boost::system::error_code& ec) {
  ErrorCode expected = ErrorCode::Success;
  if (failure_.compare_exchange_strong(expected, code)) {
    const std::string text = message + " on " + serial_->name() + ": " + ec.message();
    SERLINK_LOG_CRITICAL("bridge", operation, text);
    diagnostics::error_reporting::report_device_error("bridge", operation, text, code, ec);
  }
  token_->request_stop();
}

void SerialBridge::shutdown() {
  std::lock_guard<std::mutex> lock(shutdown_mutex_);
  if (state_.is_state(BridgeState::Stopped) || state_.is_state(BridgeState::Starting)) {
    return;
  }
  state_.set(BridgeState::ShuttingDown);
  SERLINK_LOG_INFO("bridge", "stop", "Shutting down bridge");

  if (accept_thread_.joinable()) accept_thread_.join();
  listener_.close();

  registry_.shutdown_all();
  if (serial_thread_.joinable()) serial_thread_.join();
  reap_workers(true);
  registry_.clear();

  if (stop_callback_registered_) {
    token_->remove_stop_callback(stop_callback_);
    stop_callback_registered_ = false;
  }

  boost::system::error_code ec;
  serial_->close(ec);
  if (ec) {
    SERLINK_LOG_WARNING("bridge", "stop", "Error closing " + serial_->name() + ": " + ec.message());
  }

  state_.set(BridgeState::Stopped);
  SERLINK_LOG_INFO("bridge", "stop", "Bridge stopped");
}

}  // namespace server
}  // namespace serlink
