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

#include "serlink/relay/byte_relay.hpp"

#include <atomic>
#include <boost/asio/error.hpp>
#include <mutex>
#include <thread>
#include <vector>

#include "serlink/diagnostics/logger.hpp"

namespace serlink {
namespace relay {

namespace net = boost::asio;

const char* to_cstr(RelayOutcome outcome) {
  switch (outcome) {
    case RelayOutcome::Shutdown:
      return "Shutdown";
    case RelayOutcome::EndOfStream:
      return "EndOfStream";
    case RelayOutcome::SourceError:
      return "SourceError";
    case RelayOutcome::SinkError:
      return "SinkError";
  }
  return "?";
}

const char* to_cstr(RelaySide side) {
  switch (side) {
    case RelaySide::None:
      return "none";
    case RelaySide::A:
      return "A";
    case RelaySide::B:
      return "B";
  }
  return "?";
}

ErrorCode RelayResult::code() const noexcept {
  switch (outcome) {
    case RelayOutcome::Shutdown:
      return ErrorCode::Stopped;
    case RelayOutcome::EndOfStream:
      return ErrorCode::Success;
    case RelayOutcome::SourceError:
      return ErrorCode::SourceError;
    case RelayOutcome::SinkError:
      return ErrorCode::SinkError;
  }
  return ErrorCode::Success;
}

std::string RelayResult::describe() const {
  std::string text = to_cstr(outcome);
  if (side != RelaySide::None) {
    text += " on side ";
    text += to_cstr(side);
  }
  if (error) {
    text += " (" + error.message() + ")";
  }
  return text;
}

namespace {

bool is_transient(const boost::system::error_code& ec) {
  return ec == net::error::would_block || ec == net::error::try_again || ec == net::error::interrupted;
}

}  // namespace

PumpResult pump(interface::StreamEndpoint& source, const ChunkSink& deliver, const std::string& sink_name,
                const RelayOptions& options, const transport::WaitContext& ctx) {
  PumpResult result;
  std::vector<uint8_t> buffer(options.max_chunk == 0 ? 1 : options.max_chunk);
  const std::string source_name = source.name();

  while (true) {
    boost::system::error_code ec;
    const auto ready = transport::wait_readable(source.native_handle(), ctx, options.poll_interval, ec);
    if (ready == transport::WaitResult::Interrupted) {
      result.outcome = RelayOutcome::Shutdown;
      return result;
    }
    if (ready == transport::WaitResult::Timeout) {
      continue;
    }
    if (ready == transport::WaitResult::Error) {
      result.outcome = RelayOutcome::SourceError;
      result.error = ec;
      return result;
    }

    const size_t n = source.read_some(net::buffer(buffer), ec);
    if (is_transient(ec)) {
      continue;
    }
    if (ec == net::error::eof) {
      result.outcome = RelayOutcome::EndOfStream;
      return result;
    }
    if (ec) {
      result.outcome = RelayOutcome::SourceError;
      result.error = ec;
      return result;
    }
    if (n == 0) {
      continue;
    }

    SERLINK_LOG_DEBUG("relay", "transfer",
                      source_name + " -> " + sink_name + ": " +
                          diagnostics::preview_bytes(buffer.data(), n, base::constants::TRAFFIC_PREVIEW_BYTES));

    ec = deliver(buffer.data(), n);
    if (ec == net::error::operation_aborted) {
      result.outcome = RelayOutcome::Shutdown;
      return result;
    }
    if (ec) {
      result.outcome = RelayOutcome::SinkError;
      result.error = ec;
      return result;
    }
    result.bytes += n;
  }
}

PumpResult pump(interface::StreamEndpoint& source, interface::StreamEndpoint& sink, const RelayOptions& options,
                const transport::WaitContext& ctx) {
  return pump(
      source,
      [&](const uint8_t* data, size_t size) { return transport::write_all(sink, data, size, ctx, options.write_timeout); },
      sink.name(), options, ctx);
}

RelayResult relay(interface::StreamEndpoint& a, interface::StreamEndpoint& b, const RelayOptions& options,
                  const concurrency::ShutdownToken* token) {
  std::atomic<bool> halt{false};
  transport::WaitContext ctx;
  ctx.token = token;
  ctx.halt = &halt;
  ctx.poll_interval = options.poll_interval;

  std::mutex first_mutex;
  bool have_first = false;
  RelayResult result;

  // Direction a_to_b: source A, sink B
  auto finish = [&](const PumpResult& pumped, bool a_to_b) {
    std::lock_guard<std::mutex> lock(first_mutex);
    if (a_to_b) {
      result.bytes_a_to_b = pumped.bytes;
    } else {
      result.bytes_b_to_a = pumped.bytes;
    }
    if (have_first) {
      return;
    }
    have_first = true;
    halt.store(true, std::memory_order_release);

    result.outcome = pumped.outcome;
    result.error = pumped.error;
    const RelaySide source_side = a_to_b ? RelaySide::A : RelaySide::B;
    const RelaySide sink_side = a_to_b ? RelaySide::B : RelaySide::A;
    switch (pumped.outcome) {
      case RelayOutcome::Shutdown:
        result.side = RelaySide::None;
        break;
      case RelayOutcome::EndOfStream:
      case RelayOutcome::SourceError:
        result.side = source_side;
        break;
      case RelayOutcome::SinkError:
        result.side = sink_side;
        break;
    }
  };

  std::thread reverse([&] { finish(pump(b, a, options, ctx), false); });
  finish(pump(a, b, options, ctx), true);
  reverse.join();

  if (result.outcome != RelayOutcome::Shutdown) {
    SERLINK_LOG_DEBUG("relay", "stop", a.name() + " <-> " + b.name() + ": " + result.describe());
  }
  return result;
}

}  // namespace relay
}  // namespace serlink
