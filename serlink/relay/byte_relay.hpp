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

#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "serlink/base/constants.hpp"
#include "serlink/base/error_codes.hpp"
#include "serlink/concurrency/shutdown_token.hpp"
#include "serlink/interface/stream_endpoint.hpp"
#include "serlink/transport/stream_io.hpp"

namespace serlink {
namespace relay {

/**
 * @brief Why a relay (or one direction of it) stopped
 */
enum class RelayOutcome {
  Shutdown,     // stop requested, no error
  EndOfStream,  // source closed cleanly
  SourceError,  // reading failed
  SinkError     // writing failed
};

/**
 * @brief Endpoint a terminal condition is attributed to
 */
enum class RelaySide { None, A, B };

const char* to_cstr(RelayOutcome outcome);
const char* to_cstr(RelaySide side);

struct RelayOptions {
  size_t max_chunk = base::constants::DEFAULT_READ_CHUNK;
  std::chrono::milliseconds poll_interval{base::constants::DEFAULT_POLL_INTERVAL_MS};
  std::chrono::milliseconds write_timeout{0};  // zero: wait for the sink as long as it takes
};

/**
 * @brief Result of one copy direction
 */
struct PumpResult {
  RelayOutcome outcome = RelayOutcome::Shutdown;
  boost::system::error_code error;
  uint64_t bytes = 0;
};

/**
 * @brief Result of a duplex relay between endpoints A and B
 */
struct RelayResult {
  RelayOutcome outcome = RelayOutcome::Shutdown;
  RelaySide side = RelaySide::None;  // endpoint that closed or failed
  boost::system::error_code error;
  uint64_t bytes_a_to_b = 0;
  uint64_t bytes_b_to_a = 0;

  bool is_error() const noexcept {
    return outcome == RelayOutcome::SourceError || outcome == RelayOutcome::SinkError;
  }

  /**
   * @brief Stopped, Success (end of stream), SourceError or SinkError
   */
  ErrorCode code() const noexcept;

  std::string describe() const;
};

/**
 * @brief Delivers one chunk; returns the write error, empty on success
 */
using ChunkSink = std::function<boost::system::error_code(const uint8_t* data, size_t size)>;

/**
 * @brief Copy source to sink until end of stream, an error or a stop request
 *
 * Each readable event moves at most max_chunk bytes, and every chunk is
 * written completely before the next read. Cancellation is observed at
 * least once per poll interval.
 */
PumpResult pump(interface::StreamEndpoint& source, interface::StreamEndpoint& sink, const RelayOptions& options,
                const transport::WaitContext& ctx);

/**
 * @brief pump() with a custom delivery step (locking, fan-out)
 */
PumpResult pump(interface::StreamEndpoint& source, const ChunkSink& deliver, const std::string& sink_name,
                const RelayOptions& options, const transport::WaitContext& ctx);

/**
 * @brief Duplex relay: A to B on the calling thread, B to A on a helper thread
 *
 * The first direction to stop ends the relay and halts the other one; its
 * outcome becomes the result. A stop request on @p token yields Shutdown.
 */
RelayResult relay(interface::StreamEndpoint& a, interface::StreamEndpoint& b, const RelayOptions& options,
                  const concurrency::ShutdownToken* token);

}  // namespace relay
}  // namespace serlink
