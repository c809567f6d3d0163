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

// Configuration
#include "serlink/config/bridge_config.hpp"
#include "serlink/config/cli_parser.hpp"
#include "serlink/config/client_config.hpp"
#include "serlink/config/config_loader.hpp"
#include "serlink/config/echo_config.hpp"

// Error handling and logging
#include "serlink/base/error_codes.hpp"
#include "serlink/diagnostics/error_handler.hpp"
#include "serlink/diagnostics/exceptions.hpp"
#include "serlink/diagnostics/logger.hpp"

// Lifecycle
#include "serlink/concurrency/cleanup_registry.hpp"
#include "serlink/concurrency/shutdown_token.hpp"
#include "serlink/concurrency/signal_watcher.hpp"

// Engine
#include "serlink/relay/byte_relay.hpp"
#include "serlink/transport/pty/virtual_device.hpp"

// Operating modes
#include "serlink/client/network_client.hpp"
#include "serlink/echo/echo_device.hpp"
#include "serlink/server/serial_bridge.hpp"
