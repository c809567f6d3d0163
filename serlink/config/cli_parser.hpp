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

#include <string>
#include <vector>

#include "serlink/config/bridge_config.hpp"
#include "serlink/config/client_config.hpp"
#include "serlink/config/echo_config.hpp"

namespace serlink {
namespace config {

enum class CliAction { Run, ShowHelp };

template <typename Config>
struct CliResult {
  CliAction action = CliAction::Run;
  Config config;
};

/**
 * @brief Command line parsers of the three tools
 *
 * @p args excludes the program name. A --config file is loaded first, the
 * remaining options override its values, and the result is validated.
 * @throws diagnostics::ConfigurationException for usage errors
 * @throws diagnostics::ValidationException for out-of-range values
 * @throws diagnostics::InvalidPathException for unsafe device paths
 */
CliResult<BridgeConfig> parse_bridge_args(const std::vector<std::string>& args);
CliResult<ClientConfig> parse_client_args(const std::vector<std::string>& args);
CliResult<EchoConfig> parse_echo_args(const std::vector<std::string>& args);

std::string bridge_usage(const std::string& program);
std::string client_usage(const std::string& program);
std::string echo_usage(const std::string& program);

}  // namespace config
}  // namespace serlink
