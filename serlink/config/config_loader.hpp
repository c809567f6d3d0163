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

#include "serlink/config/bridge_config.hpp"
#include "serlink/config/client_config.hpp"
#include "serlink/config/echo_config.hpp"

namespace serlink {
namespace config {

/**
 * @brief True when the library was built with SERLINK_ENABLE_YAML_CONFIG
 */
bool yaml_config_supported() noexcept;

/**
 * @brief Overlay the keys present in a YAML file onto @p config
 *
 * Keys absent from the file keep their current value. Unknown keys are
 * logged and ignored. Validation is left to the caller.
 * @throws diagnostics::ConfigurationException on unreadable files, syntax
 *         errors, type mismatches or when YAML support is disabled
 */
void load_bridge_config(const std::string& path, BridgeConfig& config);
void load_client_config(const std::string& path, ClientConfig& config);
void load_echo_config(const std::string& path, EchoConfig& config);

/**
 * @brief Parses an octal permission string such as "0660" or "660"
 * @throws diagnostics::ValidationException
 */
mode_t parse_permissions(const std::string& text);

}  // namespace config
}  // namespace serlink
