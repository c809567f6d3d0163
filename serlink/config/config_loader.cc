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

#include "serlink/config/config_loader.hpp"

#ifdef SERLINK_ENABLE_YAML_CONFIG
#include <yaml-cpp/yaml.h>
#endif

#include <cstdlib>
#include <set>

#include "serlink/diagnostics/exceptions.hpp"
#include "serlink/diagnostics/logger.hpp"

namespace serlink {
namespace config {

mode_t parse_permissions(const std::string& text) {
  if (text.empty() || text.size() > 5) {
    throw diagnostics::ValidationException("invalid permission mode '" + text + "'", "permissions", "octal, e.g. 0660");
  }
  char* end = nullptr;
  const unsigned long value = std::strtoul(text.c_str(), &end, 8);
  if (end == nullptr || *end != '\0') {
    throw diagnostics::ValidationException("invalid permission mode '" + text + "'", "permissions", "octal, e.g. 0660");
  }
  const auto mode = static_cast<mode_t>(value);
  util::InputValidator::validate_permissions(mode);
  return mode;
}

#ifdef SERLINK_ENABLE_YAML_CONFIG

bool yaml_config_supported() noexcept { return true; }

namespace {

YAML::Node load_root(const std::string& path, const char* section) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::BadFile&) {
    throw diagnostics::ConfigurationException("cannot read config file " + path, section, "load");
  } catch (const YAML::ParserException& e) {
    throw diagnostics::ConfigurationException("syntax error in " + path + ": " + e.what(), section, "load");
  }
  if (root.IsNull()) {
    return YAML::Node(YAML::NodeType::Map);
  }
  if (!root.IsMap()) {
    throw diagnostics::ConfigurationException("config file " + path + " must contain a mapping", section, "load");
  }
  return root;
}

template <typename T>
void assign(const YAML::Node& root, const char* key, T& out) {
  const YAML::Node node = root[key];
  if (!node) return;
  try {
    out = node.as<T>();
  } catch (const YAML::BadConversion&) {
    throw diagnostics::ConfigurationException(std::string("invalid value for '") + key + "'", key, "load");
  }
}

void assign_permissions(const YAML::Node& root, mode_t& out) {
  std::string text;
  assign(root, "permissions", text);
  if (!text.empty()) {
    out = parse_permissions(text);
  }
}

void assign_logging(const YAML::Node& root, LoggingConfig& logging) {
  assign(root, "verbose", logging.verbose);
  assign(root, "log_file", logging.log_file);
}

void warn_unknown_keys(const YAML::Node& root, const std::set<std::string>& known, const std::string& path) {
  for (const auto& entry : root) {
    const std::string key = entry.first.as<std::string>();
    if (known.count(key) == 0) {
      SERLINK_LOG_WARNING("config", "load", "Ignoring unknown key '" + key + "' in " + path);
    }
  }
}

}  // namespace

void load_bridge_config(const std::string& path, BridgeConfig& config) {
  const YAML::Node root = load_root(path, "bridge");

  assign(root, "device", config.serial.device);
  assign(root, "baud_rate", config.serial.baud_rate);
  assign(root, "data_bits", config.serial.data_bits);
  std::string text;
  assign(root, "parity", text);
  if (!text.empty()) config.serial.parity = parse_parity(text);
  text.clear();
  assign(root, "stop_bits", text);
  if (!text.empty()) config.serial.stop_bits = parse_stop_bits(text);
  assign(root, "timeout_ms", config.serial.timeout_ms);

  assign(root, "port", config.port);
  assign(root, "bind_address", config.bind_address);
  assign(root, "max_clients", config.max_clients);
  assign(root, "listen_backlog", config.listen_backlog);
  assign(root, "read_chunk", config.read_chunk);
  assign(root, "poll_interval_ms", config.poll_interval_ms);
  assign(root, "client_write_timeout_ms", config.client_write_timeout_ms);
  assign(root, "welcome_banner", config.send_welcome_banner);
  assign_logging(root, config.logging);

  warn_unknown_keys(root,
                    {"device", "baud_rate", "data_bits", "parity", "stop_bits", "timeout_ms", "port", "bind_address",
                     "max_clients", "listen_backlog", "read_chunk", "poll_interval_ms", "client_write_timeout_ms",
                     "welcome_banner", "verbose", "log_file"},
                    path);
}

void load_client_config(const std::string& path, ClientConfig& config) {
  const YAML::Node root = load_root(path, "client");

  assign(root, "host", config.host);
  assign(root, "port", config.port);
  assign(root, "device", config.device_path);
  assign(root, "allowed_root", config.allowed_root);
  assign_permissions(root, config.permissions);
  assign(root, "baud_rate", config.baud_rate);
  assign(root, "backoff_base_ms", config.backoff_base_ms);
  assign(root, "backoff_cap_ms", config.backoff_cap_ms);
  assign(root, "max_retries", config.max_retries);
  assign(root, "connect_timeout_ms", config.connect_timeout_ms);
  assign(root, "keepalive", config.keepalive);
  assign(root, "keepalive_idle_s", config.keepalive_idle_s);
  assign(root, "keepalive_interval_s", config.keepalive_interval_s);
  assign(root, "keepalive_count", config.keepalive_count);
  assign(root, "read_chunk", config.read_chunk);
  assign(root, "poll_interval_ms", config.poll_interval_ms);
  assign_logging(root, config.logging);

  warn_unknown_keys(root,
                    {"host", "port", "device", "allowed_root", "permissions", "baud_rate", "backoff_base_ms",
                     "backoff_cap_ms", "max_retries", "connect_timeout_ms", "keepalive", "keepalive_idle_s",
                     "keepalive_interval_s", "keepalive_count", "read_chunk", "poll_interval_ms", "verbose",
                     "log_file"},
                    path);
}

void load_echo_config(const std::string& path, EchoConfig& config) {
  const YAML::Node root = load_root(path, "echo");

  assign(root, "device", config.device_path);
  assign(root, "allowed_root", config.allowed_root);
  assign_permissions(root, config.permissions);
  assign(root, "baud_rate", config.baud_rate);
  assign(root, "read_chunk", config.read_chunk);
  assign(root, "poll_interval_ms", config.poll_interval_ms);
  assign_logging(root, config.logging);

  warn_unknown_keys(root,
                    {"device", "allowed_root", "permissions", "baud_rate", "read_chunk", "poll_interval_ms", "verbose",
                     "log_file"},
                    path);
}

#else

bool yaml_config_supported() noexcept { return false; }

namespace {
[[noreturn]] void yaml_disabled(const std::string& path, const char* section) {
  throw diagnostics::ConfigurationException(
      "cannot load " + path + ": YAML support disabled, rebuild with -DSERLINK_ENABLE_YAML_CONFIG=ON", section, "load");
}
}  // namespace

void load_bridge_config(const std::string& path, BridgeConfig&) { yaml_disabled(path, "bridge"); }
void load_client_config(const std::string& path, ClientConfig&) { yaml_disabled(path, "client"); }
void load_echo_config(const std::string& path, EchoConfig&) { yaml_disabled(path, "echo"); }

#endif

}  // namespace config
}  // namespace serlink
