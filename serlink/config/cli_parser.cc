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

#include "serlink/config/cli_parser.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>

#include "serlink/base/constants.hpp"
#include "serlink/config/config_loader.hpp"
#include "serlink/diagnostics/exceptions.hpp"

namespace serlink {
namespace config {

namespace {

using diagnostics::ConfigurationException;

/**
 * @brief Minimal argv cursor: "-b 9600", "--baud 9600" and "--baud=9600"
 */
class ArgCursor {
 public:
  ArgCursor(const std::vector<std::string>& args, const char* section) : args_(args), section_(section) {}

  bool done() const { return index_ >= args_.size(); }

  // Current token split into option name and inline value
  bool next() {
    if (done()) return false;
    current_ = args_[index_++];
    inline_value_.clear();
    has_inline_value_ = false;
    if (current_.size() > 2 && current_.compare(0, 2, "--") == 0) {
      const auto eq = current_.find('=');
      if (eq != std::string::npos) {
        inline_value_ = current_.substr(eq + 1);
        current_ = current_.substr(0, eq);
        has_inline_value_ = true;
      }
    }
    return true;
  }

  const std::string& token() const { return current_; }

  bool is_option() const { return current_.size() > 1 && current_[0] == '-'; }

  bool is(const char* short_name, const char* long_name) const {
    return (short_name != nullptr && current_ == short_name) || (long_name != nullptr && current_ == long_name);
  }

  std::string value() {
    if (has_inline_value_) {
      has_inline_value_ = false;
      return inline_value_;
    }
    if (done()) {
      throw ConfigurationException("option " + current_ + " requires a value", section_, "parse");
    }
    return args_[index_++];
  }

  void reject_inline_value() const {
    if (has_inline_value_) {
      throw ConfigurationException("option " + current_ + " takes no value", section_, "parse");
    }
  }

  [[noreturn]] void unknown() const {
    throw ConfigurationException("unknown option " + current_, section_, "parse");
  }

 private:
  const std::vector<std::string>& args_;
  const char* section_;
  size_t index_ = 0;
  std::string current_;
  std::string inline_value_;
  bool has_inline_value_ = false;
};

template <typename T>
T parse_number(const std::string& text, const char* name) {
  T value{};
  auto res = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || res.ec != std::errc() || res.ptr != text.data() + text.size()) {
    throw ConfigurationException("invalid number '" + text + "' for " + name, name, "parse");
  }
  return value;
}

uint16_t parse_port(const std::string& text) {
  const auto value = parse_number<unsigned long>(text, "port");
  if (value == 0 || value > std::numeric_limits<uint16_t>::max()) {
    throw diagnostics::ValidationException("port out of range", "port", "1..65535");
  }
  return static_cast<uint16_t>(value);
}

unsigned parse_timeout_seconds(const std::string& text) {
  char* end = nullptr;
  const double seconds = std::strtod(text.c_str(), &end);
  if (text.empty() || end == nullptr || *end != '\0' || !std::isfinite(seconds) || seconds < 0) {
    throw ConfigurationException("invalid timeout '" + text + "'", "timeout", "parse");
  }
  const double ms = std::round(seconds * 1000.0);
  if (ms < static_cast<double>(base::constants::MIN_SERIAL_TIMEOUT_MS) ||
      ms > static_cast<double>(base::constants::MAX_SERIAL_TIMEOUT_MS)) {
    throw diagnostics::ValidationException("timeout out of range", "timeout_ms", "0.001 .. 60 s");
  }
  return static_cast<unsigned>(ms);
}

// First pass: find --config so file values can be overridden by the rest
std::string find_config_file(const std::vector<std::string>& args, const char* section) {
  ArgCursor cursor(args, section);
  std::string path;
  while (cursor.next()) {
    if (cursor.is(nullptr, "--config")) {
      path = cursor.value();
    }
  }
  return path;
}

bool wants_help(const std::vector<std::string>& args) {
  for (const auto& arg : args) {
    if (arg == "-h" || arg == "--help") return true;
  }
  return false;
}

bool handle_common(ArgCursor& cursor, LoggingConfig& logging) {
  if (cursor.is("-v", "--verbose")) {
    cursor.reject_inline_value();
    logging.verbose = true;
    return true;
  }
  if (cursor.is(nullptr, "--log-file")) {
    logging.log_file = cursor.value();
    return true;
  }
  if (cursor.is(nullptr, "--config")) {
    cursor.value();  // consumed in the first pass
    return true;
  }
  return false;
}

}  // namespace

CliResult<BridgeConfig> parse_bridge_args(const std::vector<std::string>& args) {
  CliResult<BridgeConfig> result;
  if (wants_help(args)) {
    result.action = CliAction::ShowHelp;
    return result;
  }

  BridgeConfig& cfg = result.config;
  const std::string config_file = find_config_file(args, "bridge");
  if (!config_file.empty()) {
    load_bridge_config(config_file, cfg);
  }

  std::vector<std::string> positionals;
  ArgCursor cursor(args, "bridge");
  while (cursor.next()) {
    if (!cursor.is_option()) {
      positionals.push_back(cursor.token());
    } else if (handle_common(cursor, cfg.logging)) {
    } else if (cursor.is("-b", "--baud")) {
      cfg.serial.baud_rate = parse_number<unsigned>(cursor.value(), "baud_rate");
    } else if (cursor.is("-d", "--databits")) {
      cfg.serial.data_bits = parse_number<unsigned>(cursor.value(), "data_bits");
    } else if (cursor.is("-p", "--parity")) {
      cfg.serial.parity = parse_parity(cursor.value());
    } else if (cursor.is("-s", "--stopbits")) {
      cfg.serial.stop_bits = parse_stop_bits(cursor.value());
    } else if (cursor.is("-t", "--timeout")) {
      cfg.serial.timeout_ms = parse_timeout_seconds(cursor.value());
    } else if (cursor.is(nullptr, "--bind")) {
      cfg.bind_address = cursor.value();
    } else if (cursor.is(nullptr, "--max-clients")) {
      cfg.max_clients = parse_number<size_t>(cursor.value(), "max_clients");
    } else if (cursor.is(nullptr, "--banner")) {
      cursor.reject_inline_value();
      cfg.send_welcome_banner = true;
    } else {
      cursor.unknown();
    }
  }

  if (positionals.size() > 2) {
    throw ConfigurationException("unexpected argument " + positionals[2], "bridge", "parse");
  }
  if (positionals.size() >= 1) cfg.serial.device = positionals[0];
  if (positionals.size() >= 2) cfg.port = parse_port(positionals[1]);

  if (cfg.serial.device.empty()) {
    throw ConfigurationException("missing <serial-device>", "bridge", "parse");
  }
  if (cfg.port == 0) {
    throw ConfigurationException("missing <tcp-port>", "bridge", "parse");
  }

  cfg.validate();
  return result;
}

CliResult<ClientConfig> parse_client_args(const std::vector<std::string>& args) {
  CliResult<ClientConfig> result;
  if (wants_help(args)) {
    result.action = CliAction::ShowHelp;
    return result;
  }

  ClientConfig& cfg = result.config;
  const std::string config_file = find_config_file(args, "client");
  if (!config_file.empty()) {
    load_client_config(config_file, cfg);
  }

  std::vector<std::string> positionals;
  ArgCursor cursor(args, "client");
  while (cursor.next()) {
    if (!cursor.is_option()) {
      positionals.push_back(cursor.token());
    } else if (handle_common(cursor, cfg.logging)) {
    } else if (cursor.is("-d", "--device")) {
      cfg.device_path = cursor.value();
    } else if (cursor.is(nullptr, "--allowed-root")) {
      cfg.allowed_root = cursor.value();
    } else if (cursor.is(nullptr, "--max-retries")) {
      cfg.max_retries = parse_number<int>(cursor.value(), "max_retries");
    } else if (cursor.is(nullptr, "--permissions")) {
      cfg.permissions = parse_permissions(cursor.value());
    } else {
      cursor.unknown();
    }
  }

  if (positionals.size() > 2) {
    throw ConfigurationException("unexpected argument " + positionals[2], "client", "parse");
  }
  if (positionals.size() >= 1) cfg.host = positionals[0];
  if (positionals.size() >= 2) cfg.port = parse_port(positionals[1]);

  if (cfg.host.empty()) {
    throw ConfigurationException("missing <host>", "client", "parse");
  }
  if (cfg.port == 0) {
    throw ConfigurationException("missing <tcp-port>", "client", "parse");
  }

  cfg.validate();
  return result;
}

CliResult<EchoConfig> parse_echo_args(const std::vector<std::string>& args) {
  CliResult<EchoConfig> result;
  if (wants_help(args)) {
    result.action = CliAction::ShowHelp;
    return result;
  }

  EchoConfig& cfg = result.config;
  const std::string config_file = find_config_file(args, "echo");
  if (!config_file.empty()) {
    load_echo_config(config_file, cfg);
  }

  std::vector<std::string> positionals;
  ArgCursor cursor(args, "echo");
  while (cursor.next()) {
    if (!cursor.is_option()) {
      positionals.push_back(cursor.token());
    } else if (handle_common(cursor, cfg.logging)) {
    } else if (cursor.is("-b", "--baud")) {
      cfg.baud_rate = parse_number<unsigned>(cursor.value(), "baud_rate");
    } else if (cursor.is(nullptr, "--allowed-root")) {
      cfg.allowed_root = cursor.value();
    } else if (cursor.is(nullptr, "--permissions")) {
      cfg.permissions = parse_permissions(cursor.value());
    } else {
      cursor.unknown();
    }
  }

  if (positionals.size() > 1) {
    throw ConfigurationException("unexpected argument " + positionals[1], "echo", "parse");
  }
  if (positionals.size() == 1) cfg.device_path = positionals[0];

  if (cfg.device_path.empty()) {
    throw ConfigurationException("missing <device-path>", "echo", "parse");
  }

  cfg.validate();
  return result;
}

std::string bridge_usage(const std::string& program) {
  return "Usage: " + program +
         " <serial-device> <tcp-port> [options]\n"
         "  -b, --baud RATE        baud rate (default 9600)\n"
         "  -d, --databits N       data bits: 5, 6, 7, 8 (default 8)\n"
         "  -p, --parity P         parity: N, E, O, M, S (default N)\n"
         "  -s, --stopbits S       stop bits: 1, 1.5, 2 (default 1)\n"
         "  -t, --timeout SEC      warn when a serial write stalls longer than SEC (default 1.0)\n"
         "      --bind ADDR        listen address (default 0.0.0.0)\n"
         "      --max-clients N    concurrent client limit (default 10)\n"
         "      --banner           greet each client with the serial settings\n"
         "      --config FILE      YAML configuration file\n"
         "      --log-file FILE    also log to FILE\n"
         "  -v, --verbose          debug logging\n"
         "  -h, --help             show this help\n";
}

std::string client_usage(const std::string& program) {
  return "Usage: " + program +
         " <host> <tcp-port> [options]\n"
         "  -d, --device PATH      publish the virtual device at PATH\n"
         "      --allowed-root DIR refuse device paths outside DIR\n"
         "      --permissions MODE octal mode of the device (default 0660)\n"
         "      --max-retries N    give up after N failed attempts (default -1, unlimited)\n"
         "      --config FILE      YAML configuration file\n"
         "      --log-file FILE    also log to FILE\n"
         "  -v, --verbose          debug logging\n"
         "  -h, --help             show this help\n";
}

std::string echo_usage(const std::string& program) {
  return "Usage: " + program +
         " <device-path> [options]\n"
         "  -b, --baud RATE        baud rate applied to the device (default 9600)\n"
         "      --allowed-root DIR refuse device paths outside DIR\n"
         "      --permissions MODE octal mode of the device (default 0660)\n"
         "      --config FILE      YAML configuration file\n"
         "      --log-file FILE    also log to FILE\n"
         "  -v, --verbose          debug logging\n"
         "  -h, --help             show this help\n";
}

}  // namespace config
}  // namespace serlink
