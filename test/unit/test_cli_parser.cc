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

#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

#include "serlink/config/cli_parser.hpp"
#include "serlink/config/config_loader.hpp"
#include "serlink/diagnostics/exceptions.hpp"
#include "utils/test_utils.hpp"

using namespace serlink;
using namespace serlink::config;
using Args = std::vector<std::string>;

// Bridge

TEST(BridgeCliTest, PositionalsAndDefaults) {
  auto result = parse_bridge_args({"/dev/ttyUSB0", "9999"});
  ASSERT_EQ(result.action, CliAction::Run);
  const auto& cfg = result.config;
  EXPECT_EQ(cfg.serial.device, "/dev/ttyUSB0");
  EXPECT_EQ(cfg.port, 9999);
  EXPECT_EQ(cfg.serial.baud_rate, 9600u);
  EXPECT_EQ(cfg.serial.data_bits, 8u);
  EXPECT_EQ(cfg.serial.parity, Parity::None);
  EXPECT_EQ(cfg.serial.stop_bits, StopBits::One);
  EXPECT_EQ(cfg.serial.timeout_ms, 1000u);
  EXPECT_EQ(cfg.max_clients, 10u);
  EXPECT_EQ(cfg.bind_address, "0.0.0.0");
  EXPECT_FALSE(cfg.send_welcome_banner);
  EXPECT_FALSE(cfg.logging.verbose);
  EXPECT_EQ(cfg.serial.describe(), "9600 8N1");
}

TEST(BridgeCliTest, SerialOptions) {
  auto cfg = parse_bridge_args({"/dev/ttyS1", "4001", "-b", "115200", "-d", "7", "-p", "E", "-s", "2", "-t", "0.5",
                                "-v"})
                 .config;
  EXPECT_EQ(cfg.serial.baud_rate, 115200u);
  EXPECT_EQ(cfg.serial.data_bits, 7u);
  EXPECT_EQ(cfg.serial.parity, Parity::Even);
  EXPECT_EQ(cfg.serial.stop_bits, StopBits::Two);
  EXPECT_EQ(cfg.serial.timeout_ms, 500u);
  EXPECT_TRUE(cfg.logging.verbose);
  EXPECT_EQ(cfg.serial.describe(), "115200 7E2");
}

TEST(BridgeCliTest, LongOptionsAndInlineValues) {
  auto cfg = parse_bridge_args({"--baud=57600", "/dev/ttyS0", "--parity", "m", "--stopbits=1.5", "5000",
                                "--max-clients", "3", "--bind=127.0.0.1", "--banner", "--log-file", "/tmp/x.log"})
                 .config;
  EXPECT_EQ(cfg.serial.baud_rate, 57600u);
  EXPECT_EQ(cfg.serial.parity, Parity::Mark);
  EXPECT_EQ(cfg.serial.stop_bits, StopBits::OnePointFive);
  EXPECT_EQ(cfg.port, 5000);
  EXPECT_EQ(cfg.max_clients, 3u);
  EXPECT_EQ(cfg.bind_address, "127.0.0.1");
  EXPECT_TRUE(cfg.send_welcome_banner);
  EXPECT_EQ(cfg.logging.log_file, "/tmp/x.log");
}

TEST(BridgeCliTest, HelpWinsOverEverything) {
  EXPECT_EQ(parse_bridge_args({"-h"}).action, CliAction::ShowHelp);
  EXPECT_EQ(parse_bridge_args({"/dev/ttyS0", "--bogus", "--help"}).action, CliAction::ShowHelp);
}

TEST(BridgeCliTest, UsageErrors) {
  EXPECT_THROW(parse_bridge_args({}), diagnostics::ConfigurationException);
  EXPECT_THROW(parse_bridge_args({"/dev/ttyS0"}), diagnostics::ConfigurationException);
  EXPECT_THROW(parse_bridge_args({"/dev/ttyS0", "9999", "extra"}), diagnostics::ConfigurationException);
  EXPECT_THROW(parse_bridge_args({"/dev/ttyS0", "9999", "--bogus"}), diagnostics::ConfigurationException);
  EXPECT_THROW(parse_bridge_args({"/dev/ttyS0", "9999", "-b"}), diagnostics::ConfigurationException);
  EXPECT_THROW(parse_bridge_args({"/dev/ttyS0", "99x"}), diagnostics::ConfigurationException);
  EXPECT_THROW(parse_bridge_args({"/dev/ttyS0", "9999", "-b", "fast"}), diagnostics::ConfigurationException);
  EXPECT_THROW(parse_bridge_args({"/dev/ttyS0", "9999", "-t", "soon"}), diagnostics::ConfigurationException);
  EXPECT_THROW(parse_bridge_args({"/dev/ttyS0", "9999", "--banner=yes"}), diagnostics::ConfigurationException);
}

TEST(BridgeCliTest, OutOfRangeValues) {
  EXPECT_THROW(parse_bridge_args({"/dev/ttyS0", "0"}), diagnostics::ValidationException);
  EXPECT_THROW(parse_bridge_args({"/dev/ttyS0", "70000"}), diagnostics::ValidationException);
  EXPECT_THROW(parse_bridge_args({"/dev/ttyS0", "9999", "-d", "9"}), diagnostics::ValidationException);
  EXPECT_THROW(parse_bridge_args({"/dev/ttyS0", "9999", "-p", "X"}), diagnostics::ValidationException);
  EXPECT_THROW(parse_bridge_args({"/dev/ttyS0", "9999", "-s", "3"}), diagnostics::ValidationException);
  EXPECT_THROW(parse_bridge_args({"/dev/ttyS0", "9999", "-b", "10"}), diagnostics::ValidationException);
  EXPECT_THROW(parse_bridge_args({"/dev/ttyS0", "9999", "--max-clients", "0"}), diagnostics::ValidationException);
  EXPECT_THROW(parse_bridge_args({"ttyS0", "9999"}), diagnostics::ValidationException);
}

TEST(BridgeCliTest, TimeoutBoundedToSixtySeconds) {
  EXPECT_EQ(parse_bridge_args({"/dev/ttyS0", "9999", "-t", "60"}).config.serial.timeout_ms, 60000u);
  EXPECT_EQ(parse_bridge_args({"/dev/ttyS0", "9999", "-t", "0.001"}).config.serial.timeout_ms, 1u);
  EXPECT_THROW(parse_bridge_args({"/dev/ttyS0", "9999", "-t", "61"}), diagnostics::ValidationException);
  EXPECT_THROW(parse_bridge_args({"/dev/ttyS0", "9999", "-t", "0"}), diagnostics::ValidationException);
}

// Client

TEST(ClientCliTest, PositionalsAndDefaults) {
  auto cfg = parse_client_args({"localhost", "9999"}).config;
  EXPECT_EQ(cfg.host, "localhost");
  EXPECT_EQ(cfg.port, 9999);
  EXPECT_TRUE(cfg.device_path.empty());
  EXPECT_EQ(cfg.permissions, static_cast<mode_t>(0660));
  EXPECT_EQ(cfg.backoff_base_ms, 1000u);
  EXPECT_EQ(cfg.backoff_cap_ms, 30000u);
  EXPECT_EQ(cfg.max_retries, -1);
  EXPECT_TRUE(cfg.keepalive);
}

TEST(ClientCliTest, DeviceAndPolicyOptions) {
  auto cfg = parse_client_args({"10.0.0.2", "4001", "-d", "/tmp/ttyV0", "--allowed-root", "/tmp", "--max-retries",
                                "5", "--permissions", "0600", "-v"})
                 .config;
  EXPECT_EQ(cfg.device_path, "/tmp/ttyV0");
  EXPECT_EQ(cfg.allowed_root, "/tmp");
  EXPECT_EQ(cfg.max_retries, 5);
  EXPECT_EQ(cfg.permissions, static_cast<mode_t>(0600));
  EXPECT_TRUE(cfg.logging.verbose);
}

TEST(ClientCliTest, RejectsUnsafeDevicePaths) {
  EXPECT_THROW(parse_client_args({"localhost", "9999", "-d", "/tmp/../etc/ttyV0"}), diagnostics::InvalidPathException);
  EXPECT_THROW(parse_client_args({"localhost", "9999", "-d", "/var/ttyV0", "--allowed-root", "/tmp"}),
               diagnostics::InvalidPathException);
  EXPECT_THROW(parse_client_args({"localhost", "9999", "-d", "ttyV0"}), diagnostics::InvalidPathException);
}

TEST(ClientCliTest, UsageErrors) {
  EXPECT_THROW(parse_client_args({"localhost"}), diagnostics::ConfigurationException);
  EXPECT_THROW(parse_client_args({"bad host", "9999"}), diagnostics::ValidationException);
  EXPECT_THROW(parse_client_args({"localhost", "9999", "--max-retries", "-5"}), diagnostics::ValidationException);
  EXPECT_THROW(parse_client_args({"localhost", "9999", "--permissions", "999"}), diagnostics::ValidationException);
  EXPECT_THROW(parse_client_args({"localhost", "9999", "-b", "9600"}), diagnostics::ConfigurationException);
}

// Echo

TEST(EchoCliTest, PathAndBaud) {
  auto cfg = parse_echo_args({"/tmp/t1", "-b", "19200"}).config;
  EXPECT_EQ(cfg.device_path, "/tmp/t1");
  EXPECT_EQ(cfg.baud_rate, 19200u);
}

TEST(EchoCliTest, UsageErrors) {
  EXPECT_THROW(parse_echo_args({}), diagnostics::ConfigurationException);
  EXPECT_THROW(parse_echo_args({"/tmp/t1", "/tmp/t2"}), diagnostics::ConfigurationException);
  EXPECT_THROW(parse_echo_args({"/tmp/../t1"}), diagnostics::InvalidPathException);
}

TEST(CliUsageTest, UsageNamesProgramAndOptions) {
  const auto usage = bridge_usage("serlink-server");
  EXPECT_NE(usage.find("serlink-server <serial-device> <tcp-port>"), std::string::npos);
  EXPECT_NE(usage.find("--baud"), std::string::npos);
  EXPECT_NE(client_usage("serlink-client").find("<host> <tcp-port>"), std::string::npos);
  EXPECT_NE(echo_usage("serlink-echo").find("<device-path>"), std::string::npos);
}

// Command line over file

TEST(CliConfigFileTest, CommandLineOverridesFile) {
  if (!yaml_config_supported()) {
    GTEST_SKIP() << "built without YAML support";
  }
  test::TempDir dir;
  const std::string path = dir.file("bridge.yaml");
  {
    std::ofstream out(path);
    out << "device: /dev/ttyS3\n"
           "port: 7000\n"
           "baud_rate: 19200\n"
           "max_clients: 4\n";
  }

  auto cfg = parse_bridge_args({"--config", path, "-b", "38400"}).config;
  EXPECT_EQ(cfg.serial.device, "/dev/ttyS3");
  EXPECT_EQ(cfg.port, 7000);
  EXPECT_EQ(cfg.serial.baud_rate, 38400u);
  EXPECT_EQ(cfg.max_clients, 4u);

  auto overridden = parse_bridge_args({"/dev/ttyS4", "7100", "--config=" + path}).config;
  EXPECT_EQ(overridden.serial.device, "/dev/ttyS4");
  EXPECT_EQ(overridden.port, 7100);
}

TEST(CliConfigFileTest, MissingFileIsConfigurationError) {
  EXPECT_THROW(parse_echo_args({"/tmp/t1", "--config", "/nonexistent/serlink.yaml"}),
               diagnostics::ConfigurationException);
}
