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

#include <boost/system/system_error.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "serlink/base/error_codes.hpp"
#include "serlink/concurrency/cleanup_registry.hpp"
#include "serlink/concurrency/shutdown_token.hpp"
#include "serlink/concurrency/signal_watcher.hpp"
#include "serlink/config/cli_parser.hpp"
#include "serlink/config/logging_config.hpp"
#include "serlink/diagnostics/exceptions.hpp"
#include "serlink/diagnostics/logger.hpp"

namespace serlink {
namespace app {

/**
 * @brief Shared main() of the serlink tools
 *
 * Parses the command line, configures logging, installs the signal watcher,
 * runs @p Component until it stops and maps the outcome to an exit code:
 * 0 clean shutdown, 1 runtime failure, 2 usage or configuration error.
 * Registered cleanup actions run before returning.
 */
template <typename Config, typename Component>
int tool_main(int argc, char** argv, config::CliResult<Config> (*parse)(const std::vector<std::string>&),
              std::string (*usage)(const std::string&), const char* component) {
  const std::string program = argc > 0 ? argv[0] : component;
  const std::vector<std::string> args(argc > 1 ? argv + 1 : argv, argc > 1 ? argv + argc : argv);

  config::CliResult<Config> parsed;
  try {
    parsed = parse(args);
  } catch (const diagnostics::ConfigurationException& e) {
    std::cerr << program << ": " << e.what() << "\n\n" << usage(program);
    return to_exit_code(e.get_code());
  } catch (const diagnostics::SerlinkException& e) {
    std::cerr << program << ": " << e.what() << std::endl;
    return to_exit_code(e.get_code());
  }

  if (parsed.action == config::CliAction::ShowHelp) {
    std::cout << usage(program);
    return 0;
  }

  try {
    config::apply_logging(parsed.config.logging);
  } catch (const diagnostics::ConfigurationException& e) {
    std::cerr << program << ": " << e.what() << std::endl;
    return to_exit_code(e.get_code());
  }

  // Peer resets surface as EPIPE on the write instead of killing the process
  std::signal(SIGPIPE, SIG_IGN);

  ErrorCode code = ErrorCode::Stopped;
  try {
    auto token = std::make_shared<concurrency::ShutdownToken>();
    concurrency::SignalWatcher watcher(token);
    watcher.start();
    {
      Component instance(parsed.config, token);
      code = instance.run();
    }
    watcher.stop();
  } catch (const diagnostics::SerlinkException& e) {
    SERLINK_LOG_CRITICAL(component, "start", e.get_full_message());
    code = e.get_code();
  } catch (const boost::system::system_error& e) {
    SERLINK_LOG_CRITICAL(component, "start", e.what());
    code = ErrorCode::DeviceFailure;
  }

  concurrency::CleanupRegistry::instance().run_all();
  if (code == ErrorCode::Stopped || code == ErrorCode::Success) {
    SERLINK_LOG_INFO(component, "stop", "Shut down cleanly");
  } else {
    SERLINK_LOG_ERROR(component, "stop", "Exiting after failure: " + to_string(code));
  }
  diagnostics::Logger::instance().flush();
  return to_exit_code(code);
}

}  // namespace app
}  // namespace serlink
