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

#include "serlink/config/logging_config.hpp"

#include "serlink/diagnostics/exceptions.hpp"
#include "serlink/diagnostics/logger.hpp"

namespace serlink {
namespace config {

void apply_logging(const LoggingConfig& logging) {
  auto& logger = diagnostics::Logger::instance();
  logger.set_level(logging.verbose ? diagnostics::LogLevel::DEBUG : diagnostics::LogLevel::INFO);

  if (!logging.log_file.empty() && !logger.set_file_output(logging.log_file)) {
    throw diagnostics::ConfigurationException("cannot open log file " + logging.log_file, "logging", "apply");
  }
}

}  // namespace config
}  // namespace serlink
