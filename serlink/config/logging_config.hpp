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

namespace serlink {
namespace config {

struct LoggingConfig {
  bool verbose = false;  // DEBUG instead of INFO
  std::string log_file;  // empty: console only
};

/**
 * @brief Applies level and file output to the process-wide Logger
 * @throws diagnostics::ConfigurationException if the log file cannot be opened
 */
void apply_logging(const LoggingConfig& logging);

}  // namespace config
}  // namespace serlink
