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

#include "serlink/app/tool_main.hpp"
#include "serlink/serlink.hpp"

int main(int argc, char** argv) {
  return serlink::app::tool_main<serlink::config::ClientConfig, serlink::client::NetworkClient>(
      argc, argv, &serlink::config::parse_client_args, &serlink::config::client_usage, "client");
}
