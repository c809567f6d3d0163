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

#include "serlink/util/input_validator.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <vector>

namespace serlink {
namespace util {

namespace {

std::vector<std::string_view> split_segments(std::string_view path) {
  std::vector<std::string_view> segments;
  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find('/', start);
    if (end == std::string_view::npos) end = path.size();
    std::string_view segment = path.substr(start, end - start);
    if (!segment.empty() && segment != ".") {
      segments.push_back(segment);
    }
    start = end + 1;
  }
  return segments;
}

}  // namespace

void InputValidator::validate_host(const std::string& host) {
  validate_non_empty_string(host, "host");
  validate_string_length(host, base::constants::MAX_HOSTNAME_LENGTH, "host");

  if (is_valid_ipv4(host) || is_valid_hostname(host)) {
    return;
  }

  throw diagnostics::ValidationException("invalid host format", "host", "valid IPv4 address or hostname");
}

void InputValidator::validate_ipv4_address(const std::string& address) {
  validate_non_empty_string(address, "ipv4_address");

  if (!is_valid_ipv4(address)) {
    throw diagnostics::ValidationException("invalid IPv4 address format", "ipv4_address", "valid IPv4 address");
  }
}

void InputValidator::validate_device_path(const std::string& device) {
  validate_non_empty_string(device, "device_path");
  validate_string_length(device, base::constants::MAX_DEVICE_PATH_LENGTH, "device_path");

  if (!is_valid_device_path(device)) {
    throw diagnostics::ValidationException("invalid device path format", "device_path", "absolute device path");
  }
}

void InputValidator::validate_parity(const std::string& parity) {
  validate_non_empty_string(parity, "parity");

  std::string lower_parity = parity;
  std::transform(lower_parity.begin(), lower_parity.end(), lower_parity.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  static const char* const accepted[] = {"n", "e", "o", "m", "s", "none", "even", "odd", "mark", "space"};
  for (const char* candidate : accepted) {
    if (lower_parity == candidate) return;
  }
  throw diagnostics::ValidationException("invalid parity value", "parity", "N, E, O, M or S");
}

void InputValidator::validate_stop_bits(const std::string& stop_bits) {
  if (stop_bits == "1" || stop_bits == "1.5" || stop_bits == "2") {
    return;
  }
  throw diagnostics::ValidationException("invalid stop bits value", "stop_bits", "1, 1.5 or 2");
}

void InputValidator::validate_device_link_path(const std::string& path, const std::string& allowed_root) {
  if (path.empty()) {
    throw diagnostics::InvalidPathException("device path cannot be empty", path);
  }
  if (path.size() > base::constants::MAX_DEVICE_PATH_LENGTH) {
    throw diagnostics::InvalidPathException("device path too long", path);
  }
  if (path.find('\0') != std::string::npos) {
    throw diagnostics::InvalidPathException("device path contains a NUL byte", path);
  }
  if (path.front() != '/') {
    throw diagnostics::InvalidPathException("device path must be absolute: " + path, path);
  }
  if (path.back() == '/') {
    throw diagnostics::InvalidPathException("device path names a directory: " + path, path);
  }

  const auto segments = split_segments(path);
  if (segments.empty()) {
    throw diagnostics::InvalidPathException("device path names the root directory", path);
  }
  for (const auto& segment : segments) {
    if (segment == "..") {
      throw diagnostics::InvalidPathException("device path must not contain '..': " + path, path);
    }
  }

  if (!allowed_root.empty() && !is_within_root(path, allowed_root)) {
    throw diagnostics::InvalidPathException("device path " + path + " is outside allowed root " + allowed_root, path);
  }
}

bool InputValidator::is_within_root(const std::string& path, const std::string& root) {
  const auto path_segments = split_segments(path);
  const auto root_segments = split_segments(root);

  for (const auto& segment : root_segments) {
    if (segment == "..") return false;
  }
  if (root_segments.size() > path_segments.size()) {
    return false;
  }
  return std::equal(root_segments.begin(), root_segments.end(), path_segments.begin());
}

bool InputValidator::is_valid_ipv4(std::string_view address) {
  if (address.empty()) return false;

  int dots = 0;
  size_t start = 0;
  while (true) {
    size_t end = address.find('.', start);
    if (end == std::string_view::npos) end = address.size();

    const size_t len = end - start;
    if (len == 0 || len > 3) return false;
    if (len > 1 && address[start] == '0') return false;

    int octet = -1;
    auto res = std::from_chars(address.data() + start, address.data() + end, octet);
    if (res.ec != std::errc() || res.ptr != address.data() + end) return false;
    if (octet < 0 || octet > 255) return false;

    if (end == address.size()) break;
    dots++;
    start = end + 1;
  }

  return dots == 3;
}

bool InputValidator::is_valid_hostname(std::string_view hostname) {
  // RFC 1123: labels of 1-63 alphanumerics or hyphens, no leading/trailing hyphen
  if (hostname.empty() || hostname.length() > base::constants::MAX_HOSTNAME_LENGTH) {
    return false;
  }

  size_t start = 0;
  while (true) {
    size_t end = hostname.find('.', start);
    if (end == std::string_view::npos) end = hostname.size();

    std::string_view label = hostname.substr(start, end - start);
    if (label.empty() || label.length() > 63) {
      return false;
    }
    if (label.front() == '-' || label.back() == '-') {
      return false;
    }
    for (char c : label) {
      if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
        return false;
      }
    }

    if (end == hostname.size()) break;
    start = end + 1;
  }

  return true;
}

bool InputValidator::is_valid_device_path(const std::string& device) {
  // Absolute path made of portable filename characters (/dev/ttyUSB0, /dev/pts/3, /tmp/ttyV0)
  if (device.size() < 2 || device.front() != '/') {
    return false;
  }
  for (char c : device) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '/' && c != '_' && c != '-' && c != '.') {
      return false;
    }
  }
  return true;
}

}  // namespace util
}  // namespace serlink
