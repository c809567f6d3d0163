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

#include "serlink/diagnostics/logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <vector>

namespace serlink {
namespace diagnostics {

struct Logger::Impl {
  mutable std::mutex mutex_;
  std::mutex console_mutex_;
  std::atomic<LogLevel> current_level_{LogLevel::INFO};
  std::atomic<bool> enabled_{true};
  std::atomic<int> outputs_{static_cast<int>(LogOutput::CONSOLE)};

  struct FormatPart {
    enum Type { LITERAL, TIMESTAMP, LEVEL, COMPONENT, OPERATION, MESSAGE };
    Type type;
    std::string value;  // Only used for LITERAL
  };

  std::vector<FormatPart> parsed_format_;
  std::unique_ptr<std::ofstream> file_output_;
  LogCallback callback_;

  Impl() { parse_format("{timestamp} [{level}] [{component}] [{operation}] {message}"); }

  void parse_format(const std::string& format) {
    std::vector<FormatPart> parts;
    size_t start = 0;
    size_t pos = 0;

    while ((pos = format.find('{', start)) != std::string::npos) {
      if (pos > start) {
        parts.push_back({FormatPart::LITERAL, format.substr(start, pos - start)});
      }

      size_t end = format.find('}', pos);
      if (end == std::string::npos) {
        parts.push_back({FormatPart::LITERAL, format.substr(pos)});
        start = format.length();
        break;
      }

      std::string placeholder = format.substr(pos + 1, end - pos - 1);
      if (placeholder == "timestamp") {
        parts.push_back({FormatPart::TIMESTAMP, ""});
      } else if (placeholder == "level") {
        parts.push_back({FormatPart::LEVEL, ""});
      } else if (placeholder == "component") {
        parts.push_back({FormatPart::COMPONENT, ""});
      } else if (placeholder == "operation") {
        parts.push_back({FormatPart::OPERATION, ""});
      } else if (placeholder == "message") {
        parts.push_back({FormatPart::MESSAGE, ""});
      } else {
        parts.push_back({FormatPart::LITERAL, format.substr(pos, end - pos + 1)});
      }

      start = end + 1;
    }

    if (start < format.length()) {
      parts.push_back({FormatPart::LITERAL, format.substr(start)});
    }

    std::lock_guard<std::mutex> lock(mutex_);
    parsed_format_ = std::move(parts);
  }

  static const char* level_to_string(LogLevel level) {
    switch (level) {
      case LogLevel::DEBUG:
        return "DEBUG";
      case LogLevel::INFO:
        return "INFO";
      case LogLevel::WARNING:
        return "WARNING";
      case LogLevel::ERROR:
        return "ERROR";
      case LogLevel::CRITICAL:
        return "CRITICAL";
    }
    return "UNKNOWN";
  }

  static std::string get_timestamp(std::chrono::system_clock::time_point now) {
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
  }

  std::string format_message(LogLevel level, std::string_view component, std::string_view operation,
                             std::string_view message) {
    std::vector<FormatPart> parts;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      parts = parsed_format_;
    }

    std::string result;
    result.reserve(64 + component.size() + operation.size() + message.size());
    for (const auto& part : parts) {
      switch (part.type) {
        case FormatPart::LITERAL:
          result += part.value;
          break;
        case FormatPart::TIMESTAMP:
          result += get_timestamp(std::chrono::system_clock::now());
          break;
        case FormatPart::LEVEL:
          result += level_to_string(level);
          break;
        case FormatPart::COMPONENT:
          result.append(component.data(), component.size());
          break;
        case FormatPart::OPERATION:
          result.append(operation.data(), operation.size());
          break;
        case FormatPart::MESSAGE:
          result.append(message.data(), message.size());
          break;
      }
    }
    return result;
  }

  void write_to_console(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(console_mutex_);
    if (level >= LogLevel::ERROR) {
      std::cerr << message << std::endl;
    } else {
      std::cout << message << '\n';
    }
  }

  void write_to_file(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_output_ && file_output_->is_open()) {
      *file_output_ << message << '\n';
    }
  }

  void call_callback(LogLevel level, const std::string& message) {
    LogCallback callback;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      callback = callback_;
    }
    if (!callback) return;
    try {
      callback(level, message);
    } catch (const std::exception& e) {
      // Avoid infinite recursion - log to stderr instead
      std::cerr << "Error in log callback: " << e.what() << std::endl;
    }
  }

  void flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_output_ && file_output_->is_open()) {
      file_output_->flush();
    }
    std::cout.flush();
    std::cerr.flush();
  }
};

Logger::Logger() : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() { impl_->flush(); }

Logger& Logger::instance() {
  static Logger instance;
  return instance;
}

void Logger::set_level(LogLevel level) { impl_->current_level_.store(level); }

LogLevel Logger::get_level() const { return impl_->current_level_.load(); }

void Logger::set_console_output(bool enable) {
  if (enable) {
    impl_->outputs_.fetch_or(static_cast<int>(LogOutput::CONSOLE));
  } else {
    impl_->outputs_.fetch_and(~static_cast<int>(LogOutput::CONSOLE));
  }
}

bool Logger::set_file_output(const std::string& filename) {
  std::lock_guard<std::mutex> lock(impl_->mutex_);

  if (filename.empty()) {
    impl_->file_output_.reset();
    impl_->outputs_.fetch_and(~static_cast<int>(LogOutput::FILE));
    return true;
  }

  auto file = std::make_unique<std::ofstream>(filename, std::ios::app);
  if (!file->is_open()) {
    std::cerr << "Failed to open log file: " << filename << std::endl;
    return false;
  }
  impl_->file_output_ = std::move(file);
  impl_->outputs_.fetch_or(static_cast<int>(LogOutput::FILE));
  return true;
}

void Logger::set_callback(LogCallback callback) {
  std::lock_guard<std::mutex> lock(impl_->mutex_);
  impl_->callback_ = std::move(callback);
  if (impl_->callback_) {
    impl_->outputs_.fetch_or(static_cast<int>(LogOutput::CALLBACK));
  } else {
    impl_->outputs_.fetch_and(~static_cast<int>(LogOutput::CALLBACK));
  }
}

void Logger::set_outputs(int outputs) { impl_->outputs_.store(outputs); }

void Logger::set_enabled(bool enabled) { impl_->enabled_.store(enabled); }

bool Logger::is_enabled() const { return impl_->enabled_.load(); }

void Logger::set_format(const std::string& format) { impl_->parse_format(format); }

void Logger::flush() { impl_->flush(); }

void Logger::log(LogLevel level, std::string_view component, std::string_view operation, std::string_view message) {
  if (!impl_->enabled_.load() || level < impl_->current_level_.load()) {
    return;
  }

  std::string formatted_message = impl_->format_message(level, component, operation, message);
  int current_outputs = impl_->outputs_.load();

  if (current_outputs & static_cast<int>(LogOutput::CONSOLE)) {
    impl_->write_to_console(level, formatted_message);
  }

  if (current_outputs & static_cast<int>(LogOutput::FILE)) {
    impl_->write_to_file(formatted_message);
  }

  if (current_outputs & static_cast<int>(LogOutput::CALLBACK)) {
    impl_->call_callback(level, formatted_message);
  }
}

void Logger::debug(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::DEBUG, component, operation, message);
}

void Logger::info(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::INFO, component, operation, message);
}

void Logger::warning(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::WARNING, component, operation, message);
}

void Logger::error(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::ERROR, component, operation, message);
}

void Logger::critical(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::CRITICAL, component, operation, message);
}

std::string preview_bytes(const uint8_t* data, size_t size, size_t limit) {
  std::string out;
  const size_t shown = size > limit ? limit : size;
  out.reserve(shown + 8);
  for (size_t i = 0; i < shown; ++i) {
    const unsigned char c = data[i];
    if (c == '\\') {
      out += "\\\\";
    } else if (c >= 0x20 && c < 0x7f) {
      out += static_cast<char>(c);
    } else {
      char buf[5];
      std::snprintf(buf, sizeof(buf), "\\x%02x", c);
      out += buf;
    }
  }
  if (size > limit) {
    out += "...";
  }
  return out;
}

}  // namespace diagnostics
}  // namespace serlink
