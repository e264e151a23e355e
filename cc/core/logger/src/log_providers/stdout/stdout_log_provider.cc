/*
 * Copyright 2024 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#include "cc/core/logger/src/log_providers/stdout/stdout_log_provider.h"

#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace metric_diff::core::logger::log_providers {
namespace {

std::string_view Severity(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarning:
      return "WARNING";
    case LogLevel::kError:
      return "ERROR";
    case LogLevel::kCritical:
      return "CRITICAL";
    case LogLevel::kAlert:
      return "ALERT";
    case LogLevel::kEmergency:
      return "EMERGENCY";
    case LogLevel::kNone:
      break;
  }
  return "DEFAULT";
}

// Splits from the right so that a file path holding ':' stays intact.
bool SplitLocation(std::string_view location, nlohmann::json& out) {
  size_t line_sep = location.rfind(':');
  if (line_sep == std::string_view::npos || line_sep == 0) {
    return false;
  }
  size_t function_sep = location.rfind(':', line_sep - 1);
  if (function_sep == std::string_view::npos) {
    return false;
  }
  out = {
      {"file", location.substr(0, function_sep)},
      {"function",
       location.substr(function_sep + 1, line_sep - function_sep - 1)},
      {"line", location.substr(line_sep + 1)},
  };
  return true;
}

}  // namespace

ExecutionResult StdoutLogProvider::Init() noexcept {
  return SuccessExecutionResult();
}

ExecutionResult StdoutLogProvider::Run() noexcept {
  return SuccessExecutionResult();
}

ExecutionResult StdoutLogProvider::Stop() noexcept {
  return SuccessExecutionResult();
}

void StdoutLogProvider::Log(const LogLevel& level,
                            const std::string_view& component_name,
                            const std::string_view& location,
                            const std::string_view& message) noexcept {
  nlohmann::json log_entry = {
      {"severity", Severity(level)},
      {"message", message},
      {"component_name", component_name},
  };

  nlohmann::json source_location;
  if (SplitLocation(location, source_location)) [[likely]] {
    log_entry["source_location"] = std::move(source_location);
  } else {
    log_entry["location"] = location;
  }

  // Replacement keeps invalid UTF-8 in a message from throwing.
  sout_ << log_entry.dump(-1, ' ', false,
                          nlohmann::json::error_handler_t::replace)
        << '\n';
}
}  // namespace metric_diff::core::logger::log_providers
