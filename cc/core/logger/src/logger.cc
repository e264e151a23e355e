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

#include "cc/core/logger/src/logger.h"

#include <string_view>

#include "cc/core/interface/logger_interface.h"
#include "cc/core/logger/interface/log_provider_interface.h"
#include "cc/public/core/interface/execution_result.h"

namespace metric_diff::core {

ExecutionResult Logger::Init() noexcept {
  return log_provider_ ? log_provider_->Init() : SuccessExecutionResult();
}

ExecutionResult Logger::Run() noexcept {
  return log_provider_ ? log_provider_->Run() : SuccessExecutionResult();
}

ExecutionResult Logger::Stop() noexcept {
  return log_provider_ ? log_provider_->Stop() : SuccessExecutionResult();
}

void Logger::Write(LogLevel level, std::string_view component_name,
                   std::string_view location,
                   std::string_view message) noexcept {
  if (log_provider_ == nullptr) {
    return;
  }
  log_provider_->Log(level, component_name, location, message);
}

void Logger::Debug(const std::string_view& component_name,
                   const std::string_view& location,
                   const std::string_view& message) noexcept {
  Write(LogLevel::kDebug, component_name, location, message);
}

void Logger::Info(const std::string_view& component_name,
                  const std::string_view& location,
                  const std::string_view& message) noexcept {
  Write(LogLevel::kInfo, component_name, location, message);
}

void Logger::Warning(const std::string_view& component_name,
                     const std::string_view& location,
                     const std::string_view& message) noexcept {
  Write(LogLevel::kWarning, component_name, location, message);
}

void Logger::Error(const std::string_view& component_name,
                   const std::string_view& location,
                   const std::string_view& message) noexcept {
  Write(LogLevel::kError, component_name, location, message);
}

void Logger::Critical(const std::string_view& component_name,
                      const std::string_view& location,
                      const std::string_view& message) noexcept {
  Write(LogLevel::kCritical, component_name, location, message);
}

void Logger::Alert(const std::string_view& component_name,
                   const std::string_view& location,
                   const std::string_view& message) noexcept {
  Write(LogLevel::kAlert, component_name, location, message);
}

void Logger::Emergency(const std::string_view& component_name,
                       const std::string_view& location,
                       const std::string_view& message) noexcept {
  Write(LogLevel::kEmergency, component_name, location, message);
}

}  // namespace metric_diff::core
