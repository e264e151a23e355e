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
#pragma once

#include <memory>
#include <string>
#include <unordered_set>

#include "cc/core/interface/errors.h"
#include "cc/core/interface/logger_interface.h"

namespace metric_diff::core::common {
class GlobalLogger {
 public:
  static const std::unique_ptr<core::LoggerInterface>& GetGlobalLogger();
  static bool IsLogLevelEnabled(const LogLevel log_level);
  static void SetGlobalLogLevels(
      const std::unordered_set<LogLevel>& log_levels);
  static void SetGlobalLogger(std::unique_ptr<core::LoggerInterface> logger);
};
}  // namespace metric_diff::core::common

#define MDIFF_LOCATION                                                      \
  (std::string(__FILE__) + ":" + __func__ + ":" + std::to_string(__LINE__))

#define MDIFF_LOG_IF_ENABLED(level, method, component_name, message)          \
  if (metric_diff::core::common::GlobalLogger::GetGlobalLogger() &&           \
      metric_diff::core::common::GlobalLogger::IsLogLevelEnabled(level)) {    \
    metric_diff::core::common::GlobalLogger::GetGlobalLogger()->method(       \
        component_name, MDIFF_LOCATION, message);                             \
  }

#define MDIFF_DEBUG(component_name, message)                             \
  MDIFF_LOG_IF_ENABLED(metric_diff::core::LogLevel::kDebug, Debug,       \
                       component_name, message)

#define MDIFF_INFO(component_name, message)                                  \
  MDIFF_LOG_IF_ENABLED(metric_diff::core::LogLevel::kInfo, Info,             \
                       component_name, message)

#define MDIFF_WARNING(component_name, message)                         \
  MDIFF_LOG_IF_ENABLED(metric_diff::core::LogLevel::kWarning, Warning, \
                       component_name, message)

#define MDIFF_ERROR(component_name, execution_result, message)             \
  if (metric_diff::core::common::GlobalLogger::GetGlobalLogger() &&        \
      metric_diff::core::common::GlobalLogger::IsLogLevelEnabled(          \
          metric_diff::core::LogLevel::kError)) {                          \
    auto message_with_error =                                              \
        std::string(message) + std::string(" Failed with: ") +             \
        metric_diff::core::errors::GetErrorMessage(                        \
            execution_result.status_code);                                 \
    metric_diff::core::common::GlobalLogger::GetGlobalLogger()->Error(     \
        component_name, MDIFF_LOCATION, message_with_error);               \
  }

#define MDIFF_CRITICAL(component_name, execution_result, message)          \
  if (metric_diff::core::common::GlobalLogger::GetGlobalLogger() &&        \
      metric_diff::core::common::GlobalLogger::IsLogLevelEnabled(          \
          metric_diff::core::LogLevel::kCritical)) {                       \
    auto message_with_error =                                              \
        std::string(message) + std::string(" Failed with: ") +             \
        metric_diff::core::errors::GetErrorMessage(                        \
            execution_result.status_code);                                 \
    metric_diff::core::common::GlobalLogger::GetGlobalLogger()->Critical(  \
        component_name, MDIFF_LOCATION, message_with_error);               \
  }
