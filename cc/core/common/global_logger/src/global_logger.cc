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
#include "cc/core/common/global_logger/src/global_logger.h"

#include <memory>
#include <unordered_set>
#include <utility>

namespace metric_diff::core::common {
namespace {
std::unique_ptr<LoggerInterface>& LoggerInstance() {
  static std::unique_ptr<LoggerInterface> logger_instance;
  return logger_instance;
}

// Debug lines are opt-in.
std::unordered_set<LogLevel>& EnabledLogLevels() {
  static std::unordered_set<LogLevel> enabled_log_levels = {
      LogLevel::kInfo,     LogLevel::kWarning, LogLevel::kError,
      LogLevel::kCritical, LogLevel::kAlert,   LogLevel::kEmergency};
  return enabled_log_levels;
}
}  // namespace

const std::unique_ptr<LoggerInterface>& GlobalLogger::GetGlobalLogger() {
  return LoggerInstance();
}

bool GlobalLogger::IsLogLevelEnabled(const LogLevel log_level) {
  return EnabledLogLevels().find(log_level) != EnabledLogLevels().end();
}

void GlobalLogger::SetGlobalLogLevels(
    const std::unordered_set<LogLevel>& log_levels) {
  EnabledLogLevels() = log_levels;
}

void GlobalLogger::SetGlobalLogger(std::unique_ptr<LoggerInterface> logger) {
  LoggerInstance() = std::move(logger);
}
}  // namespace metric_diff::core::common
