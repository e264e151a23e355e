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

#include <iostream>
#include <string>
#include <string_view>

#include "cc/core/logger/interface/log_provider_interface.h"

namespace metric_diff::core {
/**
 * @brief Writes one pipe separated line per log call:
 * "<unix seconds>.<nanoseconds>|<component>|<location>|<level>: <message>",
 * where level is the numeric LogLevel.
 */
class ConsoleLogProvider : public LogProviderInterface {
 public:
  explicit ConsoleLogProvider(std::ostream& out = std::clog) : out_(out) {}

  ExecutionResult Init() noexcept override;

  ExecutionResult Run() noexcept override;

  ExecutionResult Stop() noexcept override;

  void Log(const LogLevel& level, const std::string_view& component_name,
           const std::string_view& location,
           const std::string_view& message) noexcept override;

 protected:
  /// Emits a fully formatted line. Overridden by tests to capture lines.
  virtual void Print(const std::string& output) noexcept;

 private:
  std::ostream& out_;
};
}  // namespace metric_diff::core
