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
#include <string_view>
#include <utility>

#include "cc/core/interface/logger_interface.h"
#include "cc/core/logger/interface/log_provider_interface.h"
#include "cc/public/core/interface/execution_result.h"

namespace metric_diff::core {

/*! @copydoc LoggerInterface
 * Every level is forwarded to a single provider. A Logger built without a
 * provider drops every line and its lifecycle calls succeed.
 */
class Logger : public LoggerInterface {
 public:
  explicit Logger(std::unique_ptr<LogProviderInterface> log_provider)
      : log_provider_(std::move(log_provider)) {}

  ExecutionResult Init() noexcept override;

  ExecutionResult Run() noexcept override;

  ExecutionResult Stop() noexcept override;

  void Debug(const std::string_view& component_name,
             const std::string_view& location,
             const std::string_view& message) noexcept override;

  void Info(const std::string_view& component_name,
            const std::string_view& location,
            const std::string_view& message) noexcept override;

  void Warning(const std::string_view& component_name,
               const std::string_view& location,
               const std::string_view& message) noexcept override;

  void Error(const std::string_view& component_name,
             const std::string_view& location,
             const std::string_view& message) noexcept override;

  void Critical(const std::string_view& component_name,
                const std::string_view& location,
                const std::string_view& message) noexcept override;

  void Alert(const std::string_view& component_name,
             const std::string_view& location,
             const std::string_view& message) noexcept override;

  void Emergency(const std::string_view& component_name,
                 const std::string_view& location,
                 const std::string_view& message) noexcept override;

 private:
  void Write(LogLevel level, std::string_view component_name,
             std::string_view location, std::string_view message) noexcept;

  std::unique_ptr<LogProviderInterface> log_provider_;
};

}  // namespace metric_diff::core
