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

#include <string_view>

#include "cc/core/interface/service_interface.h"

namespace metric_diff::core {

/// Severity of a log line.
enum class LogLevel {
  kNone = 0,
  kDebug = 1,
  kInfo = 2,
  kWarning = 3,
  kError = 4,
  kCritical = 5,
  kAlert = 6,
  kEmergency = 7,
};

/**
 * @brief Writes log lines tagged with the emitting component and source
 * location.
 */
class LoggerInterface : public ServiceInterface {
 public:
  virtual ~LoggerInterface() = default;

  virtual void Debug(const std::string_view& component_name,
                     const std::string_view& location,
                     const std::string_view& message) noexcept = 0;

  virtual void Info(const std::string_view& component_name,
                    const std::string_view& location,
                    const std::string_view& message) noexcept = 0;

  virtual void Warning(const std::string_view& component_name,
                       const std::string_view& location,
                       const std::string_view& message) noexcept = 0;

  virtual void Error(const std::string_view& component_name,
                     const std::string_view& location,
                     const std::string_view& message) noexcept = 0;

  virtual void Critical(const std::string_view& component_name,
                        const std::string_view& location,
                        const std::string_view& message) noexcept = 0;

  virtual void Alert(const std::string_view& component_name,
                     const std::string_view& location,
                     const std::string_view& message) noexcept = 0;

  virtual void Emergency(const std::string_view& component_name,
                         const std::string_view& location,
                         const std::string_view& message) noexcept = 0;
};

}  // namespace metric_diff::core
