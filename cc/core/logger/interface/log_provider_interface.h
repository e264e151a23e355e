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

#include "cc/core/interface/logger_interface.h"
#include "cc/core/interface/service_interface.h"

namespace metric_diff::core {

/**
 * @brief Sink that formats and emits a single log line.
 */
class LogProviderInterface : public ServiceInterface {
 public:
  virtual ~LogProviderInterface() = default;

  virtual void Log(const LogLevel& level,
                   const std::string_view& component_name,
                   const std::string_view& location,
                   const std::string_view& message) noexcept = 0;
};

}  // namespace metric_diff::core
