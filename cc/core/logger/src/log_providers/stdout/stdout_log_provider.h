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

namespace metric_diff::core::logger::log_providers {

/**
 * @brief Writes one JSON object per log call, on its own line:
 * {"severity", "message", "component_name", "source_location"}.
 *
 * The location "file:function:line" produced by the logging macros is split
 * into its three parts. Any other location is kept verbatim under
 * "location".
 */
class StdoutLogProvider : public LogProviderInterface {
 public:
  explicit StdoutLogProvider(std::ostream& sout = std::cout) : sout_(sout) {}

  ExecutionResult Init() noexcept override;
  ExecutionResult Run() noexcept override;
  ExecutionResult Stop() noexcept override;
  void Log(const LogLevel& level, const std::string_view& component_name,
           const std::string_view& location,
           const std::string_view& message) noexcept override;

 private:
  std::ostream& sout_;
};
}  // namespace metric_diff::core::logger::log_providers
