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

#include "cc/public/core/interface/execution_result.h"

namespace metric_diff::core {

/**
 * @brief Lifecycle shared by long-lived components such as loggers and
 * configuration providers.
 */
class ServiceInterface {
 public:
  virtual ~ServiceInterface() = default;

  /// Initializes the component.
  virtual ExecutionResult Init() noexcept = 0;

  /// Starts the component.
  virtual ExecutionResult Run() noexcept = 0;

  /// Stops the component.
  virtual ExecutionResult Stop() noexcept = 0;
};

}  // namespace metric_diff::core
