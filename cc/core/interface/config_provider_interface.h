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

#include <cstddef>
#include <cstdint>
#include <string>

#include "cc/core/interface/service_interface.h"
#include "cc/public/core/interface/execution_result.h"

namespace metric_diff::core {

typedef std::string ConfigKey;

/**
 * @brief Typed read access to configuration values. Every getter leaves `out`
 * untouched and returns a failure when the key is absent or holds a value of
 * a different type.
 */
class ConfigProviderInterface : public ServiceInterface {
 public:
  virtual ~ConfigProviderInterface() = default;

  virtual ExecutionResult Get(const ConfigKey& key,
                              std::string& out) noexcept = 0;

  virtual ExecutionResult Get(const ConfigKey& key, size_t& out) noexcept = 0;

  virtual ExecutionResult Get(const ConfigKey& key, int32_t& out) noexcept = 0;

  virtual ExecutionResult Get(const ConfigKey& key, bool& out) noexcept = 0;

  virtual ExecutionResult Get(const ConfigKey& key, double& out) noexcept = 0;
};

}  // namespace metric_diff::core
