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

#include <filesystem>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "cc/core/config_provider/src/error_codes.h"
#include "cc/core/interface/config_provider_interface.h"

namespace metric_diff::core {
/*! @copydoc ConfigProviderInterface
 * Reads a JSON file whose top level is an object of option keys. The file is
 * parsed once, at Init(); later edits are not seen.
 */
class ConfigProvider : public ConfigProviderInterface {
 public:
  explicit ConfigProvider(std::filesystem::path config_file)
      : config_file_(std::move(config_file)) {}

  ExecutionResult Init() noexcept override;

  ExecutionResult Run() noexcept override;

  ExecutionResult Stop() noexcept override;

  ExecutionResult Get(const ConfigKey& key, std::string& out) noexcept override;

  ExecutionResult Get(const ConfigKey& key, size_t& out) noexcept override;

  ExecutionResult Get(const ConfigKey& key, int32_t& out) noexcept override;

  ExecutionResult Get(const ConfigKey& key, bool& out) noexcept override;

  ExecutionResult Get(const ConfigKey& key, double& out) noexcept override;

 private:
  template <typename T>
  ExecutionResult ReadTyped(const ConfigKey& key, T& out) const noexcept;

  std::filesystem::path config_file_;
  /// Top level object of the file. Null until Init() succeeds.
  nlohmann::json options_;
};
}  // namespace metric_diff::core
