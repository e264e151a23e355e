// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <filesystem>
#include <string>

#include "absl/strings/string_view.h"
#include "cc/core/comparison/src/options.h"
#include "cc/core/interface/config_provider_interface.h"
#include "cc/public/core/interface/execution_result.h"

namespace metric_diff::comparison {

// Skip data point and exemplar timestamps in every comparison.
inline constexpr absl::string_view kIgnoreTimestampKey =
    "metric_diff_ignore_timestamp";
inline constexpr bool kIgnoreTimestampValue = false;

// Skip the numeric payload in every comparison.
inline constexpr absl::string_view kIgnoreValueKey = "metric_diff_ignore_value";
inline constexpr bool kIgnoreValueValue = false;

// Skip exemplars in every comparison.
inline constexpr absl::string_view kIgnoreExemplarsKey =
    "metric_diff_ignore_exemplars";
inline constexpr bool kIgnoreExemplarsValue = false;

/// Reads key from config_provider, or returns default_value when it cannot be
/// read.
template <typename T>
T GetConfigValue(const std::string& key, const T& default_value,
                 core::ConfigProviderInterface& config_provider) {
  T result = default_value;
  auto execution_result = config_provider.Get(key, result);
  if (!execution_result.Successful()) {
    result = default_value;
  }
  return result;
}

/**
 * @brief Builds the ignore policy from configuration. Absent keys take their
 * defaults. A key present with a non boolean value is logged and also takes
 * its default.
 */
Options LoadComparisonOptions(core::ConfigProviderInterface& config_provider);

/**
 * @brief Builds the ignore policy from a JSON configuration file.
 *
 * @param config_file path of a JSON object holding the option keys.
 * @return core::ExecutionResultOr<Options> the policy, or the config provider
 * failure when the file cannot be parsed.
 */
core::ExecutionResultOr<Options> LoadComparisonOptionsFromFile(
    const std::filesystem::path& config_file);

}  // namespace metric_diff::comparison
