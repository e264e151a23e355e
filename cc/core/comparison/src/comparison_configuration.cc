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

#include "cc/core/comparison/src/comparison_configuration.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "cc/core/common/global_logger/src/global_logger.h"
#include "cc/core/comparison/src/error_codes.h"
#include "cc/core/config_provider/src/config_provider.h"
#include "cc/core/config_provider/src/error_codes.h"
#include "cc/public/core/interface/execution_result.h"

namespace metric_diff::comparison {
namespace {

using metric_diff::core::ExecutionResult;
using metric_diff::core::FailureExecutionResult;
using metric_diff::core::errors::SC_CONFIG_PROVIDER_KEY_NOT_FOUND;
using metric_diff::core::errors::SC_METRIC_DIFF_INVALID_CONFIGURATION;

constexpr char kComparisonConfiguration[] = "ComparisonConfiguration";

bool ReadFlag(absl::string_view key, bool default_value,
              core::ConfigProviderInterface& config_provider) {
  std::string config_key(key);
  bool value = default_value;
  ExecutionResult execution_result = config_provider.Get(config_key, value);
  if (execution_result.Successful()) {
    MDIFF_INFO(kComparisonConfiguration,
               absl::StrCat("Loaded ", config_key, " = ",
                            value ? "true" : "false"));
    return value;
  }

  if (execution_result.status_code != SC_CONFIG_PROVIDER_KEY_NOT_FOUND) {
    auto invalid = FailureExecutionResult(SC_METRIC_DIFF_INVALID_CONFIGURATION);
    MDIFF_ERROR(kComparisonConfiguration, invalid,
                absl::StrCat("Cannot read ", config_key, ": ",
                             core::errors::GetErrorMessage(
                                 execution_result.status_code)));
  }
  return default_value;
}

}  // namespace

Options LoadComparisonOptions(core::ConfigProviderInterface& config_provider) {
  Options options;
  if (ReadFlag(kIgnoreTimestampKey, kIgnoreTimestampValue, config_provider)) {
    options = options.With(Option::kIgnoreTimestamp);
  }
  if (ReadFlag(kIgnoreValueKey, kIgnoreValueValue, config_provider)) {
    options = options.With(Option::kIgnoreValue);
  }
  if (ReadFlag(kIgnoreExemplarsKey, kIgnoreExemplarsValue, config_provider)) {
    options = options.With(Option::kIgnoreExemplars);
  }
  return options;
}

core::ExecutionResultOr<Options> LoadComparisonOptionsFromFile(
    const std::filesystem::path& config_file) {
  core::ConfigProvider config_provider(config_file);
  ExecutionResult execution_result = config_provider.Init();
  if (!execution_result.Successful()) {
    MDIFF_ERROR(kComparisonConfiguration, execution_result,
                absl::StrCat("Cannot load ", config_file.string()));
    return execution_result;
  }
  return LoadComparisonOptions(config_provider);
}

}  // namespace metric_diff::comparison
