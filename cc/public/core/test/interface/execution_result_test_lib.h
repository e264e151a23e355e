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

#include <gtest/gtest.h>

#include <string>
#include <type_traits>

#include <gmock/gmock-matchers.h>

#include "absl/strings/str_format.h"
#include "cc/core/interface/errors.h"
#include "cc/public/core/interface/execution_result.h"

namespace metric_diff::core::test {
namespace internal {
inline std::string ToString(ExecutionStatus status) {
  switch (status) {
    case ExecutionStatus::Success:
      return "Success";
    case ExecutionStatus::Failure:
      return "Failure";
  }
  return "UNKNOWN EXECUTIONSTATUS";
}
}  // namespace internal

// Matches arg with expected_result. arg may be an ExecutionResult or an
// ExecutionResultOr, in which case its result() is compared.
// Example:
// EXPECT_THAT(config_provider.Init(),
//             ResultIs(FailureExecutionResult(
//                 errors::SC_CONFIG_PROVIDER_CANNOT_PARSE_CONFIG_FILE)));
MATCHER_P(ResultIs, expected_result, "") {
  auto execution_result_to_str = [](ExecutionResult result) {
    return absl::StrFormat(
        "ExecutionStatus: %s\n\t"
        "StatusCode: %d\n\t"
        "ErrorMessage: \"%s\"\n",
        internal::ToString(result.status), result.status_code,
        errors::GetErrorMessage(result.status_code));
  };
  ExecutionResult actual_result;
  if constexpr (std::is_base_of_v<
                    ExecutionResult,
                    std::remove_cv_t<std::remove_reference_t<decltype(arg)>>>) {
    actual_result = arg;
  } else {
    actual_result = arg.result();
  }
  if (actual_result != expected_result) {
    *result_listener << absl::StrFormat(
        "\nExpected result to have:\n\t%s"
        "Actual result has:\n\t%s",
        execution_result_to_str(expected_result),
        execution_result_to_str(actual_result));
    return false;
  }
  return true;
}

// Expects that arg.Successful() is true - i.e. arg == SuccessExecutionResult().
MATCHER(IsSuccessful, "") {
  return ::testing::ExplainMatchResult(ResultIs(SuccessExecutionResult()), arg,
                                       result_listener);
}

// Expects that arg.result() is successful and that the value held by arg
// matches inner_matcher.
// Example:
// EXPECT_THAT(LoadComparisonOptionsFromFile(path),
//             IsSuccessfulAndHolds(Eq(Options{})));
MATCHER_P(IsSuccessfulAndHolds, inner_matcher, "") {
  return ::testing::ExplainMatchResult(IsSuccessful(), arg.result(),
                                       result_listener) &&
         ::testing::ExplainMatchResult(inner_matcher, arg.value(),
                                       result_listener);
}

}  // namespace metric_diff::core::test
