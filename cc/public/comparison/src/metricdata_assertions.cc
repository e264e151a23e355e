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

#include "cc/public/comparison/interface/metricdata_assertions.h"

#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "cc/core/common/global_logger/src/global_logger.h"

namespace metric_diff::comparison {
namespace {
constexpr char kMetricDataAssertions[] = "MetricDataAssertions";
}  // namespace

::testing::AssertionResult ToAssertionResult(
    const std::vector<std::string>& reasons, absl::string_view what) {
  if (reasons.empty()) {
    return ::testing::AssertionSuccess();
  }
  MDIFF_DEBUG(kMetricDataAssertions,
              absl::StrCat(what, ": ", reasons.size(), " reason(s)"));
  return ::testing::AssertionFailure()
         << what << ":\n"
         << absl::StrJoin(reasons, "\n");
}

::testing::AssertionResult AssertAggregationsEqual(
    const metricdata::Aggregation& expected,
    const metricdata::Aggregation& actual, Options options) {
  return ToAssertionResult(EqualAggregations(expected, actual, options),
                           "aggregations are not equal");
}

}  // namespace metric_diff::comparison
