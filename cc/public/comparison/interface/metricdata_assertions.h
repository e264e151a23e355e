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

#ifndef MDIFF_PUBLIC_COMPARISON_INTERFACE_METRICDATA_ASSERTIONS_H_
#define MDIFF_PUBLIC_COMPARISON_INTERFACE_METRICDATA_ASSERTIONS_H_

#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

#include <gtest/gtest.h>

#include "absl/strings/string_view.h"
#include "cc/core/comparison/src/comparisons.h"
#include "cc/core/comparison/src/has_attributes.h"
#include "cc/core/comparison/src/options.h"
#include "cc/core/metricdata/src/attribute_utils.h"
#include "cc/core/metricdata/src/metricdata.h"

namespace metric_diff::comparison {

/**
 * @brief Turns a reason list into a GoogleTest result. The failure message is
 * the reasons joined by newlines, prefixed with what was being checked.
 */
::testing::AssertionResult ToAssertionResult(
    const std::vector<std::string>& reasons, absl::string_view what);

namespace internal {

template <typename T, typename... Ns>
inline constexpr bool kIsOneOf = (std::is_same_v<T, Ns> || ...);

template <template <typename> class Shape, typename T>
inline constexpr bool kIsShapeOf =
    kIsOneOf<T, Shape<int64_t>, Shape<double>>;

}  // namespace internal

/**
 * @brief Asserts that expected and actual are equal under options.
 *
 * T is any level of the metric data tree: ResourceMetrics, ScopeMetrics,
 * Metrics, Gauge, Sum, Histogram, ExponentialHistogram, DataPoint,
 * HistogramDataPoint, ExponentialHistogramDataPoint, Exemplar, Extrema (for
 * int64_t or double) or ExponentialBucket. Other types do not compile.
 *
 * Example:
 *   EXPECT_TRUE(AssertEqual(expected, actual, {Option::kIgnoreTimestamp}));
 */
template <typename T>
::testing::AssertionResult AssertEqual(const T& expected, const T& actual,
                                       Options options = {}) {
  using metricdata::DataPoint;
  using metricdata::Exemplar;
  using metricdata::ExponentialHistogram;
  using metricdata::ExponentialHistogramDataPoint;
  using metricdata::Extrema;
  using metricdata::Gauge;
  using metricdata::Histogram;
  using metricdata::HistogramDataPoint;
  using metricdata::Sum;

  std::vector<std::string> reasons;
  if constexpr (std::is_same_v<T, metricdata::ResourceMetrics>) {
    reasons = EqualResourceMetrics(expected, actual, options);
  } else if constexpr (std::is_same_v<T, metricdata::ScopeMetrics>) {
    reasons = EqualScopeMetrics(expected, actual, options);
  } else if constexpr (std::is_same_v<T, metricdata::Metrics>) {
    reasons = EqualMetrics(expected, actual, options);
  } else if constexpr (internal::kIsShapeOf<Gauge, T>) {
    reasons = EqualGauges(expected, actual, options);
  } else if constexpr (internal::kIsShapeOf<Sum, T>) {
    reasons = EqualSums(expected, actual, options);
  } else if constexpr (internal::kIsShapeOf<Histogram, T>) {
    reasons = EqualHistograms(expected, actual, options);
  } else if constexpr (internal::kIsShapeOf<ExponentialHistogram, T>) {
    reasons = EqualExponentialHistograms(expected, actual, options);
  } else if constexpr (internal::kIsShapeOf<DataPoint, T>) {
    reasons = EqualDataPoints(expected, actual, options);
  } else if constexpr (internal::kIsShapeOf<HistogramDataPoint, T>) {
    reasons = EqualHistogramDataPoints(expected, actual, options);
  } else if constexpr (internal::kIsShapeOf<ExponentialHistogramDataPoint,
                                            T>) {
    reasons = EqualExponentialHistogramDataPoints(expected, actual, options);
  } else if constexpr (internal::kIsShapeOf<Exemplar, T>) {
    reasons = EqualExemplars(expected, actual, options);
  } else if constexpr (internal::kIsShapeOf<Extrema, T>) {
    reasons = EqualExtrema(expected, actual, options);
  } else if constexpr (std::is_same_v<T, metricdata::ExponentialBucket>) {
    reasons = EqualExponentialBuckets(expected, actual, options);
  } else {
    static_assert(!sizeof(T), "AssertEqual does not support this type");
  }
  return ToAssertionResult(reasons, "values are not equal");
}

/// Asserts that two aggregations of any shape are equal under options.
::testing::AssertionResult AssertAggregationsEqual(
    const metricdata::Aggregation& expected,
    const metricdata::Aggregation& actual, Options options = {});

/**
 * @brief Asserts that every data point reachable from actual carries attrs.
 *
 * T is ResourceMetrics, ScopeMetrics, Metrics, Aggregation, any aggregation
 * shape, any data point shape or Exemplar.
 */
template <typename T>
::testing::AssertionResult AssertHasAttributes(
    const T& actual, const std::vector<metricdata::KeyValue>& attrs) {
  using metricdata::DataPoint;
  using metricdata::Exemplar;
  using metricdata::ExponentialHistogram;
  using metricdata::ExponentialHistogramDataPoint;
  using metricdata::Gauge;
  using metricdata::Histogram;
  using metricdata::HistogramDataPoint;
  using metricdata::Sum;

  std::vector<std::string> reasons;
  if constexpr (std::is_same_v<T, metricdata::ResourceMetrics>) {
    reasons = HasAttributesResourceMetrics(actual, attrs);
  } else if constexpr (std::is_same_v<T, metricdata::ScopeMetrics>) {
    reasons = HasAttributesScopeMetrics(actual, attrs);
  } else if constexpr (std::is_same_v<T, metricdata::Metrics>) {
    reasons = HasAttributesMetrics(actual, attrs);
  } else if constexpr (std::is_same_v<T, metricdata::Aggregation>) {
    reasons = HasAttributesAggregation(actual, attrs);
  } else if constexpr (internal::kIsShapeOf<Gauge, T>) {
    reasons = HasAttributesGauge(actual, attrs);
  } else if constexpr (internal::kIsShapeOf<Sum, T>) {
    reasons = HasAttributesSum(actual, attrs);
  } else if constexpr (internal::kIsShapeOf<Histogram, T>) {
    reasons = HasAttributesHistogram(actual, attrs);
  } else if constexpr (internal::kIsShapeOf<ExponentialHistogram, T>) {
    reasons = HasAttributesExponentialHistogram(actual, attrs);
  } else if constexpr (internal::kIsShapeOf<DataPoint, T>) {
    reasons = HasAttributesDataPoints(actual, attrs);
  } else if constexpr (internal::kIsShapeOf<HistogramDataPoint, T>) {
    reasons = HasAttributesHistogramDataPoints(actual, attrs);
  } else if constexpr (internal::kIsShapeOf<ExponentialHistogramDataPoint,
                                            T>) {
    reasons = HasAttributesExponentialHistogramDataPoints(actual, attrs);
  } else if constexpr (internal::kIsShapeOf<Exemplar, T>) {
    reasons = HasAttributesExemplar(actual, attrs);
  } else {
    static_assert(!sizeof(T), "AssertHasAttributes does not support this type");
  }
  return ToAssertionResult(reasons, "attributes are missing or differ");
}

}  // namespace metric_diff::comparison

#endif  // MDIFF_PUBLIC_COMPARISON_INTERFACE_METRICDATA_ASSERTIONS_H_
