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

#include <string>
#include <vector>

#include "cc/core/comparison/src/options.h"
#include "cc/core/metricdata/src/metricdata.h"

namespace metric_diff::comparison {

// Every Equal* function returns the reasons a (expected) and b (actual)
// differ under options. An empty result means they are equal. Comparisons
// never stop at the first difference: all differing fields are reported.
//
// Repeated children (scope metrics, metrics, data points, exemplars) are
// compared as multisets: order does not matter, multiplicity does.
// Histogram bounds, bucket counts, exponential bucket counts and exemplar
// filtered attributes are compared as ordered sequences.

/// Compares the resource, then the ScopeMetrics as a multiset.
std::vector<std::string> EqualResourceMetrics(
    const metricdata::ResourceMetrics& a, const metricdata::ResourceMetrics& b,
    Options options);

/// Compares the scope, then the Metrics as a multiset.
std::vector<std::string> EqualScopeMetrics(const metricdata::ScopeMetrics& a,
                                           const metricdata::ScopeMetrics& b,
                                           Options options);

/// Compares name, description and unit, then the aggregation.
std::vector<std::string> EqualMetrics(const metricdata::Metrics& a,
                                      const metricdata::Metrics& b,
                                      Options options);

/**
 * @brief Compares two aggregations of any shape.
 *
 * Two absent aggregations are equal. An absent and a present aggregation, or
 * two aggregations of different shapes (including the same kind over a
 * different number type), produce a single reason. Matching shapes are
 * compared by their shape-specific comparison.
 */
std::vector<std::string> EqualAggregations(const metricdata::Aggregation& a,
                                           const metricdata::Aggregation& b,
                                           Options options);

template <typename N>
std::vector<std::string> EqualGauges(const metricdata::Gauge<N>& a,
                                     const metricdata::Gauge<N>& b,
                                     Options options);

/// Temporality and monotonicity are always compared.
template <typename N>
std::vector<std::string> EqualSums(const metricdata::Sum<N>& a,
                                   const metricdata::Sum<N>& b,
                                   Options options);

template <typename N>
std::vector<std::string> EqualHistograms(const metricdata::Histogram<N>& a,
                                         const metricdata::Histogram<N>& b,
                                         Options options);

template <typename N>
std::vector<std::string> EqualExponentialHistograms(
    const metricdata::ExponentialHistogram<N>& a,
    const metricdata::ExponentialHistogram<N>& b, Options options);

template <typename N>
std::vector<std::string> EqualDataPoints(const metricdata::DataPoint<N>& a,
                                         const metricdata::DataPoint<N>& b,
                                         Options options);

template <typename N>
std::vector<std::string> EqualHistogramDataPoints(
    const metricdata::HistogramDataPoint<N>& a,
    const metricdata::HistogramDataPoint<N>& b, Options options);

template <typename N>
std::vector<std::string> EqualExponentialHistogramDataPoints(
    const metricdata::ExponentialHistogramDataPoint<N>& a,
    const metricdata::ExponentialHistogramDataPoint<N>& b, Options options);

/// Offset and counts are part of the numeric payload but are compared
/// regardless of options when called directly.
std::vector<std::string> EqualExponentialBuckets(
    const metricdata::ExponentialBucket& a,
    const metricdata::ExponentialBucket& b, Options options);

template <typename N>
std::vector<std::string> EqualExemplars(const metricdata::Exemplar<N>& a,
                                        const metricdata::Exemplar<N>& b,
                                        Options options);

template <typename N>
std::vector<std::string> EqualExtrema(const metricdata::Extrema<N>& a,
                                      const metricdata::Extrema<N>& b,
                                      Options options);

/// Two absent extrema are equal; an absent and a present one never are.
template <typename N>
bool EqExtrema(const metricdata::Extrema<N>& a,
               const metricdata::Extrema<N>& b);

/**
 * @brief Element-wise comparison of ordered attribute lists. Keys, value types
 * and values must match at every position.
 *
 * Only bool, int64, double, string and slices of those are comparable. The
 * process terminates when it meets any other OpenTelemetry value type.
 */
bool EqualKeyValues(const std::vector<metricdata::KeyValue>& a,
                    const std::vector<metricdata::KeyValue>& b);

}  // namespace metric_diff::comparison
