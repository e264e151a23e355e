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

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "cc/core/metricdata/src/attribute_utils.h"
#include "opentelemetry/common/timestamp.h"
#include "opentelemetry/sdk/common/attribute_utils.h"
#include "opentelemetry/sdk/instrumentationscope/instrumentation_scope.h"
#include "opentelemetry/sdk/metrics/instruments.h"
#include "opentelemetry/sdk/resource/resource.h"
#include "opentelemetry/trace/span_id.h"
#include "opentelemetry/trace/trace_id.h"

namespace metric_diff::metricdata {

/*
 * Overview of the metric data tree
 *
 * ResourceMetrics
 *     ├─ Resource
 *     └─ std::vector<ScopeMetrics>
 *                     ├─ InstrumentationScope
 *                     └─ std::vector<Metrics>
 *                                     ├─ name, description, unit
 *                                     └─ Aggregation
 *                                         (Gauge | Sum | Histogram |
 *                                          ExponentialHistogram) x
 *                                         (int64_t | double)
 *                                            └─ std::vector<*DataPoint>
 *                                                   └─ std::vector<Exemplar>
 */

using Time = opentelemetry::common::SystemTimestamp;
using Temporality = opentelemetry::sdk::metrics::AggregationTemporality;

/// An optional minimum or maximum.
template <typename N>
using Extrema = std::optional<N>;

/// A measurement sampled with trace context.
template <typename N>
struct Exemplar {
  /// Attributes recorded with the measurement but dropped from the data
  /// point. Order is significant.
  std::vector<KeyValue> filtered_attributes;
  Time time;
  N value{};
  opentelemetry::trace::SpanId span_id;
  opentelemetry::trace::TraceId trace_id;
};

template <typename N>
struct DataPoint {
  opentelemetry::sdk::common::OrderedAttributeMap attributes;
  Time start_time;
  Time time;
  N value{};
  std::vector<Exemplar<N>> exemplars;
};

template <typename N>
struct HistogramDataPoint {
  opentelemetry::sdk::common::OrderedAttributeMap attributes;
  Time start_time;
  Time time;
  uint64_t count = 0;
  std::vector<double> bounds;
  std::vector<uint64_t> bucket_counts;
  Extrema<N> min;
  Extrema<N> max;
  N sum{};
  std::vector<Exemplar<N>> exemplars;
};

/// A contiguous run of exponential histogram buckets. counts[i] is the count
/// of bucket offset + i.
struct ExponentialBucket {
  int32_t offset = 0;
  std::vector<uint64_t> counts;
};

template <typename N>
struct ExponentialHistogramDataPoint {
  opentelemetry::sdk::common::OrderedAttributeMap attributes;
  Time start_time;
  Time time;
  uint64_t count = 0;
  Extrema<N> min;
  Extrema<N> max;
  N sum{};
  int32_t scale = 0;
  uint64_t zero_count = 0;
  ExponentialBucket positive_bucket;
  ExponentialBucket negative_bucket;
  std::vector<Exemplar<N>> exemplars;
};

template <typename N>
struct Gauge {
  std::vector<DataPoint<N>> data_points;
};

template <typename N>
struct Sum {
  std::vector<DataPoint<N>> data_points;
  Temporality temporality = Temporality::kUnspecified;
  bool is_monotonic = false;
};

template <typename N>
struct Histogram {
  std::vector<HistogramDataPoint<N>> data_points;
  Temporality temporality = Temporality::kUnspecified;
};

template <typename N>
struct ExponentialHistogram {
  std::vector<ExponentialHistogramDataPoint<N>> data_points;
  Temporality temporality = Temporality::kUnspecified;
};

/// The aggregated payload of a metric. std::monostate means no data.
using Aggregation =
    std::variant<std::monostate, Gauge<int64_t>, Gauge<double>, Sum<int64_t>,
                 Sum<double>, Histogram<int64_t>, Histogram<double>,
                 ExponentialHistogram<int64_t>, ExponentialHistogram<double>>;

struct Metrics {
  std::string name;
  std::string description;
  std::string unit;
  Aggregation data;
};

/// Metrics produced by one instrumentation scope. The scope is borrowed and
/// must outlive this value.
struct ScopeMetrics {
  const opentelemetry::sdk::instrumentationscope::InstrumentationScope* scope =
      nullptr;
  std::vector<Metrics> metrics;
};

/// Metrics produced for one resource. The resource is borrowed and must
/// outlive this value; nullptr stands for the empty resource.
struct ResourceMetrics {
  const opentelemetry::sdk::resource::Resource* resource = nullptr;
  std::vector<ScopeMetrics> scope_metrics;
};

}  // namespace metric_diff::metricdata
