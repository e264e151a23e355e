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
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "cc/core/metricdata/src/attribute_utils.h"
#include "cc/core/metricdata/src/metricdata.h"

namespace metric_diff::metricdata {

// Structural, single-line renderings of the metric data tree used in
// diagnostics. Every value renders as TypeName{Field: value, ...}.

/// "int64" or "float64".
template <typename N>
absl::string_view NumberKindName();
template <>
absl::string_view NumberKindName<int64_t>();
template <>
absl::string_view NumberKindName<double>();

template <typename N>
std::string NumberToString(N value);
template <>
std::string NumberToString<int64_t>(int64_t value);
template <>
std::string NumberToString<double>(double value);

/// Unix nanoseconds.
std::string TimeToString(const Time& time);

/// "Unspecified", "Delta" or "Cumulative".
std::string TemporalityToString(Temporality temporality);

/// The value, or "<absent>".
template <typename N>
std::string ExtremaToString(const Extrema<N>& extrema);

/// Lower base16.
std::string TraceIdToString(const opentelemetry::trace::TraceId& trace_id);
std::string SpanIdToString(const opentelemetry::trace::SpanId& span_id);

/// "[a,b,c]".
std::string SequenceToString(const std::vector<double>& values);
std::string SequenceToString(const std::vector<uint64_t>& values);

/// "[key:TYPE=value, ...]" in the given order.
std::string KeyValuesToString(const std::vector<KeyValue>& kvs);

/// Resource attributes sorted by key plus the schema URL. nullptr renders as
/// the empty resource.
std::string ResourceToString(const opentelemetry::sdk::resource::Resource* r);

/// Name, version and schema URL, or "<nil>".
std::string ScopeToString(
    const opentelemetry::sdk::instrumentationscope::InstrumentationScope*
        scope);

/// Concrete shape of the aggregation, e.g. "Sum[int64]". std::monostate
/// renders as "<nil>".
std::string AggregationTypeName(const Aggregation& aggregation);

template <typename N>
std::string ToString(const Exemplar<N>& exemplar);
template <typename N>
std::string ToString(const DataPoint<N>& data_point);
template <typename N>
std::string ToString(const HistogramDataPoint<N>& data_point);
std::string ToString(const ExponentialBucket& bucket);
template <typename N>
std::string ToString(const ExponentialHistogramDataPoint<N>& data_point);
template <typename N>
std::string ToString(const Gauge<N>& gauge);
template <typename N>
std::string ToString(const Sum<N>& sum);
template <typename N>
std::string ToString(const Histogram<N>& histogram);
template <typename N>
std::string ToString(const ExponentialHistogram<N>& histogram);
std::string ToString(const Aggregation& aggregation);
std::string ToString(const Metrics& metrics);
std::string ToString(const ScopeMetrics& scope_metrics);
std::string ToString(const ResourceMetrics& resource_metrics);

}  // namespace metric_diff::metricdata
