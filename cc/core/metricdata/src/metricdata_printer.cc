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

#include "cc/core/metricdata/src/metricdata_printer.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "cc/core/metricdata/src/attribute_utils.h"

namespace metric_diff::metricdata {

namespace {

template <typename T>
std::string JoinRendered(const std::vector<T>& items) {
  return absl::StrCat(
      "[",
      absl::StrJoin(items, ", ",
                    [](std::string* out, const T& item) {
                      out->append(ToString(item));
                    }),
      "]");
}

template <typename N>
std::string AggregationFields(const std::vector<DataPoint<N>>& data_points) {
  return absl::StrCat("DataPoints: ", JoinRendered(data_points));
}

}  // namespace

template <>
absl::string_view NumberKindName<int64_t>() {
  return "int64";
}

template <>
absl::string_view NumberKindName<double>() {
  return "float64";
}

template <>
std::string NumberToString<int64_t>(int64_t value) {
  return absl::StrCat(value);
}

template <>
std::string NumberToString<double>(double value) {
  return FormatFloat64(value);
}

std::string TimeToString(const Time& time) {
  return absl::StrCat(time.time_since_epoch().count());
}

std::string TemporalityToString(Temporality temporality) {
  switch (temporality) {
    case Temporality::kUnspecified:
      return "Unspecified";
    case Temporality::kDelta:
      return "Delta";
    case Temporality::kCumulative:
      return "Cumulative";
  }
  return absl::StrCat("Temporality(", static_cast<int>(temporality), ")");
}

template <typename N>
std::string ExtremaToString(const Extrema<N>& extrema) {
  if (!extrema.has_value()) {
    return "<absent>";
  }
  return NumberToString<N>(*extrema);
}

std::string TraceIdToString(const opentelemetry::trace::TraceId& trace_id) {
  char buffer[2 * opentelemetry::trace::TraceId::kSize];
  trace_id.ToLowerBase16(buffer);
  return std::string(buffer, sizeof(buffer));
}

std::string SpanIdToString(const opentelemetry::trace::SpanId& span_id) {
  char buffer[2 * opentelemetry::trace::SpanId::kSize];
  span_id.ToLowerBase16(buffer);
  return std::string(buffer, sizeof(buffer));
}

std::string SequenceToString(const std::vector<double>& values) {
  return absl::StrCat("[",
                      absl::StrJoin(values, ",",
                                    [](std::string* out, double v) {
                                      out->append(FormatFloat64(v));
                                    }),
                      "]");
}

std::string SequenceToString(const std::vector<uint64_t>& values) {
  return absl::StrCat("[", absl::StrJoin(values, ","), "]");
}

std::string KeyValuesToString(const std::vector<KeyValue>& kvs) {
  return absl::StrCat("[",
                      absl::StrJoin(kvs, ", ",
                                    [](std::string* out, const KeyValue& kv) {
                                      out->append(ToString(kv));
                                    }),
                      "]");
}

std::string ResourceToString(const opentelemetry::sdk::resource::Resource* r) {
  if (r == nullptr) {
    return "Resource{Attributes: {}, SchemaURL: }";
  }
  std::vector<std::pair<std::string, std::string>> attributes;
  for (const auto& [key, value] : r->GetAttributes()) {
    attributes.emplace_back(key, Emit(value));
  }
  std::sort(attributes.begin(), attributes.end());
  return absl::StrCat("Resource{Attributes: {",
                      absl::StrJoin(attributes, ",", absl::PairFormatter("=")),
                      "}, SchemaURL: ", r->GetSchemaURL(), "}");
}

std::string ScopeToString(
    const opentelemetry::sdk::instrumentationscope::InstrumentationScope*
        scope) {
  if (scope == nullptr) {
    return "<nil>";
  }
  return absl::StrCat("Scope{Name: ", scope->GetName(),
                      ", Version: ", scope->GetVersion(),
                      ", SchemaURL: ", scope->GetSchemaURL(), "}");
}

std::string AggregationTypeName(const Aggregation& aggregation) {
  if (aggregation.valueless_by_exception()) {
    return "<unknown>";
  }
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return "<nil>";
        } else if constexpr (std::is_same_v<T, Gauge<int64_t>>) {
          return "Gauge[int64]";
        } else if constexpr (std::is_same_v<T, Gauge<double>>) {
          return "Gauge[float64]";
        } else if constexpr (std::is_same_v<T, Sum<int64_t>>) {
          return "Sum[int64]";
        } else if constexpr (std::is_same_v<T, Sum<double>>) {
          return "Sum[float64]";
        } else if constexpr (std::is_same_v<T, Histogram<int64_t>>) {
          return "Histogram[int64]";
        } else if constexpr (std::is_same_v<T, Histogram<double>>) {
          return "Histogram[float64]";
        } else if constexpr (std::is_same_v<T, ExponentialHistogram<int64_t>>) {
          return "ExponentialHistogram[int64]";
        } else {
          static_assert(std::is_same_v<T, ExponentialHistogram<double>>);
          return "ExponentialHistogram[float64]";
        }
      },
      aggregation);
}

template <typename N>
std::string ToString(const Exemplar<N>& exemplar) {
  return absl::StrCat("Exemplar[", NumberKindName<N>(), "]{FilteredAttributes: ",
                      KeyValuesToString(exemplar.filtered_attributes),
                      ", Time: ", TimeToString(exemplar.time),
                      ", Value: ", NumberToString<N>(exemplar.value),
                      ", SpanID: ", SpanIdToString(exemplar.span_id),
                      ", TraceID: ", TraceIdToString(exemplar.trace_id), "}");
}

template <typename N>
std::string ToString(const DataPoint<N>& data_point) {
  return absl::StrCat("DataPoint[", NumberKindName<N>(), "]{Attributes: ",
                      Encoded(data_point.attributes),
                      ", StartTime: ", TimeToString(data_point.start_time),
                      ", Time: ", TimeToString(data_point.time),
                      ", Value: ", NumberToString<N>(data_point.value),
                      ", Exemplars: ", JoinRendered(data_point.exemplars), "}");
}

template <typename N>
std::string ToString(const HistogramDataPoint<N>& data_point) {
  return absl::StrCat(
      "HistogramDataPoint[", NumberKindName<N>(),
      "]{Attributes: ", Encoded(data_point.attributes),
      ", StartTime: ", TimeToString(data_point.start_time),
      ", Time: ", TimeToString(data_point.time),
      ", Count: ", data_point.count,
      ", Bounds: ", SequenceToString(data_point.bounds),
      ", BucketCounts: ", SequenceToString(data_point.bucket_counts),
      ", Min: ", ExtremaToString<N>(data_point.min),
      ", Max: ", ExtremaToString<N>(data_point.max),
      ", Sum: ", NumberToString<N>(data_point.sum),
      ", Exemplars: ", JoinRendered(data_point.exemplars), "}");
}

std::string ToString(const ExponentialBucket& bucket) {
  return absl::StrCat("ExponentialBucket{Offset: ", bucket.offset,
                      ", Counts: ", SequenceToString(bucket.counts), "}");
}

template <typename N>
std::string ToString(const ExponentialHistogramDataPoint<N>& data_point) {
  return absl::StrCat(
      "ExponentialHistogramDataPoint[", NumberKindName<N>(),
      "]{Attributes: ", Encoded(data_point.attributes),
      ", StartTime: ", TimeToString(data_point.start_time),
      ", Time: ", TimeToString(data_point.time),
      ", Count: ", data_point.count,
      ", Min: ", ExtremaToString<N>(data_point.min),
      ", Max: ", ExtremaToString<N>(data_point.max),
      ", Sum: ", NumberToString<N>(data_point.sum),
      ", Scale: ", data_point.scale, ", ZeroCount: ", data_point.zero_count,
      ", PositiveBucket: ", ToString(data_point.positive_bucket),
      ", NegativeBucket: ", ToString(data_point.negative_bucket),
      ", Exemplars: ", JoinRendered(data_point.exemplars), "}");
}

template <typename N>
std::string ToString(const Gauge<N>& gauge) {
  return absl::StrCat("Gauge[", NumberKindName<N>(), "]{",
                      AggregationFields(gauge.data_points), "}");
}

template <typename N>
std::string ToString(const Sum<N>& sum) {
  return absl::StrCat("Sum[", NumberKindName<N>(),
                      "]{Temporality: ", TemporalityToString(sum.temporality),
                      ", IsMonotonic: ", sum.is_monotonic ? "true" : "false",
                      ", ", AggregationFields(sum.data_points), "}");
}

template <typename N>
std::string ToString(const Histogram<N>& histogram) {
  return absl::StrCat(
      "Histogram[", NumberKindName<N>(),
      "]{Temporality: ", TemporalityToString(histogram.temporality),
      ", DataPoints: ", JoinRendered(histogram.data_points), "}");
}

template <typename N>
std::string ToString(const ExponentialHistogram<N>& histogram) {
  return absl::StrCat(
      "ExponentialHistogram[", NumberKindName<N>(),
      "]{Temporality: ", TemporalityToString(histogram.temporality),
      ", DataPoints: ", JoinRendered(histogram.data_points), "}");
}

std::string ToString(const Aggregation& aggregation) {
  if (aggregation.valueless_by_exception()) {
    return "<unknown>";
  }
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return "<nil>";
        } else {
          return ToString(v);
        }
      },
      aggregation);
}

std::string ToString(const Metrics& metrics) {
  return absl::StrCat("Metrics{Name: ", metrics.name,
                      ", Description: ", metrics.description,
                      ", Unit: ", metrics.unit,
                      ", Data: ", ToString(metrics.data), "}");
}

std::string ToString(const ScopeMetrics& scope_metrics) {
  return absl::StrCat("ScopeMetrics{Scope: ",
                      ScopeToString(scope_metrics.scope),
                      ", Metrics: ", JoinRendered(scope_metrics.metrics), "}");
}

std::string ToString(const ResourceMetrics& resource_metrics) {
  return absl::StrCat("ResourceMetrics{Resource: ",
                      ResourceToString(resource_metrics.resource),
                      ", ScopeMetrics: ",
                      JoinRendered(resource_metrics.scope_metrics), "}");
}

#define MDIFF_INSTANTIATE_PRINTERS(N)                                      \
  template std::string ExtremaToString<N>(const Extrema<N>&);              \
  template std::string ToString<N>(const Exemplar<N>&);                    \
  template std::string ToString<N>(const DataPoint<N>&);                   \
  template std::string ToString<N>(const HistogramDataPoint<N>&);          \
  template std::string ToString<N>(const ExponentialHistogramDataPoint<N>&); \
  template std::string ToString<N>(const Gauge<N>&);                       \
  template std::string ToString<N>(const Sum<N>&);                         \
  template std::string ToString<N>(const Histogram<N>&);                   \
  template std::string ToString<N>(const ExponentialHistogram<N>&);

MDIFF_INSTANTIATE_PRINTERS(int64_t)
MDIFF_INSTANTIATE_PRINTERS(double)

#undef MDIFF_INSTANTIATE_PRINTERS

}  // namespace metric_diff::metricdata
