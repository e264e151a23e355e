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

#include "cc/core/comparison/src/comparisons.h"

#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "cc/core/common/global_logger/src/global_logger.h"
#include "cc/core/comparison/src/diff_formatter.h"
#include "cc/core/comparison/src/diff_slices.h"
#include "cc/core/comparison/src/error_codes.h"
#include "cc/core/metricdata/src/metricdata_printer.h"
#include "cc/public/core/interface/execution_result.h"
#include "opentelemetry/nostd/variant.h"
#include "opentelemetry/sdk/common/attribute_utils.h"

namespace metric_diff::comparison {
namespace {

using metric_diff::core::FailureExecutionResult;
using metric_diff::core::errors::SC_METRIC_DIFF_UNKNOWN_AGGREGATION_TYPE;
using metric_diff::metricdata::NumberToString;
using metric_diff::metricdata::TimeToString;
using ::opentelemetry::sdk::common::OwnedAttributeValue;
using ::opentelemetry::sdk::instrumentationscope::InstrumentationScope;
using ::opentelemetry::sdk::resource::Resource;

constexpr char kMetricDiffComparison[] = "MetricDiffComparison";

const char* BoolToString(bool value) { return value ? "true" : "false"; }

bool EqualTime(const metricdata::Time& a, const metricdata::Time& b) {
  return a.time_since_epoch() == b.time_since_epoch();
}

bool EqualResource(const Resource* a, const Resource* b) {
  if (a == b) {
    return true;
  }
  // A missing resource is the empty resource.
  if (a == nullptr) {
    return b->GetAttributes().empty() && b->GetSchemaURL().empty();
  }
  if (b == nullptr) {
    return a->GetAttributes().empty() && a->GetSchemaURL().empty();
  }
  return a->GetAttributes() == b->GetAttributes() &&
         a->GetSchemaURL() == b->GetSchemaURL();
}

bool EqualScope(const InstrumentationScope* a, const InstrumentationScope* b) {
  if (a == nullptr || b == nullptr) {
    return a == b;
  }
  return a->GetName() == b->GetName() && a->GetVersion() == b->GetVersion() &&
         a->GetSchemaURL() == b->GetSchemaURL();
}

template <typename T>
bool EqualAs(const OwnedAttributeValue& a, const OwnedAttributeValue& b) {
  return opentelemetry::nostd::get<T>(a) == opentelemetry::nostd::get<T>(b);
}

// a and b hold the same alternative.
bool EqualValues(const OwnedAttributeValue& a, const OwnedAttributeValue& b) {
  using opentelemetry::nostd::holds_alternative;
  if (holds_alternative<bool>(a)) {
    return EqualAs<bool>(a, b);
  }
  if (holds_alternative<int64_t>(a)) {
    return EqualAs<int64_t>(a, b);
  }
  if (holds_alternative<double>(a)) {
    return EqualAs<double>(a, b);
  }
  if (holds_alternative<std::string>(a)) {
    return EqualAs<std::string>(a, b);
  }
  if (holds_alternative<std::vector<bool>>(a)) {
    return EqualAs<std::vector<bool>>(a, b);
  }
  if (holds_alternative<std::vector<int64_t>>(a)) {
    return EqualAs<std::vector<int64_t>>(a, b);
  }
  if (holds_alternative<std::vector<double>>(a)) {
    return EqualAs<std::vector<double>>(a, b);
  }
  if (holds_alternative<std::vector<std::string>>(a)) {
    return EqualAs<std::vector<std::string>>(a, b);
  }
  LOG(FATAL) << "unknown attribute value type: "
             << metricdata::AttributeTypeName(a);
}

/**
 * @brief Matches expected and actual as multisets with compare and renders
 * what is left unmatched. When exactly one element is left on each side the
 * field-level reasons of that pair are appended, so the changed field is
 * named at every level of the tree.
 *
 * @return std::string empty when both sides matched completely.
 */
template <typename T, typename Compare>
std::string MultisetDiff(const std::vector<T>& expected,
                         const std::vector<T>& actual, Compare compare) {
  SliceDiff<T> diff = DiffSlices<T>(
      expected, actual,
      [&compare](const T& a, const T& b) { return compare(a, b).empty(); });
  if (diff.empty()) {
    return "";
  }

  std::string msg = CompareDiff(diff);
  if (diff.extra_expected.size() == 1 && diff.extra_actual.size() == 1) {
    absl::StrAppend(&msg, PairDifferences(compare(*diff.extra_expected.front(),
                                                  *diff.extra_actual.front())));
  }
  return msg;
}

template <typename N>
std::vector<std::string> EqualShape(const metricdata::Gauge<N>& a,
                                    const metricdata::Gauge<N>& b,
                                    Options options) {
  return EqualGauges(a, b, options);
}

template <typename N>
std::vector<std::string> EqualShape(const metricdata::Sum<N>& a,
                                    const metricdata::Sum<N>& b,
                                    Options options) {
  return EqualSums(a, b, options);
}

template <typename N>
std::vector<std::string> EqualShape(const metricdata::Histogram<N>& a,
                                    const metricdata::Histogram<N>& b,
                                    Options options) {
  return EqualHistograms(a, b, options);
}

template <typename N>
std::vector<std::string> EqualShape(
    const metricdata::ExponentialHistogram<N>& a,
    const metricdata::ExponentialHistogram<N>& b, Options options) {
  return EqualExponentialHistograms(a, b, options);
}

template <typename N>
void AppendExemplarReasons(const std::vector<metricdata::Exemplar<N>>& a,
                           const std::vector<metricdata::Exemplar<N>>& b,
                           Options options, std::vector<std::string>& reasons) {
  if (options.ignore_exemplars()) {
    return;
  }
  std::string r = MultisetDiff(
      a, b,
      [options](const metricdata::Exemplar<N>& x,
                const metricdata::Exemplar<N>& y) {
        return EqualExemplars(x, y, options);
      });
  if (!r.empty()) {
    reasons.push_back(absl::StrCat("Exemplars not equal:\n", r));
  }
}

/// Fields shared by every data point shape: attributes and timestamps.
template <typename P>
void AppendPointIdentityReasons(const P& a, const P& b, Options options,
                                std::vector<std::string>& reasons) {
  if (a.attributes != b.attributes) {
    reasons.push_back(NotEqualStr("Attributes",
                                  metricdata::Encoded(a.attributes),
                                  metricdata::Encoded(b.attributes)));
  }
  if (!options.ignore_timestamp()) {
    if (!EqualTime(a.start_time, b.start_time)) {
      reasons.push_back(NotEqualStr("StartTime", TimeToString(a.start_time),
                                    TimeToString(b.start_time)));
    }
    if (!EqualTime(a.time, b.time)) {
      reasons.push_back(
          NotEqualStr("Time", TimeToString(a.time), TimeToString(b.time)));
    }
  }
}

template <typename N>
void AppendExtremaReason(absl::string_view field,
                         const metricdata::Extrema<N>& a,
                         const metricdata::Extrema<N>& b,
                         std::vector<std::string>& reasons) {
  if (!EqExtrema(a, b)) {
    reasons.push_back(NotEqualStr(field, metricdata::ExtremaToString(a),
                                  metricdata::ExtremaToString(b)));
  }
}

}  // namespace

std::vector<std::string> EqualResourceMetrics(
    const metricdata::ResourceMetrics& a, const metricdata::ResourceMetrics& b,
    Options options) {
  std::vector<std::string> reasons;
  if (!EqualResource(a.resource, b.resource)) {
    reasons.push_back(NotEqualStr("Resources",
                                  metricdata::ResourceToString(a.resource),
                                  metricdata::ResourceToString(b.resource)));
  }

  std::string r = MultisetDiff(
      a.scope_metrics, b.scope_metrics,
      [options](const metricdata::ScopeMetrics& x,
                const metricdata::ScopeMetrics& y) {
        return EqualScopeMetrics(x, y, options);
      });
  if (!r.empty()) {
    reasons.push_back(
        absl::StrCat("ResourceMetrics ScopeMetrics not equal:\n", r));
  }
  return reasons;
}

std::vector<std::string> EqualScopeMetrics(const metricdata::ScopeMetrics& a,
                                           const metricdata::ScopeMetrics& b,
                                           Options options) {
  std::vector<std::string> reasons;
  if (!EqualScope(a.scope, b.scope)) {
    reasons.push_back(NotEqualStr("Scope", metricdata::ScopeToString(a.scope),
                                  metricdata::ScopeToString(b.scope)));
  }

  std::string r =
      MultisetDiff(a.metrics, b.metrics,
                   [options](const metricdata::Metrics& x,
                             const metricdata::Metrics& y) {
                     return EqualMetrics(x, y, options);
                   });
  if (!r.empty()) {
    reasons.push_back(absl::StrCat("ScopeMetrics Metrics not equal:\n", r));
  }
  return reasons;
}

std::vector<std::string> EqualMetrics(const metricdata::Metrics& a,
                                      const metricdata::Metrics& b,
                                      Options options) {
  std::vector<std::string> reasons;
  if (a.name != b.name) {
    reasons.push_back(NotEqualStr("Name", a.name, b.name));
  }
  if (a.description != b.description) {
    reasons.push_back(NotEqualStr("Description", a.description, b.description));
  }
  if (a.unit != b.unit) {
    reasons.push_back(NotEqualStr("Unit", a.unit, b.unit));
  }

  std::vector<std::string> r = EqualAggregations(a.data, b.data, options);
  if (!r.empty()) {
    reasons.push_back("Metrics Data not equal:");
    reasons.insert(reasons.end(), r.begin(), r.end());
  }
  return reasons;
}

std::vector<std::string> EqualAggregations(const metricdata::Aggregation& a,
                                           const metricdata::Aggregation& b,
                                           Options options) {
  if (a.valueless_by_exception() || b.valueless_by_exception()) {
    auto execution_result =
        FailureExecutionResult(SC_METRIC_DIFF_UNKNOWN_AGGREGATION_TYPE);
    MDIFF_ERROR(kMetricDiffComparison, execution_result,
                absl::StrCat("Cannot compare aggregations ",
                             metricdata::AggregationTypeName(a), " and ",
                             metricdata::AggregationTypeName(b)));
    return {absl::StrCat("Aggregation of unknown types ",
                         metricdata::AggregationTypeName(a), " and ",
                         metricdata::AggregationTypeName(b))};
  }

  bool a_absent = std::holds_alternative<std::monostate>(a);
  bool b_absent = std::holds_alternative<std::monostate>(b);
  if (a_absent || b_absent) {
    if (a_absent != b_absent) {
      return {NotEqualStr("Aggregation", metricdata::ToString(a),
                          metricdata::ToString(b))};
    }
    return {};
  }

  if (a.index() != b.index()) {
    return {NotEqualStr("Aggregation types", metricdata::AggregationTypeName(a),
                        metricdata::AggregationTypeName(b))};
  }

  std::vector<std::string> reasons;
  std::visit(
      [&](const auto& expected) {
        using Shape = std::decay_t<decltype(expected)>;
        if constexpr (!std::is_same_v<Shape, std::monostate>) {
          std::vector<std::string> r =
              EqualShape(expected, std::get<Shape>(b), options);
          if (!r.empty()) {
            reasons.push_back(absl::StrCat(
                metricdata::AggregationTypeName(a), " not equal:"));
            reasons.insert(reasons.end(), r.begin(), r.end());
          }
        }
      },
      a);
  return reasons;
}

template <typename N>
std::vector<std::string> EqualGauges(const metricdata::Gauge<N>& a,
                                     const metricdata::Gauge<N>& b,
                                     Options options) {
  std::vector<std::string> reasons;
  std::string r = MultisetDiff(a.data_points, b.data_points,
                               [options](const metricdata::DataPoint<N>& x,
                                         const metricdata::DataPoint<N>& y) {
                                 return EqualDataPoints(x, y, options);
                               });
  if (!r.empty()) {
    reasons.push_back(absl::StrCat("Gauge DataPoints not equal:\n", r));
  }
  return reasons;
}

template <typename N>
std::vector<std::string> EqualSums(const metricdata::Sum<N>& a,
                                   const metricdata::Sum<N>& b,
                                   Options options) {
  std::vector<std::string> reasons;
  if (a.temporality != b.temporality) {
    reasons.push_back(
        NotEqualStr("Temporality", metricdata::TemporalityToString(a.temporality),
                    metricdata::TemporalityToString(b.temporality)));
  }
  if (a.is_monotonic != b.is_monotonic) {
    reasons.push_back(NotEqualStr("IsMonotonic", BoolToString(a.is_monotonic),
                                  BoolToString(b.is_monotonic)));
  }

  std::string r = MultisetDiff(a.data_points, b.data_points,
                               [options](const metricdata::DataPoint<N>& x,
                                         const metricdata::DataPoint<N>& y) {
                                 return EqualDataPoints(x, y, options);
                               });
  if (!r.empty()) {
    reasons.push_back(absl::StrCat("Sum DataPoints not equal:\n", r));
  }
  return reasons;
}

template <typename N>
std::vector<std::string> EqualHistograms(const metricdata::Histogram<N>& a,
                                         const metricdata::Histogram<N>& b,
                                         Options options) {
  std::vector<std::string> reasons;
  if (a.temporality != b.temporality) {
    reasons.push_back(
        NotEqualStr("Temporality", metricdata::TemporalityToString(a.temporality),
                    metricdata::TemporalityToString(b.temporality)));
  }

  std::string r =
      MultisetDiff(a.data_points, b.data_points,
                   [options](const metricdata::HistogramDataPoint<N>& x,
                             const metricdata::HistogramDataPoint<N>& y) {
                     return EqualHistogramDataPoints(x, y, options);
                   });
  if (!r.empty()) {
    reasons.push_back(absl::StrCat("Histogram DataPoints not equal:\n", r));
  }
  return reasons;
}

template <typename N>
std::vector<std::string> EqualExponentialHistograms(
    const metricdata::ExponentialHistogram<N>& a,
    const metricdata::ExponentialHistogram<N>& b, Options options) {
  std::vector<std::string> reasons;
  if (a.temporality != b.temporality) {
    reasons.push_back(
        NotEqualStr("Temporality", metricdata::TemporalityToString(a.temporality),
                    metricdata::TemporalityToString(b.temporality)));
  }

  std::string r = MultisetDiff(
      a.data_points, b.data_points,
      [options](const metricdata::ExponentialHistogramDataPoint<N>& x,
                const metricdata::ExponentialHistogramDataPoint<N>& y) {
        return EqualExponentialHistogramDataPoints(x, y, options);
      });
  if (!r.empty()) {
    reasons.push_back(
        absl::StrCat("ExponentialHistogram DataPoints not equal:\n", r));
  }
  return reasons;
}

template <typename N>
std::vector<std::string> EqualDataPoints(const metricdata::DataPoint<N>& a,
                                         const metricdata::DataPoint<N>& b,
                                         Options options) {
  std::vector<std::string> reasons;
  AppendPointIdentityReasons(a, b, options, reasons);
  if (!options.ignore_value() && a.value != b.value) {
    reasons.push_back(
        NotEqualStr("Value", NumberToString(a.value), NumberToString(b.value)));
  }
  AppendExemplarReasons(a.exemplars, b.exemplars, options, reasons);
  return reasons;
}

template <typename N>
std::vector<std::string> EqualHistogramDataPoints(
    const metricdata::HistogramDataPoint<N>& a,
    const metricdata::HistogramDataPoint<N>& b, Options options) {
  std::vector<std::string> reasons;
  AppendPointIdentityReasons(a, b, options, reasons);
  if (!options.ignore_value()) {
    if (a.count != b.count) {
      reasons.push_back(NotEqualStr("Count", absl::StrCat(a.count),
                                    absl::StrCat(b.count)));
    }
    if (a.bounds != b.bounds) {
      reasons.push_back(NotEqualStr("Bounds",
                                    metricdata::SequenceToString(a.bounds),
                                    metricdata::SequenceToString(b.bounds)));
    }
    if (a.bucket_counts != b.bucket_counts) {
      reasons.push_back(
          NotEqualStr("BucketCounts", metricdata::SequenceToString(a.bucket_counts),
                      metricdata::SequenceToString(b.bucket_counts)));
    }
    AppendExtremaReason("Min", a.min, b.min, reasons);
    AppendExtremaReason("Max", a.max, b.max, reasons);
    if (a.sum != b.sum) {
      reasons.push_back(
          NotEqualStr("Sum", NumberToString(a.sum), NumberToString(b.sum)));
    }
  }
  AppendExemplarReasons(a.exemplars, b.exemplars, options, reasons);
  return reasons;
}

template <typename N>
std::vector<std::string> EqualExponentialHistogramDataPoints(
    const metricdata::ExponentialHistogramDataPoint<N>& a,
    const metricdata::ExponentialHistogramDataPoint<N>& b, Options options) {
  std::vector<std::string> reasons;
  AppendPointIdentityReasons(a, b, options, reasons);
  if (!options.ignore_value()) {
    if (a.count != b.count) {
      reasons.push_back(NotEqualStr("Count", absl::StrCat(a.count),
                                    absl::StrCat(b.count)));
    }
    AppendExtremaReason("Min", a.min, b.min, reasons);
    AppendExtremaReason("Max", a.max, b.max, reasons);
    if (a.sum != b.sum) {
      reasons.push_back(
          NotEqualStr("Sum", NumberToString(a.sum), NumberToString(b.sum)));
    }
    if (a.scale != b.scale) {
      reasons.push_back(NotEqualStr("Scale", absl::StrCat(a.scale),
                                    absl::StrCat(b.scale)));
    }
    if (a.zero_count != b.zero_count) {
      reasons.push_back(NotEqualStr("ZeroCount", absl::StrCat(a.zero_count),
                                    absl::StrCat(b.zero_count)));
    }

    std::vector<std::string> r =
        EqualExponentialBuckets(a.positive_bucket, b.positive_bucket, options);
    if (!r.empty()) {
      reasons.push_back("PositiveBucket not equal:");
      reasons.insert(reasons.end(), r.begin(), r.end());
    }
    r = EqualExponentialBuckets(a.negative_bucket, b.negative_bucket, options);
    if (!r.empty()) {
      reasons.push_back("NegativeBucket not equal:");
      reasons.insert(reasons.end(), r.begin(), r.end());
    }
  }
  AppendExemplarReasons(a.exemplars, b.exemplars, options, reasons);
  return reasons;
}

std::vector<std::string> EqualExponentialBuckets(
    const metricdata::ExponentialBucket& a,
    const metricdata::ExponentialBucket& b, Options options) {
  std::vector<std::string> reasons;
  if (a.offset != b.offset) {
    reasons.push_back(NotEqualStr("Offset", absl::StrCat(a.offset),
                                  absl::StrCat(b.offset)));
  }
  if (a.counts != b.counts) {
    reasons.push_back(NotEqualStr("Counts",
                                  metricdata::SequenceToString(a.counts),
                                  metricdata::SequenceToString(b.counts)));
  }
  return reasons;
}

template <typename N>
std::vector<std::string> EqualExemplars(const metricdata::Exemplar<N>& a,
                                        const metricdata::Exemplar<N>& b,
                                        Options options) {
  std::vector<std::string> reasons;
  if (!EqualKeyValues(a.filtered_attributes, b.filtered_attributes)) {
    reasons.push_back(NotEqualStr(
        "FilteredAttributes",
        metricdata::KeyValuesToString(a.filtered_attributes),
        metricdata::KeyValuesToString(b.filtered_attributes)));
  }
  if (!options.ignore_timestamp() && !EqualTime(a.time, b.time)) {
    reasons.push_back(
        NotEqualStr("Time", TimeToString(a.time), TimeToString(b.time)));
  }
  if (!options.ignore_value() && a.value != b.value) {
    reasons.push_back(
        NotEqualStr("Value", NumberToString(a.value), NumberToString(b.value)));
  }
  if (a.span_id != b.span_id) {
    reasons.push_back(NotEqualStr("SpanID",
                                  metricdata::SpanIdToString(a.span_id),
                                  metricdata::SpanIdToString(b.span_id)));
  }
  if (a.trace_id != b.trace_id) {
    reasons.push_back(NotEqualStr("TraceID",
                                  metricdata::TraceIdToString(a.trace_id),
                                  metricdata::TraceIdToString(b.trace_id)));
  }
  return reasons;
}

template <typename N>
std::vector<std::string> EqualExtrema(const metricdata::Extrema<N>& a,
                                      const metricdata::Extrema<N>& b,
                                      Options options) {
  std::vector<std::string> reasons;
  AppendExtremaReason("Extrema", a, b, reasons);
  return reasons;
}

template <typename N>
bool EqExtrema(const metricdata::Extrema<N>& a,
               const metricdata::Extrema<N>& b) {
  if (a.has_value() != b.has_value()) {
    return false;
  }
  if (!a.has_value()) {
    return true;
  }
  return *a == *b;
}

bool EqualKeyValues(const std::vector<metricdata::KeyValue>& a,
                    const std::vector<metricdata::KeyValue>& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (a[i].first != b[i].first) {
      return false;
    }
    if (a[i].second.index() != b[i].second.index()) {
      return false;
    }
    if (!EqualValues(a[i].second, b[i].second)) {
      return false;
    }
  }
  return true;
}

#define MDIFF_INSTANTIATE_COMPARISONS(N)                                      \
  template std::vector<std::string> EqualGauges<N>(                           \
      const metricdata::Gauge<N>&, const metricdata::Gauge<N>&, Options);     \
  template std::vector<std::string> EqualSums<N>(                             \
      const metricdata::Sum<N>&, const metricdata::Sum<N>&, Options);         \
  template std::vector<std::string> EqualHistograms<N>(                       \
      const metricdata::Histogram<N>&, const metricdata::Histogram<N>&,       \
      Options);                                                               \
  template std::vector<std::string> EqualExponentialHistograms<N>(            \
      const metricdata::ExponentialHistogram<N>&,                             \
      const metricdata::ExponentialHistogram<N>&, Options);                   \
  template std::vector<std::string> EqualDataPoints<N>(                       \
      const metricdata::DataPoint<N>&, const metricdata::DataPoint<N>&,       \
      Options);                                                               \
  template std::vector<std::string> EqualHistogramDataPoints<N>(              \
      const metricdata::HistogramDataPoint<N>&,                               \
      const metricdata::HistogramDataPoint<N>&, Options);                     \
  template std::vector<std::string> EqualExponentialHistogramDataPoints<N>(   \
      const metricdata::ExponentialHistogramDataPoint<N>&,                    \
      const metricdata::ExponentialHistogramDataPoint<N>&, Options);          \
  template std::vector<std::string> EqualExemplars<N>(                        \
      const metricdata::Exemplar<N>&, const metricdata::Exemplar<N>&,         \
      Options);                                                               \
  template std::vector<std::string> EqualExtrema<N>(                          \
      const metricdata::Extrema<N>&, const metricdata::Extrema<N>&, Options); \
  template bool EqExtrema<N>(const metricdata::Extrema<N>&,                   \
                             const metricdata::Extrema<N>&);

MDIFF_INSTANTIATE_COMPARISONS(int64_t)
MDIFF_INSTANTIATE_COMPARISONS(double)

#undef MDIFF_INSTANTIATE_COMPARISONS

}  // namespace metric_diff::comparison
