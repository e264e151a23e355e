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

#include "cc/core/comparison/src/has_attributes.h"

#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "cc/core/metricdata/src/attribute_utils.h"
#include "cc/core/common/global_logger/src/global_logger.h"
#include "cc/core/comparison/src/diff_formatter.h"
#include "cc/core/comparison/src/error_codes.h"
#include "cc/core/metricdata/src/metricdata_printer.h"
#include "cc/public/core/interface/execution_result.h"
#include "opentelemetry/sdk/common/attribute_utils.h"

namespace metric_diff::comparison {
namespace {

using metric_diff::core::FailureExecutionResult;
using metric_diff::core::errors::SC_METRIC_DIFF_UNKNOWN_AGGREGATION_TYPE;
using ::opentelemetry::sdk::common::OrderedAttributeMap;

constexpr char kMetricDiffHasAttributes[] = "MetricDiffHasAttributes";

// Same subset matching as a label filter: every wanted key must be present
// in the attributes and carry the wanted value.
std::vector<std::string> HasAttributesSet(
    const OrderedAttributeMap& attributes,
    const std::vector<metricdata::KeyValue>& attrs) {
  std::vector<std::string> reasons;
  for (const auto& [key, wanted] : attrs) {
    auto found = attributes.find(key);
    if (found == attributes.end()) {
      reasons.push_back(MissingAttrStr(key));
      continue;
    }
    if (found->second != wanted) {
      reasons.push_back(NotEqualStr(key, metricdata::Emit(wanted),
                                    metricdata::Emit(found->second)));
    }
  }
  return reasons;
}

template <typename P, typename Check>
std::vector<std::string> HasAttributesPoints(
    absl::string_view kind, const std::vector<P>& data_points,
    const std::vector<metricdata::KeyValue>& attrs, Check check) {
  std::vector<std::string> reasons;
  for (size_t n = 0; n < data_points.size(); ++n) {
    std::vector<std::string> r = check(data_points[n], attrs);
    if (!r.empty()) {
      reasons.push_back(absl::StrCat(kind, " datapoint ", n, " attributes:"));
      reasons.insert(reasons.end(), r.begin(), r.end());
    }
  }
  return reasons;
}

template <typename N>
std::vector<std::string> HasAttributesShape(
    const metricdata::Gauge<N>& gauge,
    const std::vector<metricdata::KeyValue>& attrs) {
  return HasAttributesGauge(gauge, attrs);
}

template <typename N>
std::vector<std::string> HasAttributesShape(
    const metricdata::Sum<N>& sum,
    const std::vector<metricdata::KeyValue>& attrs) {
  return HasAttributesSum(sum, attrs);
}

template <typename N>
std::vector<std::string> HasAttributesShape(
    const metricdata::Histogram<N>& histogram,
    const std::vector<metricdata::KeyValue>& attrs) {
  return HasAttributesHistogram(histogram, attrs);
}

template <typename N>
std::vector<std::string> HasAttributesShape(
    const metricdata::ExponentialHistogram<N>& histogram,
    const std::vector<metricdata::KeyValue>& attrs) {
  return HasAttributesExponentialHistogram(histogram, attrs);
}

}  // namespace

std::vector<std::string> HasAttributesResourceMetrics(
    const metricdata::ResourceMetrics& resource_metrics,
    const std::vector<metricdata::KeyValue>& attrs) {
  std::vector<std::string> reasons;
  for (size_t n = 0; n < resource_metrics.scope_metrics.size(); ++n) {
    std::vector<std::string> r =
        HasAttributesScopeMetrics(resource_metrics.scope_metrics[n], attrs);
    if (!r.empty()) {
      reasons.push_back(absl::StrCat("ResourceMetrics ScopeMetrics ", n, ":"));
      reasons.insert(reasons.end(), r.begin(), r.end());
    }
  }
  return reasons;
}

std::vector<std::string> HasAttributesScopeMetrics(
    const metricdata::ScopeMetrics& scope_metrics,
    const std::vector<metricdata::KeyValue>& attrs) {
  absl::string_view scope_name =
      scope_metrics.scope == nullptr ? absl::string_view("<nil>")
                                     : scope_metrics.scope->GetName();
  std::vector<std::string> reasons;
  for (size_t n = 0; n < scope_metrics.metrics.size(); ++n) {
    std::vector<std::string> r =
        HasAttributesMetrics(scope_metrics.metrics[n], attrs);
    if (!r.empty()) {
      reasons.push_back(
          absl::StrCat("ScopeMetrics ", scope_name, " Metrics ", n, ":"));
      reasons.insert(reasons.end(), r.begin(), r.end());
    }
  }
  return reasons;
}

std::vector<std::string> HasAttributesMetrics(
    const metricdata::Metrics& metrics,
    const std::vector<metricdata::KeyValue>& attrs) {
  std::vector<std::string> reasons;
  std::vector<std::string> r = HasAttributesAggregation(metrics.data, attrs);
  if (!r.empty()) {
    reasons.push_back(absl::StrCat("Metric ", metrics.name, ":"));
    reasons.insert(reasons.end(), r.begin(), r.end());
  }
  return reasons;
}

std::vector<std::string> HasAttributesAggregation(
    const metricdata::Aggregation& aggregation,
    const std::vector<metricdata::KeyValue>& attrs) {
  if (aggregation.valueless_by_exception()) {
    auto execution_result =
        FailureExecutionResult(SC_METRIC_DIFF_UNKNOWN_AGGREGATION_TYPE);
    MDIFF_ERROR(kMetricDiffHasAttributes, execution_result,
                "Cannot look up attributes of an unknown aggregation");
    return {absl::StrCat("unknown aggregation ",
                         metricdata::AggregationTypeName(aggregation))};
  }

  return std::visit(
      [&aggregation, &attrs](const auto& shape) -> std::vector<std::string> {
        using Shape = std::decay_t<decltype(shape)>;
        if constexpr (std::is_same_v<Shape, std::monostate>) {
          return {absl::StrCat("unknown aggregation ",
                               metricdata::AggregationTypeName(aggregation))};
        } else {
          return HasAttributesShape(shape, attrs);
        }
      },
      aggregation);
}

template <typename N>
std::vector<std::string> HasAttributesGauge(
    const metricdata::Gauge<N>& gauge,
    const std::vector<metricdata::KeyValue>& attrs) {
  return HasAttributesPoints("gauge", gauge.data_points, attrs,
                             HasAttributesDataPoints<N>);
}

template <typename N>
std::vector<std::string> HasAttributesSum(
    const metricdata::Sum<N>& sum,
    const std::vector<metricdata::KeyValue>& attrs) {
  return HasAttributesPoints("sum", sum.data_points, attrs,
                             HasAttributesDataPoints<N>);
}

template <typename N>
std::vector<std::string> HasAttributesHistogram(
    const metricdata::Histogram<N>& histogram,
    const std::vector<metricdata::KeyValue>& attrs) {
  return HasAttributesPoints("histogram", histogram.data_points, attrs,
                             HasAttributesHistogramDataPoints<N>);
}

template <typename N>
std::vector<std::string> HasAttributesExponentialHistogram(
    const metricdata::ExponentialHistogram<N>& histogram,
    const std::vector<metricdata::KeyValue>& attrs) {
  return HasAttributesPoints("histogram", histogram.data_points, attrs,
                             HasAttributesExponentialHistogramDataPoints<N>);
}

template <typename N>
std::vector<std::string> HasAttributesDataPoints(
    const metricdata::DataPoint<N>& data_point,
    const std::vector<metricdata::KeyValue>& attrs) {
  return HasAttributesSet(data_point.attributes, attrs);
}

template <typename N>
std::vector<std::string> HasAttributesHistogramDataPoints(
    const metricdata::HistogramDataPoint<N>& data_point,
    const std::vector<metricdata::KeyValue>& attrs) {
  return HasAttributesSet(data_point.attributes, attrs);
}

template <typename N>
std::vector<std::string> HasAttributesExponentialHistogramDataPoints(
    const metricdata::ExponentialHistogramDataPoint<N>& data_point,
    const std::vector<metricdata::KeyValue>& attrs) {
  return HasAttributesSet(data_point.attributes, attrs);
}

template <typename N>
std::vector<std::string> HasAttributesExemplar(
    const metricdata::Exemplar<N>& exemplar,
    const std::vector<metricdata::KeyValue>& attrs) {
  return HasAttributesSet(
      metricdata::ToAttributeMap(exemplar.filtered_attributes), attrs);
}

#define MDIFF_INSTANTIATE_HAS_ATTRIBUTES(N)                                   \
  template std::vector<std::string> HasAttributesGauge<N>(                    \
      const metricdata::Gauge<N>&, const std::vector<metricdata::KeyValue>&); \
  template std::vector<std::string> HasAttributesSum<N>(                      \
      const metricdata::Sum<N>&, const std::vector<metricdata::KeyValue>&);   \
  template std::vector<std::string> HasAttributesHistogram<N>(                \
      const metricdata::Histogram<N>&,                                        \
      const std::vector<metricdata::KeyValue>&);                              \
  template std::vector<std::string> HasAttributesExponentialHistogram<N>(     \
      const metricdata::ExponentialHistogram<N>&,                             \
      const std::vector<metricdata::KeyValue>&);                              \
  template std::vector<std::string> HasAttributesDataPoints<N>(               \
      const metricdata::DataPoint<N>&,                                        \
      const std::vector<metricdata::KeyValue>&);                              \
  template std::vector<std::string> HasAttributesHistogramDataPoints<N>(      \
      const metricdata::HistogramDataPoint<N>&,                               \
      const std::vector<metricdata::KeyValue>&);                              \
  template std::vector<std::string>                                           \
  HasAttributesExponentialHistogramDataPoints<N>(                             \
      const metricdata::ExponentialHistogramDataPoint<N>&,                    \
      const std::vector<metricdata::KeyValue>&);                              \
  template std::vector<std::string> HasAttributesExemplar<N>(                 \
      const metricdata::Exemplar<N>&,                                         \
      const std::vector<metricdata::KeyValue>&);

MDIFF_INSTANTIATE_HAS_ATTRIBUTES(int64_t)
MDIFF_INSTANTIATE_HAS_ATTRIBUTES(double)

#undef MDIFF_INSTANTIATE_HAS_ATTRIBUTES

}  // namespace metric_diff::comparison
