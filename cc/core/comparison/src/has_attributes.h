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

#include "cc/core/metricdata/src/attribute_utils.h"
#include "cc/core/metricdata/src/metricdata.h"

namespace metric_diff::comparison {

// Checks that every attribute in attrs is present, with the same value, on
// every data point reachable from the given value. Keys not named in attrs
// are not looked at.
//
// A missing key yields "missing attribute <key>". A key holding another value
// yields "<key> not equal:\nexpected: <wanted>\nactual: <found>", both sides
// rendered with metricdata::Emit(). Containers prefix the reasons of each
// failing child with a header naming its position.

std::vector<std::string> HasAttributesResourceMetrics(
    const metricdata::ResourceMetrics& resource_metrics,
    const std::vector<metricdata::KeyValue>& attrs);

std::vector<std::string> HasAttributesScopeMetrics(
    const metricdata::ScopeMetrics& scope_metrics,
    const std::vector<metricdata::KeyValue>& attrs);

std::vector<std::string> HasAttributesMetrics(
    const metricdata::Metrics& metrics,
    const std::vector<metricdata::KeyValue>& attrs);

/// An absent aggregation yields "unknown aggregation <nil>".
std::vector<std::string> HasAttributesAggregation(
    const metricdata::Aggregation& aggregation,
    const std::vector<metricdata::KeyValue>& attrs);

template <typename N>
std::vector<std::string> HasAttributesGauge(
    const metricdata::Gauge<N>& gauge,
    const std::vector<metricdata::KeyValue>& attrs);

template <typename N>
std::vector<std::string> HasAttributesSum(
    const metricdata::Sum<N>& sum,
    const std::vector<metricdata::KeyValue>& attrs);

template <typename N>
std::vector<std::string> HasAttributesHistogram(
    const metricdata::Histogram<N>& histogram,
    const std::vector<metricdata::KeyValue>& attrs);

template <typename N>
std::vector<std::string> HasAttributesExponentialHistogram(
    const metricdata::ExponentialHistogram<N>& histogram,
    const std::vector<metricdata::KeyValue>& attrs);

template <typename N>
std::vector<std::string> HasAttributesDataPoints(
    const metricdata::DataPoint<N>& data_point,
    const std::vector<metricdata::KeyValue>& attrs);

template <typename N>
std::vector<std::string> HasAttributesHistogramDataPoints(
    const metricdata::HistogramDataPoint<N>& data_point,
    const std::vector<metricdata::KeyValue>& attrs);

template <typename N>
std::vector<std::string> HasAttributesExponentialHistogramDataPoints(
    const metricdata::ExponentialHistogramDataPoint<N>& data_point,
    const std::vector<metricdata::KeyValue>& attrs);

/// Looks attrs up in the filtered attributes of the exemplar. Data points do
/// not descend into their exemplars.
template <typename N>
std::vector<std::string> HasAttributesExemplar(
    const metricdata::Exemplar<N>& exemplar,
    const std::vector<metricdata::KeyValue>& attrs);

}  // namespace metric_diff::comparison
