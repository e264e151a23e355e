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
#include <utility>
#include <vector>

#include "absl/strings/string_view.h"
#include "opentelemetry/sdk/common/attribute_utils.h"

namespace metric_diff::metricdata {

/// One attribute of an exemplar. Exemplars keep their filtered attributes as
/// an ordered list of these.
using KeyValue =
    std::pair<std::string, opentelemetry::sdk::common::OwnedAttributeValue>;

/// Shortest decimal text that reads back to the same double, e.g. "0.1".
std::string FormatFloat64(double value);

/**
 * @brief Type tag of an attribute value.
 *
 * The comparable types are BOOL, INT64, FLOAT64, STRING, BOOLSLICE,
 * INT64SLICE, FLOAT64SLICE and STRINGSLICE. The remaining OpenTelemetry
 * alternatives are named by width, e.g. INT32 or UINT8SLICE.
 */
absl::string_view AttributeTypeName(
    const opentelemetry::sdk::common::OwnedAttributeValue& value);

/// Plain text of the value. Slices render as "[a,b,c]".
std::string Emit(const opentelemetry::sdk::common::OwnedAttributeValue& value);

/// Canonical "k=v,k=v" text of a data point attribute set, in key order.
/// '\\', ',' and '=' inside keys and values are escaped with a backslash.
std::string Encoded(
    const opentelemetry::sdk::common::OrderedAttributeMap& attributes);

/// "key:TYPE=value".
std::string ToString(const KeyValue& kv);

/// Set view of an ordered attribute list. A repeated key keeps its last
/// value.
opentelemetry::sdk::common::OrderedAttributeMap ToAttributeMap(
    const std::vector<KeyValue>& kvs);

}  // namespace metric_diff::metricdata
