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

#include "cc/core/metricdata/src/attribute_utils.h"

#include <charconv>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "opentelemetry/nostd/variant.h"

namespace metric_diff::metricdata {

namespace {

using ::opentelemetry::sdk::common::OrderedAttributeMap;
using ::opentelemetry::sdk::common::OwnedAttributeValue;

struct TypeNameVisitor {
  absl::string_view operator()(bool) const { return "BOOL"; }
  absl::string_view operator()(int32_t) const { return "INT32"; }
  absl::string_view operator()(uint32_t) const { return "UINT32"; }
  absl::string_view operator()(int64_t) const { return "INT64"; }
  absl::string_view operator()(uint64_t) const { return "UINT64"; }
  absl::string_view operator()(double) const { return "FLOAT64"; }
  absl::string_view operator()(const std::string&) const { return "STRING"; }
  absl::string_view operator()(const std::vector<bool>&) const {
    return "BOOLSLICE";
  }
  absl::string_view operator()(const std::vector<int32_t>&) const {
    return "INT32SLICE";
  }
  absl::string_view operator()(const std::vector<uint32_t>&) const {
    return "UINT32SLICE";
  }
  absl::string_view operator()(const std::vector<int64_t>&) const {
    return "INT64SLICE";
  }
  absl::string_view operator()(const std::vector<uint64_t>&) const {
    return "UINT64SLICE";
  }
  absl::string_view operator()(const std::vector<double>&) const {
    return "FLOAT64SLICE";
  }
  absl::string_view operator()(const std::vector<std::string>&) const {
    return "STRINGSLICE";
  }
  absl::string_view operator()(const std::vector<uint8_t>&) const {
    return "UINT8SLICE";
  }
};

template <typename E>
std::string EmitScalar(const E& v) {
  if constexpr (std::is_same_v<E, bool>) {
    return v ? "true" : "false";
  } else if constexpr (std::is_same_v<E, std::string>) {
    return v;
  } else if constexpr (std::is_floating_point_v<E>) {
    return FormatFloat64(v);
  } else if constexpr (std::is_signed_v<E>) {
    return absl::StrCat(static_cast<int64_t>(v));
  } else {
    return absl::StrCat(static_cast<uint64_t>(v));
  }
}

template <typename T>
struct IsVector : std::false_type {};
template <typename T>
struct IsVector<std::vector<T>> : std::true_type {};

void AppendEscaped(std::string* out, absl::string_view text) {
  for (char c : text) {
    if (c == '\\' || c == ',' || c == '=') {
      out->push_back('\\');
    }
    out->push_back(c);
  }
}

}  // namespace

std::string FormatFloat64(double value) {
  char buffer[64];
  auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
  if (ec != std::errc()) {
    return absl::StrCat(value);
  }
  return std::string(buffer, end);
}

absl::string_view AttributeTypeName(const OwnedAttributeValue& value) {
  return opentelemetry::nostd::visit(TypeNameVisitor{}, value);
}

std::string Emit(const OwnedAttributeValue& value) {
  return opentelemetry::nostd::visit(
      [](const auto& v) -> std::string {
        using V = std::decay_t<decltype(v)>;
        if constexpr (IsVector<V>::value) {
          std::vector<std::string> parts;
          parts.reserve(v.size());
          for (const typename V::value_type e : v) {
            parts.push_back(EmitScalar(e));
          }
          return absl::StrCat("[", absl::StrJoin(parts, ","), "]");
        } else {
          return EmitScalar(v);
        }
      },
      value);
}

std::string Encoded(const OrderedAttributeMap& attributes) {
  return absl::StrJoin(
      attributes, ",", [](std::string* out, const auto& attribute) {
        AppendEscaped(out, attribute.first);
        out->push_back('=');
        AppendEscaped(out, Emit(attribute.second));
      });
}

std::string ToString(const KeyValue& kv) {
  return absl::StrCat(kv.first, ":", AttributeTypeName(kv.second), "=",
                      Emit(kv.second));
}

OrderedAttributeMap ToAttributeMap(const std::vector<KeyValue>& kvs) {
  OrderedAttributeMap attributes;
  for (const auto& [key, value] : kvs) {
    attributes[key] = value;
  }
  return attributes;
}

}  // namespace metric_diff::metricdata
