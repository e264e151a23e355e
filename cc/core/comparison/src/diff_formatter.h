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

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "cc/core/comparison/src/diff_slices.h"
#include "cc/core/metricdata/src/metricdata_printer.h"

namespace metric_diff::comparison {

/// Returns "<field> not equal:\nexpected: <expected>\nactual: <actual>".
std::string NotEqualStr(absl::string_view field, absl::string_view expected,
                        absl::string_view actual);

/// Returns "missing attribute <key>".
std::string MissingAttrStr(absl::string_view key);

/// Returns "differences:\n" followed by one reason per line, or an empty
/// string for no reasons. Appended to a CompareDiff block to detail its only
/// unmatched pair.
std::string PairDifferences(const std::vector<std::string>& reasons);

/**
 * @brief Renders the unmatched elements of a multiset comparison.
 *
 * Unmatched expected elements are listed under "missing expected values:" and
 * unmatched actual elements under "unexpected additional values:", one
 * rendered element per line. Returns an empty string when both sides matched
 * completely.
 */
template <typename T>
std::string CompareDiff(const SliceDiff<T>& diff) {
  using metricdata::ToString;

  std::string msg;
  if (!diff.extra_expected.empty()) {
    absl::StrAppend(&msg, "missing expected values:\n");
    for (const T* v : diff.extra_expected) {
      absl::StrAppend(&msg, ToString(*v), "\n");
    }
  }

  if (!diff.extra_actual.empty()) {
    absl::StrAppend(&msg, "unexpected additional values:\n");
    for (const T* v : diff.extra_actual) {
      absl::StrAppend(&msg, ToString(*v), "\n");
    }
  }
  return msg;
}

}  // namespace metric_diff::comparison
