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

#include <cstddef>
#include <vector>

#include "absl/types/span.h"

namespace metric_diff::comparison {

/// Elements left unmatched by DiffSlices. The pointers borrow from the
/// compared sequences.
template <typename T>
struct SliceDiff {
  std::vector<const T*> extra_expected;
  std::vector<const T*> extra_actual;

  bool empty() const { return extra_expected.empty() && extra_actual.empty(); }
};

/**
 * @brief Matches two sequences as multisets.
 *
 * Each element of expected, in order, consumes the first not yet consumed
 * element of actual for which equal(expected_element, actual_element) holds.
 * Expected elements without a partner and actual elements never consumed are
 * returned in input order. The matching is greedy and does not backtrack, so a
 * predicate that is not an equivalence can make the result order dependent.
 * Runs in O(|expected| * |actual|) predicate calls.
 *
 * @param expected the expected sequence.
 * @param actual the actual sequence.
 * @param equal pairwise predicate, called as equal(expected, actual).
 * @return SliceDiff<T> the unmatched elements of both sides.
 */
template <typename T, typename Equal>
SliceDiff<T> DiffSlices(absl::Span<const T> expected,
                        absl::Span<const T> actual, Equal equal) {
  SliceDiff<T> diff;
  std::vector<bool> visited(actual.size(), false);
  for (const T& a : expected) {
    bool found = false;
    for (size_t j = 0; j < actual.size(); ++j) {
      if (visited[j]) {
        continue;
      }
      if (equal(a, actual[j])) {
        visited[j] = true;
        found = true;
        break;
      }
    }
    if (!found) {
      diff.extra_expected.push_back(&a);
    }
  }

  for (size_t j = 0; j < actual.size(); ++j) {
    if (!visited[j]) {
      diff.extra_actual.push_back(&actual[j]);
    }
  }
  return diff;
}

}  // namespace metric_diff::comparison
