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

#include "cc/core/comparison/src/diff_formatter.h"

#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace metric_diff::comparison {

std::string NotEqualStr(absl::string_view field, absl::string_view expected,
                        absl::string_view actual) {
  return absl::StrCat(field, " not equal:\nexpected: ", expected,
                      "\nactual: ", actual);
}

std::string MissingAttrStr(absl::string_view key) {
  return absl::StrCat("missing attribute ", key);
}

std::string PairDifferences(const std::vector<std::string>& reasons) {
  if (reasons.empty()) {
    return "";
  }
  return absl::StrCat("differences:\n", absl::StrJoin(reasons, "\n"), "\n");
}

}  // namespace metric_diff::comparison
