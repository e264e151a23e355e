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

#include "cc/core/interface/errors.h"

namespace metric_diff::core::errors {

REGISTER_COMPONENT_CODE(SC_METRIC_DIFF, 0x0234)

DEFINE_ERROR_CODE(SC_METRIC_DIFF_UNKNOWN_AGGREGATION_TYPE, SC_METRIC_DIFF,
                  0x0001, "Aggregation is not one of the known shapes")

DEFINE_ERROR_CODE(SC_METRIC_DIFF_INVALID_CONFIGURATION, SC_METRIC_DIFF, 0x0002,
                  "Comparison option in the configuration is not a boolean")

}  // namespace metric_diff::core::errors
