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

REGISTER_COMPONENT_CODE(SC_CONFIG_PROVIDER, 0x0003)

DEFINE_ERROR_CODE(SC_CONFIG_PROVIDER_KEY_NOT_FOUND, SC_CONFIG_PROVIDER, 0x0001,
                  "Config provider cannot find the key")

DEFINE_ERROR_CODE(SC_CONFIG_PROVIDER_CANNOT_PARSE_CONFIG_FILE,
                  SC_CONFIG_PROVIDER, 0x0002,
                  "Config provider cannot load the config file")

DEFINE_ERROR_CODE(SC_CONFIG_PROVIDER_VALUE_TYPE_ERROR, SC_CONFIG_PROVIDER,
                  0x0003, "Config provider value type does not match")

}  // namespace metric_diff::core::errors
