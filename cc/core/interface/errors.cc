/*
 * Copyright 2024 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "cc/core/interface/errors.h"

#include <cstdint>
#include <map>

namespace metric_diff::core::errors {

namespace {
constexpr char kUnknownErrorMessage[] = "Unknown error";
constexpr char kSuccessMessage[] = "Success";
}  // namespace

std::map<uint64_t, std::map<uint64_t, SCPError>>& GetGlobalErrorCodes() {
  /// Defines global_error_codes to store all error codes.
  static std::map<uint64_t, std::map<uint64_t, SCPError>> global_error_codes;
  return global_error_codes;
}

const char* GetErrorMessage(uint64_t error_code) {
  if (error_code == SC_OK) {
    return kSuccessMessage;
  }

  const auto& global_error_codes = GetGlobalErrorCodes();
  auto component = global_error_codes.find(EXTRACT_COMPONENT_CODE(error_code));
  if (component == global_error_codes.end()) {
    return kUnknownErrorMessage;
  }

  auto error = component->second.find(error_code);
  if (error == component->second.end()) {
    return kUnknownErrorMessage;
  }
  return error->second.error_message.c_str();
}

}  // namespace metric_diff::core::errors
