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

#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "cc/public/core/interface/execution_result.h"

namespace metric_diff::core::errors {

/// Error entry registered for a status code.
struct SCPError {
  std::string error_message;
};

/**
 * @brief Returns the registry of all error codes, keyed by component code and
 * then by the full status code.
 */
std::map<uint64_t, std::map<uint64_t, SCPError>>& GetGlobalErrorCodes();

/// Registers a component code. Every status code embeds its component code in
/// the upper bits.
#define REGISTER_COMPONENT_CODE(component_name, component_code) \
  inline constexpr uint64_t component_name = component_code;

#define MAKE_ERROR_CODE(component, error) ((component << 16) | error)

#define EXTRACT_COMPONENT_CODE(error_code) ((error_code >> 16) & 0xFFFF)

/// Defines a status code for a component and registers its message at static
/// initialization time.
#define DEFINE_ERROR_CODE(error_name, component, error, message)          \
  inline constexpr uint64_t error_name = MAKE_ERROR_CODE(component, error); \
  inline const bool error_name##_registered = [] {                         \
    ::metric_diff::core::errors::GetGlobalErrorCodes()[component]          \
                                                     [error_name] =        \
        ::metric_diff::core::errors::SCPError{message};                    \
    return true;                                                           \
  }();

/**
 * @brief Returns the message registered for the status code, or a generic
 * message when the code was never registered.
 *
 * @param error_code the status code.
 * @return const char* the error message.
 */
const char* GetErrorMessage(uint64_t error_code);

}  // namespace metric_diff::core::errors
