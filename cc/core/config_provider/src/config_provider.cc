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

#include "cc/core/config_provider/src/config_provider.h"

#include <cstdint>
#include <fstream>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>

namespace metric_diff::core {
namespace {

// The JSON integer must be representable as T without narrowing.
template <typename T>
bool FitsInteger(const nlohmann::json& value) {
  if (value.is_number_unsigned()) {
    return value.get<uint64_t>() <=
           static_cast<uint64_t>(std::numeric_limits<T>::max());
  }
  if constexpr (std::is_unsigned_v<T>) {
    return false;
  } else {
    int64_t v = value.get<int64_t>();
    return v >= std::numeric_limits<T>::min() &&
           v <= std::numeric_limits<T>::max();
  }
}

}  // namespace

ExecutionResult ConfigProvider::Init() noexcept {
  std::ifstream config_stream(config_file_);
  if (!config_stream.is_open()) {
    return FailureExecutionResult(
        errors::SC_CONFIG_PROVIDER_CANNOT_PARSE_CONFIG_FILE);
  }

  nlohmann::json parsed = nlohmann::json::parse(config_stream, nullptr,
                                                /*allow_exceptions=*/false);
  // Option keys live at the top level; arrays and scalars cannot hold them.
  if (parsed.is_discarded() || !parsed.is_object()) {
    return FailureExecutionResult(
        errors::SC_CONFIG_PROVIDER_CANNOT_PARSE_CONFIG_FILE);
  }
  options_ = std::move(parsed);
  return SuccessExecutionResult();
}

ExecutionResult ConfigProvider::Run() noexcept {
  return SuccessExecutionResult();
}

ExecutionResult ConfigProvider::Stop() noexcept {
  return SuccessExecutionResult();
}

template <typename T>
ExecutionResult ConfigProvider::ReadTyped(const ConfigKey& key,
                                          T& out) const noexcept {
  if (!options_.is_object() || !options_.contains(key)) {
    return FailureExecutionResult(errors::SC_CONFIG_PROVIDER_KEY_NOT_FOUND);
  }

  const nlohmann::json& value = options_.at(key);
  bool type_matches = false;
  if constexpr (std::is_same_v<T, bool>) {
    type_matches = value.is_boolean();
  } else if constexpr (std::is_same_v<T, std::string>) {
    type_matches = value.is_string();
  } else if constexpr (std::is_same_v<T, double>) {
    type_matches = value.is_number();
  } else if constexpr (std::is_unsigned_v<T>) {
    type_matches = value.is_number_unsigned() && FitsInteger<T>(value);
  } else {
    type_matches = value.is_number_integer() && FitsInteger<T>(value);
  }
  // A bool is never read from 1 or "true", nor an integer from 2.5 or from a
  // value outside the range of T.
  if (!type_matches) {
    return FailureExecutionResult(errors::SC_CONFIG_PROVIDER_VALUE_TYPE_ERROR);
  }
  out = value.get<T>();
  return SuccessExecutionResult();
}

ExecutionResult ConfigProvider::Get(const ConfigKey& key,
                                    std::string& out) noexcept {
  return ReadTyped(key, out);
}

ExecutionResult ConfigProvider::Get(const ConfigKey& key,
                                    size_t& out) noexcept {
  return ReadTyped(key, out);
}

ExecutionResult ConfigProvider::Get(const ConfigKey& key,
                                    int32_t& out) noexcept {
  return ReadTyped(key, out);
}

ExecutionResult ConfigProvider::Get(const ConfigKey& key, bool& out) noexcept {
  return ReadTyped(key, out);
}

ExecutionResult ConfigProvider::Get(const ConfigKey& key,
                                    double& out) noexcept {
  return ReadTyped(key, out);
}

}  // namespace metric_diff::core
