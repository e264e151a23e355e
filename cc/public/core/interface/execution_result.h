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

#ifndef MDIFF_CORE_INTERFACE_EXECUTION_RESULT_H_
#define MDIFF_CORE_INTERFACE_EXECUTION_RESULT_H_

#include <cstdint>
#include <type_traits>
#include <utility>
#include <variant>

namespace metric_diff::core {

/// Propagates a failed ExecutionResult to the caller.
#define RETURN_IF_FAILURE(__execution_result)                            \
  if (ExecutionResult __res = __execution_result; !__res.Successful()) { \
    return __res;                                                        \
  }

enum class ExecutionStatus {
  Success = 0,
  Failure = 1,
};

/// Component scoped code, see REGISTER_COMPONENT_CODE in errors.h.
typedef uint64_t StatusCode;
inline constexpr StatusCode SC_OK = 0;
inline constexpr StatusCode SC_UNKNOWN = 1;

/**
 * @brief Outcome of an infrastructure operation such as loading
 * configuration. Comparisons never fail this way: they report reasons.
 *
 * A default constructed result is an unknown failure.
 */
struct ExecutionResult {
  constexpr ExecutionResult() = default;

  constexpr ExecutionResult(ExecutionStatus status, StatusCode status_code)
      : status(status), status_code(status_code) {}

  bool operator==(const ExecutionResult& other) const {
    return status == other.status && status_code == other.status_code;
  }

  bool operator!=(const ExecutionResult& other) const {
    return !(*this == other);
  }

  bool Successful() const {
    return status == ExecutionStatus::Success && status_code == SC_OK;
  }

  explicit operator bool() const { return Successful(); }

  ExecutionStatus status = ExecutionStatus::Failure;
  StatusCode status_code = SC_UNKNOWN;
};

constexpr ExecutionResult SuccessExecutionResult() {
  return ExecutionResult(ExecutionStatus::Success, SC_OK);
}

/// A failed result carrying status_code.
class FailureExecutionResult : public ExecutionResult {
 public:
  explicit constexpr FailureExecutionResult(StatusCode status_code)
      : ExecutionResult(ExecutionStatus::Failure, status_code) {}
};

/**
 * @brief Either a value of type T or the ExecutionResult explaining why there
 * is none.
 *
 * Example:
 *   ExecutionResultOr<Options> options = LoadComparisonOptionsFromFile(path);
 *   if (!options.Successful()) {
 *     return options.result();
 *   }
 *   Use(*options);
 */
template <typename T>
class ExecutionResultOr {
 public:
  ExecutionResultOr() : state_(ExecutionResult()) {}

  ExecutionResultOr(const ExecutionResult& result) : state_(result) {}

  template <typename U = T,
            typename = std::enable_if_t<
                std::is_constructible_v<T, U&&> &&
                !std::is_base_of_v<ExecutionResult, std::decay_t<U>> &&
                !std::is_same_v<std::decay_t<U>, ExecutionResultOr>>>
  ExecutionResultOr(U&& value)
      : state_(std::in_place_index<1>, std::forward<U>(value)) {}

  /// True when a value is held.
  bool Successful() const { return has_value(); }

  /// The held failure, or SuccessExecutionResult() when a value is held.
  ExecutionResult result() const {
    if (const ExecutionResult* failure = std::get_if<0>(&state_)) {
      return *failure;
    }
    return SuccessExecutionResult();
  }

  bool has_value() const { return state_.index() == 1; }

  // value() and operator* throw std::bad_variant_access without a value.
  const T& value() const { return std::get<1>(state_); }
  T& value() { return std::get<1>(state_); }
  const T& operator*() const { return value(); }
  T& operator*() { return value(); }

  /// nullptr without a value.
  const T* operator->() const { return std::get_if<1>(&state_); }
  T* operator->() { return std::get_if<1>(&state_); }

 private:
  std::variant<ExecutionResult, T> state_;
};

}  // namespace metric_diff::core

#endif  // MDIFF_CORE_INTERFACE_EXECUTION_RESULT_H_
