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
#include "cc/core/logger/src/log_providers/console_log_provider.h"

#include <cstdint>
#include <string>
#include <string_view>

#include "absl/strings/str_format.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace metric_diff::core {

ExecutionResult ConsoleLogProvider::Init() noexcept {
  return SuccessExecutionResult();
}

ExecutionResult ConsoleLogProvider::Run() noexcept {
  return SuccessExecutionResult();
}

ExecutionResult ConsoleLogProvider::Stop() noexcept {
  return SuccessExecutionResult();
}

void ConsoleLogProvider::Log(const LogLevel& level,
                             const std::string_view& component_name,
                             const std::string_view& location,
                             const std::string_view& message) noexcept {
  absl::Duration since_epoch = absl::Now() - absl::UnixEpoch();
  int64_t seconds = absl::IDivDuration(since_epoch, absl::Seconds(1),
                                       &since_epoch);
  int64_t nanos = absl::ToInt64Nanoseconds(since_epoch);
  Print(absl::StrFormat("%d.%09d|%s|%s|%d: %s", seconds, nanos,
                        component_name, location, static_cast<int>(level),
                        message));
}

void ConsoleLogProvider::Print(const std::string& output) noexcept {
  out_ << output << '\n';
}
}  // namespace metric_diff::core
