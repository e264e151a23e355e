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

#include <initializer_list>
#include <string>

namespace metric_diff::comparison {

/// A field group that a comparison may skip.
enum class Option {
  /// Skip start and observation timestamps of data points and exemplars.
  kIgnoreTimestamp,
  /// Skip the numeric payload: data point values, histogram counts, bounds,
  /// bucket counts, extrema, sums, scales, zero counts and exponential
  /// buckets, and exemplar values.
  kIgnoreValue,
  /// Skip exemplars of data points.
  kIgnoreExemplars,
};

/**
 * @brief Immutable ignore policy threaded through every comparison. Identity
 * fields, attributes, temporality and monotonicity are always compared.
 */
class Options {
 public:
  Options() = default;

  Options(std::initializer_list<Option> options) {
    for (Option option : options) {
      Enable(option);
    }
  }

  /// Returns a copy of this policy with option also enabled.
  Options With(Option option) const {
    Options options = *this;
    options.Enable(option);
    return options;
  }

  bool ignore_timestamp() const { return ignore_timestamp_; }
  bool ignore_value() const { return ignore_value_; }
  bool ignore_exemplars() const { return ignore_exemplars_; }

  bool operator==(const Options& other) const {
    return ignore_timestamp_ == other.ignore_timestamp_ &&
           ignore_value_ == other.ignore_value_ &&
           ignore_exemplars_ == other.ignore_exemplars_;
  }

 private:
  void Enable(Option option) {
    switch (option) {
      case Option::kIgnoreTimestamp:
        ignore_timestamp_ = true;
        break;
      case Option::kIgnoreValue:
        ignore_value_ = true;
        break;
      case Option::kIgnoreExemplars:
        ignore_exemplars_ = true;
        break;
    }
  }

  bool ignore_timestamp_ = false;
  bool ignore_value_ = false;
  bool ignore_exemplars_ = false;
};

}  // namespace metric_diff::comparison
