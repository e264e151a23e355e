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

#include "cc/core/comparison/src/comparison_configuration.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "cc/core/common/global_logger/src/global_logger.h"
#include "cc/core/config_provider/mock/mock_config_provider.h"
#include "cc/core/config_provider/src/error_codes.h"
#include "cc/core/logger/mock/mock_log_provider.h"
#include "cc/core/logger/src/logger.h"
#include "cc/public/core/test/interface/execution_result_test_lib.h"

using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;

namespace metric_diff::comparison::test {
namespace {

using core::FailureExecutionResult;
using core::MockConfigProvider;
using core::test::IsSuccessful;
using core::test::ResultIs;

TEST(OptionsTest, DefaultComparesEverything) {
  Options options;
  EXPECT_FALSE(options.ignore_timestamp());
  EXPECT_FALSE(options.ignore_value());
  EXPECT_FALSE(options.ignore_exemplars());
  EXPECT_EQ(options, Options{});
}

TEST(OptionsTest, WithLeavesTheOriginalUntouched) {
  Options base{Option::kIgnoreValue};
  Options extended = base.With(Option::kIgnoreExemplars);
  EXPECT_TRUE(extended.ignore_value());
  EXPECT_TRUE(extended.ignore_exemplars());
  EXPECT_FALSE(base.ignore_exemplars());
  EXPECT_EQ(extended,
            Options({Option::kIgnoreExemplars, Option::kIgnoreValue}));
  EXPECT_EQ(base.With(Option::kIgnoreValue), base);
}

TEST(GetConfigValueTest, FallsBackToDefault) {
  MockConfigProvider config;
  config.SetInt32("retries", 4);
  EXPECT_EQ(GetConfigValue<int32_t>("retries", 1, config), 4);
  EXPECT_EQ(GetConfigValue<int32_t>("absent", 1, config), 1);
  EXPECT_EQ(GetConfigValue<std::string>("absent", "x", config), "x");
}

class ComparisonConfigurationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto mock_log_provider = std::make_unique<core::MockLogProvider>();
    messages_ = mock_log_provider->messages_;
    core::common::GlobalLogger::SetGlobalLogger(
        std::make_unique<core::Logger>(std::move(mock_log_provider)));
  }

  void TearDown() override {
    core::common::GlobalLogger::SetGlobalLogger(nullptr);
  }

  std::filesystem::path WriteConfig(const std::string& name,
                                    const std::string& content) {
    std::filesystem::path path =
        std::filesystem::path(::testing::TempDir()) / name;
    std::ofstream file(path);
    file << content;
    return path;
  }

  std::shared_ptr<std::vector<std::string>> messages_;
};

TEST_F(ComparisonConfigurationTest, AbsentKeysTakeDefaults) {
  MockConfigProvider config;
  EXPECT_EQ(LoadComparisonOptions(config), Options());
  EXPECT_THAT(*messages_, IsEmpty());
}

TEST_F(ComparisonConfigurationTest, ReadsEveryFlag) {
  MockConfigProvider config;
  config.SetBool(std::string(kIgnoreTimestampKey), true);
  config.SetBool(std::string(kIgnoreValueKey), false);
  config.SetBool(std::string(kIgnoreExemplarsKey), true);

  Options options = LoadComparisonOptions(config);
  EXPECT_EQ(options,
            Options({Option::kIgnoreTimestamp, Option::kIgnoreExemplars}));
  EXPECT_THAT(*messages_,
              Contains(HasSubstr("Loaded metric_diff_ignore_timestamp = true")));
  EXPECT_THAT(*messages_,
              Contains(HasSubstr("Loaded metric_diff_ignore_value = false")));
}

TEST_F(ComparisonConfigurationTest, LoadsFromFile) {
  auto options = LoadComparisonOptionsFromFile(WriteConfig(
      "comparison_options.json",
      R"({"metric_diff_ignore_value": true, "unrelated": 3})"));
  ASSERT_THAT(options, IsSuccessful());
  EXPECT_EQ(*options, Options({Option::kIgnoreValue}));
}

TEST_F(ComparisonConfigurationTest, NonBooleanFlagIsLoggedAndDefaulted) {
  auto options = LoadComparisonOptionsFromFile(WriteConfig(
      "comparison_options_typo.json",
      R"({"metric_diff_ignore_exemplars": "yes"})"));
  ASSERT_THAT(options, IsSuccessful());
  EXPECT_FALSE(options->ignore_exemplars());
  EXPECT_THAT(*messages_,
              Contains(HasSubstr("|ComparisonConfiguration|")));
  EXPECT_THAT(*messages_,
              Contains(HasSubstr("Cannot read metric_diff_ignore_exemplars")));
}

TEST_F(ComparisonConfigurationTest, UnparsableFileIsAFailure) {
  auto options = LoadComparisonOptionsFromFile(
      WriteConfig("comparison_options_broken.json", "{"));
  EXPECT_THAT(options,
              ResultIs(FailureExecutionResult(
                  core::errors::SC_CONFIG_PROVIDER_CANNOT_PARSE_CONFIG_FILE)));
  EXPECT_THAT(*messages_, Not(IsEmpty()));
}

}  // namespace
}  // namespace metric_diff::comparison::test
