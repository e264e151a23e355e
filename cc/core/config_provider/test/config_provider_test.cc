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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <cstdint>
#include <fstream>
#include <limits>
#include <string>

#include "cc/core/config_provider/mock/mock_config_provider.h"
#include "cc/core/config_provider/src/error_codes.h"
#include "cc/public/core/test/interface/execution_result_test_lib.h"

namespace metric_diff::core::test {

class ConfigProviderTest : public ::testing::Test {
 protected:
  std::filesystem::path WriteConfig(const std::string& name,
                                    const std::string& content) {
    std::filesystem::path path =
        std::filesystem::path(::testing::TempDir()) / name;
    std::ofstream file(path);
    file << content;
    return path;
  }
};

TEST_F(ConfigProviderTest, ReadsTypedValues) {
  ConfigProvider config(WriteConfig("typed.json", R"({
    "name": "metric_diff",
    "workers": 8,
    "offset": -3,
    "enabled": true,
    "ratio": 0.25
  })"));
  ASSERT_THAT(config.Init(), IsSuccessful());

  std::string name;
  size_t workers = 0;
  int32_t offset = 0;
  bool enabled = false;
  double ratio = 0;
  EXPECT_THAT(config.Get("name", name), IsSuccessful());
  EXPECT_THAT(config.Get("workers", workers), IsSuccessful());
  EXPECT_THAT(config.Get("offset", offset), IsSuccessful());
  EXPECT_THAT(config.Get("enabled", enabled), IsSuccessful());
  EXPECT_THAT(config.Get("ratio", ratio), IsSuccessful());
  EXPECT_EQ(name, "metric_diff");
  EXPECT_EQ(workers, 8u);
  EXPECT_EQ(offset, -3);
  EXPECT_TRUE(enabled);
  EXPECT_EQ(ratio, 0.25);
}

TEST_F(ConfigProviderTest, MissingKeyAndWrongType) {
  ConfigProvider config(WriteConfig("flags.json", R"({"flag": "yes"})"));
  ASSERT_THAT(config.Init(), IsSuccessful());

  bool flag = false;
  EXPECT_THAT(config.Get("flag", flag),
              ResultIs(FailureExecutionResult(
                  errors::SC_CONFIG_PROVIDER_VALUE_TYPE_ERROR)));
  EXPECT_THAT(
      config.Get("absent", flag),
      ResultIs(FailureExecutionResult(errors::SC_CONFIG_PROVIDER_KEY_NOT_FOUND)));
  EXPECT_FALSE(flag);
}

TEST_F(ConfigProviderTest, UnparsableFile) {
  ConfigProvider config(WriteConfig("broken.json", "{not json"));
  EXPECT_THAT(config.Init(),
              ResultIs(FailureExecutionResult(
                  errors::SC_CONFIG_PROVIDER_CANNOT_PARSE_CONFIG_FILE)));
}

TEST_F(ConfigProviderTest, TopLevelMustBeAnObject) {
  ConfigProvider config(WriteConfig("array.json", "[true, false]"));
  EXPECT_THAT(config.Init(),
              ResultIs(FailureExecutionResult(
                  errors::SC_CONFIG_PROVIDER_CANNOT_PARSE_CONFIG_FILE)));
}

TEST_F(ConfigProviderTest, MissingFile) {
  ConfigProvider config(std::filesystem::path(::testing::TempDir()) /
                        "does_not_exist.json");
  EXPECT_THAT(config.Init(),
              ResultIs(FailureExecutionResult(
                  errors::SC_CONFIG_PROVIDER_CANNOT_PARSE_CONFIG_FILE)));

  bool flag = true;
  EXPECT_THAT(
      config.Get("flag", flag),
      ResultIs(FailureExecutionResult(errors::SC_CONFIG_PROVIDER_KEY_NOT_FOUND)));
}

TEST_F(ConfigProviderTest, NumbersAreNotCoerced) {
  ConfigProvider config(WriteConfig("numbers.json", R"({
    "flag": 1,
    "ratio": 2,
    "count": -1,
    "offset": 2.5
  })"));
  ASSERT_THAT(config.Init(), IsSuccessful());

  bool flag = false;
  double ratio = 0;
  size_t count = 0;
  int32_t offset = 0;
  EXPECT_THAT(config.Get("flag", flag),
              ResultIs(FailureExecutionResult(
                  errors::SC_CONFIG_PROVIDER_VALUE_TYPE_ERROR)));
  EXPECT_THAT(config.Get("ratio", ratio), IsSuccessful());
  EXPECT_EQ(ratio, 2.0);
  EXPECT_THAT(config.Get("count", count),
              ResultIs(FailureExecutionResult(
                  errors::SC_CONFIG_PROVIDER_VALUE_TYPE_ERROR)));
  EXPECT_THAT(config.Get("offset", offset),
              ResultIs(FailureExecutionResult(
                  errors::SC_CONFIG_PROVIDER_VALUE_TYPE_ERROR)));
}

TEST_F(ConfigProviderTest, Int32OutOfRangeIsATypeError) {
  ConfigProvider config(WriteConfig("ranges.json", R"({
    "too_big": 2147483648,
    "too_small": -2147483649,
    "huge": 18446744073709551615,
    "max": 2147483647,
    "min": -2147483648
  })"));
  ASSERT_THAT(config.Init(), IsSuccessful());

  for (const char* key : {"too_big", "too_small", "huge"}) {
    int32_t out = 7;
    EXPECT_THAT(config.Get(key, out),
                ResultIs(FailureExecutionResult(
                    errors::SC_CONFIG_PROVIDER_VALUE_TYPE_ERROR)))
        << key;
    EXPECT_EQ(out, 7) << key;
  }

  int32_t max = 0;
  int32_t min = 0;
  EXPECT_THAT(config.Get("max", max), IsSuccessful());
  EXPECT_THAT(config.Get("min", min), IsSuccessful());
  EXPECT_EQ(max, std::numeric_limits<int32_t>::max());
  EXPECT_EQ(min, std::numeric_limits<int32_t>::min());

  size_t huge = 0;
  EXPECT_THAT(config.Get("huge", huge), IsSuccessful());
  EXPECT_EQ(huge, std::numeric_limits<size_t>::max());
}

TEST(MockConfigProviderTest, SetAndGet) {
  MockConfigProvider config;
  config.SetBool("flag", true);
  config.Set("name", "value");

  bool flag = false;
  std::string name;
  EXPECT_THAT(config.Get("flag", flag), IsSuccessful());
  EXPECT_THAT(config.Get("name", name), IsSuccessful());
  EXPECT_TRUE(flag);
  EXPECT_EQ(name, "value");

  double ratio = 1;
  EXPECT_THAT(
      config.Get("flag", ratio),
      ResultIs(FailureExecutionResult(errors::SC_CONFIG_PROVIDER_KEY_NOT_FOUND)));
  EXPECT_EQ(ratio, 1);
}

}  // namespace metric_diff::core::test
