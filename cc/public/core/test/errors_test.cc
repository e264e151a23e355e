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

#include <gtest/gtest.h>

#include <string>

#include "cc/core/comparison/src/error_codes.h"
#include "cc/core/config_provider/src/error_codes.h"

namespace metric_diff::core::errors {
/// Registers component code as 0x0214 for test-only errors.
REGISTER_COMPONENT_CODE(SC_ERRORS_TEST, 0x0214)

DEFINE_ERROR_CODE(SC_ERRORS_TEST_INTERNAL_ERROR, SC_ERRORS_TEST, 0x0001,
                  "Internal Error in errors test")

}  // namespace metric_diff::core::errors

namespace metric_diff::core::test {
TEST(ErrorsTest, GetErrorMessageSuccessfully) {
  EXPECT_EQ(std::string(errors::GetErrorMessage(
                errors::SC_ERRORS_TEST_INTERNAL_ERROR)),
            "Internal Error in errors test");
}

TEST(ErrorsTest, ComponentCodeIsEmbedded) {
  EXPECT_EQ(EXTRACT_COMPONENT_CODE(errors::SC_ERRORS_TEST_INTERNAL_ERROR),
            errors::SC_ERRORS_TEST);
  EXPECT_EQ(
      EXTRACT_COMPONENT_CODE(errors::SC_METRIC_DIFF_UNKNOWN_AGGREGATION_TYPE),
      errors::SC_METRIC_DIFF);
}

TEST(ErrorsTest, RegisteredComponentMessages) {
  EXPECT_EQ(std::string(errors::GetErrorMessage(
                errors::SC_CONFIG_PROVIDER_KEY_NOT_FOUND)),
            "Config provider cannot find the key");
  EXPECT_EQ(std::string(errors::GetErrorMessage(
                errors::SC_METRIC_DIFF_UNKNOWN_AGGREGATION_TYPE)),
            "Aggregation is not one of the known shapes");
}

TEST(ErrorsTest, SuccessAndUnknownCodes) {
  EXPECT_EQ(std::string(errors::GetErrorMessage(SC_OK)), "Success");
  EXPECT_EQ(std::string(errors::GetErrorMessage(
                MAKE_ERROR_CODE(errors::SC_ERRORS_TEST, 0x0099))),
            "Unknown error");
  EXPECT_EQ(std::string(errors::GetErrorMessage(0xFFFF0001)), "Unknown error");
}
}  // namespace metric_diff::core::test
