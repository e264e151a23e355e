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

#include "cc/core/logger/src/logger.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "cc/core/logger/mock/mock_log_provider.h"
#include "cc/public/core/test/interface/execution_result_test_lib.h"

using ::testing::EndsWith;
using ::testing::MatchesRegex;
using ::testing::HasSubstr;
using ::testing::SizeIs;

namespace metric_diff::core::test {

TEST(LoggerTest, ForwardsEveryLevelToProvider) {
  auto mock_log_provider = std::make_unique<MockLogProvider>();
  auto messages = mock_log_provider->messages_;
  Logger logger(std::move(mock_log_provider));
  EXPECT_THAT(logger.Init(), IsSuccessful());
  EXPECT_THAT(logger.Run(), IsSuccessful());

  logger.Debug("Component", "file.cc:Func:10", "debug line");
  logger.Info("Component", "file.cc:Func:11", "info line");
  logger.Warning("Component", "file.cc:Func:12", "warning line");
  logger.Error("Component", "file.cc:Func:13", "error line");
  logger.Critical("Component", "file.cc:Func:14", "critical line");
  logger.Alert("Component", "file.cc:Func:15", "alert line");
  logger.Emergency("Component", "file.cc:Func:16", "emergency line");

  ASSERT_THAT(*messages, SizeIs(7));
  EXPECT_THAT(messages->at(0),
              EndsWith("|Component|file.cc:Func:10|1: debug line"));
  EXPECT_THAT(messages->at(3), EndsWith("|4: error line"));
  EXPECT_THAT(messages->at(6), EndsWith("|7: emergency line"));
  EXPECT_THAT(logger.Stop(), IsSuccessful());
}

TEST(LoggerTest, ConsoleFormatStartsWithTimestamp) {
  MockLogProvider provider;
  provider.Log(LogLevel::kInfo, "Comp", "a.cc:F:1", "hello");
  ASSERT_THAT(*provider.messages_, SizeIs(1));
  const std::string& line = provider.messages_->front();
  EXPECT_THAT(line, HasSubstr("|Comp|a.cc:F:1|2: hello"));
  EXPECT_NE(line.find('.'), std::string::npos);
  EXPECT_LT(line.find('.'), line.find('|'));
}

TEST(LoggerTest, WithoutProviderDropsLines) {
  Logger logger(nullptr);
  EXPECT_THAT(logger.Init(), IsSuccessful());
  logger.Error("Component", "file.cc:Func:1", "dropped");
  EXPECT_THAT(logger.Stop(), IsSuccessful());
}

TEST(LoggerTest, ConsoleProviderPadsNanoseconds) {
  std::ostringstream out;
  ConsoleLogProvider provider(out);
  provider.Log(LogLevel::kWarning, "Comp", "a.cc:F:2", "careful");
  EXPECT_THAT(out.str(),
              MatchesRegex("[0-9]+\\.[0-9]{9}"
                           "\\|Comp\\|a\\.cc:F:2\\|3: careful\n"));
}

}  // namespace metric_diff::core::test
