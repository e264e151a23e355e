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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "cc/core/common/global_logger/src/global_logger.h"
#include "cc/core/comparison/src/comparisons.h"
#include "cc/core/comparison/src/options.h"
#include "cc/core/comparison/test/test_metricdata.h"
#include "cc/core/logger/mock/mock_log_provider.h"
#include "cc/core/logger/src/logger.h"

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;
using ::testing::SizeIs;
using ::testing::StartsWith;

namespace metric_diff::comparison::test {
namespace {

using metricdata::Aggregation;
using metricdata::DataPoint;
using metricdata::ExponentialHistogram;
using metricdata::Gauge;
using metricdata::Histogram;
using metricdata::Sum;
using metricdata::Temporality;

template <typename N>
std::vector<DataPoint<N>> TwoPoints() {
  return {MakeDataPoint<N>({StringAttr("host", "a")}, N(1)),
          MakeDataPoint<N>({StringAttr("host", "b")}, N(2))};
}

// Converting to a Gauge throws, which leaves an Aggregation being assigned
// without a value.
struct ThrowsOnConversion {
  operator Gauge<int64_t>() const { throw std::runtime_error("no gauge"); }
};

Aggregation ValuelessAggregation() {
  Aggregation aggregation = Gauge<int64_t>{};
  try {
    aggregation.emplace<Gauge<int64_t>>(ThrowsOnConversion{});
  } catch (const std::runtime_error&) {
  }
  return aggregation;
}

TEST(AggregationComparisonTest, AbsentAggregations) {
  EXPECT_THAT(EqualAggregations(Aggregation(), Aggregation(), {}), IsEmpty());
  EXPECT_THAT(EqualAggregations(Aggregation(), Gauge<int64_t>{}, {}),
              ElementsAre("Aggregation not equal:\nexpected: <nil>\n"
                          "actual: Gauge[int64]{DataPoints: []}"));
  EXPECT_THAT(EqualAggregations(Sum<double>{}, Aggregation(), {}),
              ElementsAre(StartsWith("Aggregation not equal:\nexpected: "
                                     "Sum[float64]{")));
}

TEST(AggregationComparisonTest, ShapesAreDiscriminated) {
  Gauge<int64_t> gauge{.data_points = TwoPoints<int64_t>()};
  Sum<int64_t> sum{.data_points = TwoPoints<int64_t>()};
  EXPECT_THAT(EqualAggregations(gauge, sum, {}),
              ElementsAre("Aggregation types not equal:\n"
                          "expected: Gauge[int64]\nactual: Sum[int64]"));

  Options ignore_all = {Option::kIgnoreTimestamp, Option::kIgnoreValue,
                        Option::kIgnoreExemplars};
  EXPECT_THAT(EqualAggregations(gauge, sum, ignore_all), SizeIs(1));
}

TEST(AggregationComparisonTest, NumberKindsAreDiscriminated) {
  Sum<int64_t> int_sum{.data_points = TwoPoints<int64_t>(),
                       .temporality = Temporality::kCumulative};
  Sum<double> float_sum{.data_points = TwoPoints<double>(),
                        .temporality = Temporality::kCumulative};
  EXPECT_THAT(EqualAggregations(int_sum, float_sum, {}),
              ElementsAre("Aggregation types not equal:\n"
                          "expected: Sum[int64]\nactual: Sum[float64]"));
  EXPECT_THAT(EqualAggregations(Histogram<double>{}, Histogram<int64_t>{}, {}),
              SizeIs(1));
}

TEST(AggregationComparisonTest, MatchingShapesAreComparedInDepth) {
  EXPECT_THAT(EqualAggregations(Gauge<double>{.data_points = TwoPoints<double>()},
                                Gauge<double>{.data_points = TwoPoints<double>()},
                                {}),
              IsEmpty());

  Aggregation a = Gauge<int64_t>{.data_points = {MakeDataPoint<int64_t>({}, 1)}};
  Aggregation b = Gauge<int64_t>{.data_points = {MakeDataPoint<int64_t>({}, 2)}};
  std::vector<std::string> reasons = EqualAggregations(a, b, {});
  ASSERT_THAT(reasons, SizeIs(2));
  EXPECT_EQ(reasons[0], "Gauge[int64] not equal:");
  EXPECT_THAT(reasons[1], StartsWith("Gauge DataPoints not equal:\n"));
  EXPECT_THAT(reasons[1],
              HasSubstr("differences:\nValue not equal:\nexpected: 1\n"
                        "actual: 2\n"));
}

TEST(GaugeComparisonTest, DataPointsAreAMultiset) {
  std::vector<DataPoint<int64_t>> points = TwoPoints<int64_t>();
  Gauge<int64_t> forward{.data_points = points};
  Gauge<int64_t> backward{.data_points = {points[1], points[0]}};
  EXPECT_THAT(EqualGauges(forward, backward, {}), IsEmpty());

  Gauge<int64_t> twice{.data_points = {points[0], points[0]}};
  Gauge<int64_t> once{.data_points = {points[0]}};
  EXPECT_THAT(EqualGauges(twice, once, {}),
              ElementsAre(StartsWith("Gauge DataPoints not equal:\n"
                                     "missing expected values:\n")));
  EXPECT_THAT(EqualGauges(once, twice, {}),
              ElementsAre(StartsWith("Gauge DataPoints not equal:\n"
                                     "unexpected additional values:\n")));
}

TEST(SumComparisonTest, TemporalityAndMonotonicityAreNeverIgnored) {
  Sum<int64_t> a{.data_points = TwoPoints<int64_t>(),
                 .temporality = Temporality::kCumulative,
                 .is_monotonic = true};
  Sum<int64_t> b = a;
  b.temporality = Temporality::kDelta;
  b.is_monotonic = false;

  Options ignore_all = {Option::kIgnoreTimestamp, Option::kIgnoreValue,
                        Option::kIgnoreExemplars};
  EXPECT_THAT(
      EqualSums(a, b, ignore_all),
      ElementsAre("Temporality not equal:\nexpected: Cumulative\nactual: Delta",
                  "IsMonotonic not equal:\nexpected: true\nactual: false"));

  EXPECT_THAT(EqualAggregations(a, b, {}),
              ElementsAre("Sum[int64] not equal:",
                          StartsWith("Temporality not equal:"),
                          StartsWith("IsMonotonic not equal:")));
}

TEST(SumComparisonTest, DataPointDifferences) {
  Sum<double> a{.data_points = TwoPoints<double>()};
  Sum<double> b = a;
  b.data_points[1].time = Nanos(999);

  EXPECT_THAT(EqualSums(a, b, {}),
              ElementsAre(StartsWith("Sum DataPoints not equal:\n")));
  EXPECT_THAT(EqualSums(a, b, {Option::kIgnoreTimestamp}), IsEmpty());
}

TEST(HistogramComparisonTest, TemporalityAndDataPoints) {
  Histogram<int64_t> a{
      .data_points = {MakeHistogramDataPoint<int64_t>({})},
      .temporality = Temporality::kDelta,
  };
  EXPECT_THAT(EqualHistograms(a, a, {}), IsEmpty());

  Histogram<int64_t> b = a;
  b.temporality = Temporality::kCumulative;
  b.data_points[0].bucket_counts = {1, 1, 1, 0};
  EXPECT_THAT(EqualHistograms(a, b, {}),
              ElementsAre("Temporality not equal:\nexpected: Delta\n"
                          "actual: Cumulative",
                          StartsWith("Histogram DataPoints not equal:\n")));
  EXPECT_THAT(EqualHistograms(a, b, {Option::kIgnoreValue}),
              ElementsAre(StartsWith("Temporality not equal:")));
  EXPECT_THAT(EqualAggregations(a, b, {}),
              ElementsAre("Histogram[int64] not equal:", _, _));
}

TEST(ExponentialHistogramComparisonTest, TemporalityAndDataPoints) {
  ExponentialHistogram<double> a{
      .data_points = {MakeExponentialHistogramDataPoint<double>({})},
      .temporality = Temporality::kCumulative,
  };
  EXPECT_THAT(EqualExponentialHistograms(a, a, {}), IsEmpty());

  ExponentialHistogram<double> b = a;
  b.data_points[0].positive_bucket.offset = 5;
  EXPECT_THAT(EqualAggregations(a, b, {}),
              ElementsAre("ExponentialHistogram[float64] not equal:",
                          StartsWith("ExponentialHistogram DataPoints not "
                                     "equal:\n")));
  EXPECT_THAT(EqualAggregations(a, b, {Option::kIgnoreValue}), IsEmpty());
}

class UnknownAggregationTest : public ::testing::Test {
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

  std::shared_ptr<std::vector<std::string>> messages_;
};

TEST_F(UnknownAggregationTest, ReportedAsReasonAndLogged) {
  Aggregation unknown = ValuelessAggregation();
  ASSERT_TRUE(unknown.valueless_by_exception());

  EXPECT_THAT(EqualAggregations(unknown, Gauge<int64_t>{}, {}),
              ElementsAre("Aggregation of unknown types <unknown> and "
                          "Gauge[int64]"));
  EXPECT_THAT(EqualAggregations(unknown, unknown, {}),
              ElementsAre(StartsWith("Aggregation of unknown types")));

  ASSERT_THAT(*messages_, SizeIs(2));
  EXPECT_THAT(messages_->front(),
              HasSubstr("|MetricDiffComparison|"));
  EXPECT_THAT(messages_->front(),
              HasSubstr("Failed with: Aggregation is not one of the known "
                        "shapes"));
}

TEST_F(UnknownAggregationTest, DoesNotStopTheTreeComparison) {
  metricdata::Metrics a{.name = "x", .data = ValuelessAggregation()};
  metricdata::Metrics b{.name = "y", .data = Aggregation()};
  EXPECT_THAT(EqualMetrics(a, b, {}),
              ElementsAre(StartsWith("Name not equal:"),
                          "Metrics Data not equal:",
                          StartsWith("Aggregation of unknown types")));
  EXPECT_THAT(*messages_, Not(IsEmpty()));
}

}  // namespace
}  // namespace metric_diff::comparison::test
