#include <gtest/gtest.h>

#include <vector>

#include "support/match_builder.hpp"
#include "support/recording_logger.hpp"
#include "tre/rating/temporal_splitter.hpp"

using namespace tre::rating;
using tre::foundation::ErrorCode;
using tre::test::makeMatch;

TEST(TemporalSplitterTest, ValidatesYearRange) {
    auto same = TemporalSplitter::validate(SplitConfig{2015, 2015, 1});
    ASSERT_TRUE(same.hasError());
    EXPECT_EQ(same.error().code(), ErrorCode::InvalidYearRange);

    auto reversed = TemporalSplitter::validate(SplitConfig{2020, 2010, 2});
    ASSERT_TRUE(reversed.hasError());
    EXPECT_EQ(reversed.error().code(), ErrorCode::InvalidYearRange);
    ASSERT_NE(reversed.error().context<SplitConfig>(), nullptr);
    EXPECT_EQ(reversed.error().context<SplitConfig>()->yearFrom, 2020);
}

TEST(TemporalSplitterTest, YearsMustHaveFourDigits) {
    auto farFuture = TemporalSplitter::validate(SplitConfig{2010, 40000, 2});
    ASSERT_TRUE(farFuture.hasError());
    EXPECT_EQ(farFuture.error().code(), ErrorCode::InvalidYearRange);
    ASSERT_NE(farFuture.error().context<SplitConfig>(), nullptr);
    EXPECT_EQ(farFuture.error().context<SplitConfig>()->yearTo, 40000);

    EXPECT_EQ(TemporalSplitter::validate(SplitConfig{-40000, 2010, 2}).error().code(),
              ErrorCode::InvalidYearRange);
    EXPECT_EQ(TemporalSplitter::validate(SplitConfig{-2000000000, 2000000000, 1}).error().code(),
              ErrorCode::InvalidYearRange);
    EXPECT_EQ(TemporalSplitter::validate(SplitConfig{2010, 10000, 2}).error().code(),
              ErrorCode::InvalidYearRange);
    EXPECT_TRUE(TemporalSplitter::validate(SplitConfig{0, 9999, 2}).hasValue());
}

TEST(TemporalSplitterTest, TestSizeMustLeaveAFitYear) {
    EXPECT_EQ(TemporalSplitter::validate(SplitConfig{2010, 2020, 12}).error().code(),
              ErrorCode::InvalidTestSize);
    EXPECT_EQ(TemporalSplitter::validate(SplitConfig{2010, 2020, 10}).error().code(),
              ErrorCode::InvalidTestSize);
    EXPECT_EQ(TemporalSplitter::validate(SplitConfig{2010, 2020, 0}).error().code(),
              ErrorCode::InvalidTestSize);
    EXPECT_TRUE(TemporalSplitter::validate(SplitConfig{2010, 2020, 9}).hasValue());
    EXPECT_TRUE(TemporalSplitter::validate(SplitConfig{2010, 2020, 1}).hasValue());
}

TEST(TemporalSplitterTest, SplitsByCalendarYear) {
    std::vector<Match> matches = {
        makeMatch("2009-12-31", 1, 2, 1),
        makeMatch("2010-01-01", 1, 2, 1),
        makeMatch("2017-12-31", 1, 2, 2),
        makeMatch("2018-01-01", 1, 2, 1),
        makeMatch("2020-12-31", 1, 2, 2),
        makeMatch("2021-01-01", 1, 2, 1),
    };
    auto split = TemporalSplitter::split(matches, SplitConfig{2010, 2020, 2});
    ASSERT_TRUE(split.hasValue());
    const auto& s = split.value();

    EXPECT_EQ(s.fitWindow.firstYear, 2010);
    EXPECT_EQ(s.fitWindow.lastYear, 2017);
    EXPECT_EQ(s.evaluationWindow.firstYear, 2018);
    EXPECT_EQ(s.evaluationWindow.lastYear, 2020);

    ASSERT_EQ(s.fit.size(), 2u);
    ASSERT_EQ(s.evaluation.size(), 2u);
    EXPECT_EQ(s.excludedBefore, 1u);
    EXPECT_EQ(s.excludedAfter, 1u);
    for (const auto& m : s.fit) {
        EXPECT_TRUE(s.fitWindow.contains(m.date));
    }
    for (const auto& m : s.evaluation) {
        EXPECT_TRUE(s.evaluationWindow.contains(m.date));
    }
}

TEST(TemporalSplitterTest, SortsStablyByDate) {
    std::vector<Match> matches = {
        makeMatch("2015-06-02", 5, 6, 5),
        makeMatch("2015-06-01", 1, 2, 1),
        makeMatch("2015-06-02", 3, 4, 3),
        makeMatch("2015-06-01", 7, 8, 8),
    };
    auto split = TemporalSplitter::split(matches, SplitConfig{2014, 2016, 1});
    ASSERT_TRUE(split.hasValue());
    const auto& fit = split.value().fit;
    ASSERT_EQ(fit.size(), 4u);
    EXPECT_EQ(fit[0].playerA.value(), 1u);
    EXPECT_EQ(fit[1].playerA.value(), 7u);
    EXPECT_EQ(fit[2].playerA.value(), 5u);
    EXPECT_EQ(fit[3].playerA.value(), 3u);
}

TEST(TemporalSplitterTest, InvalidConfigSplitsNothing) {
    std::vector<Match> matches = {makeMatch("2015-06-01", 1, 2, 1)};
    auto split = TemporalSplitter::split(matches, SplitConfig{2010, 2020, 12});
    ASSERT_TRUE(split.hasError());
    EXPECT_TRUE(split.error().isConfigurationError());
}

class TemporalSplitterLogTest : public tre::test::LoggingTest {};

TEST_F(TemporalSplitterLogTest, EarlyStartYearWarns) {
    auto split = TemporalSplitter::split({}, SplitConfig{2005, 2012, 2});
    ASSERT_TRUE(split.hasValue());
    EXPECT_EQ(logger_->countContaining("year_from 2005 precedes 2010"), 1u);
}

TEST_F(TemporalSplitterLogTest, RecommendedStartYearIsSilent) {
    auto split = TemporalSplitter::split({}, SplitConfig{2010, 2012, 1});
    ASSERT_TRUE(split.hasValue());
    EXPECT_EQ(logger_->countContaining("precedes"), 0u);
}
