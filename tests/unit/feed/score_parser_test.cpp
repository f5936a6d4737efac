#include <gtest/gtest.h>

#include "tre/rating/match_types.hpp"

using namespace tre::rating;

TEST(ScoreParserTest, StraightSets) {
    auto score = parseScore("6-4 6-3");
    ASSERT_TRUE(score.has_value());
    EXPECT_EQ(score->gamesWon, 12u);
    EXPECT_EQ(score->gamesLost, 7u);
    EXPECT_EQ(score->setsWon, 2u);
    EXPECT_EQ(score->setsLost, 0u);
    EXPECT_EQ(score->gameMargin(), 5);
    EXPECT_TRUE(score->straightSets());
}

TEST(ScoreParserTest, TiebreakCountsAreDropped) {
    auto score = parseScore("6-4 3-6 7-6(5)");
    ASSERT_TRUE(score.has_value());
    EXPECT_EQ(score->gamesWon, 16u);
    EXPECT_EQ(score->gamesLost, 16u);
    EXPECT_EQ(score->setsWon, 2u);
    EXPECT_EQ(score->setsLost, 1u);
    EXPECT_EQ(score->gameMargin(), 0);
    EXPECT_FALSE(score->straightSets());
}

TEST(ScoreParserTest, MarginCanBeNegative) {
    auto score = parseScore("1-6 7-6(2) 7-6(4)");
    ASSERT_TRUE(score.has_value());
    EXPECT_EQ(score->gameMargin(), -3);
}

TEST(ScoreParserTest, TrailingRetirementMarkerIsIgnored) {
    auto score = parseScore("6-2 6-4 RET");
    ASSERT_TRUE(score.has_value());
    EXPECT_EQ(score->gamesWon, 12u);
    EXPECT_EQ(score->gamesLost, 6u);
}

TEST(ScoreParserTest, IncompleteMatchesHaveNoScore) {
    EXPECT_FALSE(parseScore("6-4 2-1 RET").has_value());
    EXPECT_FALSE(parseScore("7-5").has_value());
    EXPECT_FALSE(parseScore("W/O").has_value());
    EXPECT_FALSE(parseScore("").has_value());
}

TEST(ScoreParserTest, GarbageTokensAreSkipped) {
    EXPECT_FALSE(parseScore("six-four six-three").has_value());
    auto score = parseScore("6-4 x-y 6-4");
    ASSERT_TRUE(score.has_value());
    EXPECT_EQ(score->setsWon, 2u);
}

TEST(TierNameTest, CanonicalNamesRoundTrip) {
    for (auto tier : {Tier::Lower, Tier::Qualifying, Tier::Top, Tier::Major}) {
        EXPECT_EQ(parseTier(tierName(tier)), tier);
    }
}

TEST(TierNameTest, CircuitAliases) {
    EXPECT_EQ(parseTier("ITF"), Tier::Lower);
    EXPECT_EQ(parseTier("wta"), Tier::Top);
    EXPECT_EQ(parseTier("Tour"), Tier::Top);
    EXPECT_EQ(parseTier("qual"), Tier::Qualifying);
    EXPECT_EQ(parseTier("Grand_Slam"), Tier::Major);
    EXPECT_FALSE(parseTier("challenger").has_value());
    EXPECT_FALSE(parseTier("").has_value());
}

TEST(SurfaceNameTest, ParsesCaseInsensitively) {
    EXPECT_EQ(parseSurface("Clay"), Surface::Clay);
    EXPECT_EQ(parseSurface("GRASS"), Surface::Grass);
    EXPECT_EQ(parseSurface("hard"), Surface::Hard);
    EXPECT_FALSE(parseSurface("sand").has_value());
}
