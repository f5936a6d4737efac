#include <gtest/gtest.h>

#include <cmath>

#include "support/match_builder.hpp"
#include "tre/rating/blender.hpp"
#include "tre/rating/form_tracker.hpp"

using namespace tre::rating;
using tre::test::date;

// --- FormTracker ---

TEST(FormTrackerTest, HalvesEveryHalfLife) {
    auto last = date("2016-01-01");
    EXPECT_NEAR(FormTracker::decayed(0.4, last, date("2016-03-01"), 60.0), 0.2, 1e-12);
    EXPECT_NEAR(FormTracker::decayed(0.4, last, date("2016-04-30"), 60.0), 0.1, 1e-12);
}

TEST(FormTrackerTest, NoDecayWithoutElapsedTime) {
    auto last = date("2016-01-01");
    EXPECT_DOUBLE_EQ(FormTracker::decayed(0.3, last, last, 60.0), 0.3);
    EXPECT_DOUBLE_EQ(FormTracker::decayed(0.3, std::nullopt, last, 60.0), 0.3);
}

TEST(FormTrackerTest, LongInactivityDecaysToZero) {
    double form = FormTracker::decayed(0.45, date("2012-06-01"), date("2016-06-01"), 60.0);
    EXPECT_NEAR(form, 0.0, 1e-6);
}

TEST(FormTrackerTest, UpdateBlendsDecayedPriorWithSurprise) {
    FormConfig config;
    // Same-day update: no decay, 0.8 * 0.1 + 0.2 * 0.5.
    auto day = date("2017-02-10");
    EXPECT_NEAR(FormTracker::update(0.1, day, day, 0.5, config), 0.18, 1e-12);
    // 60 idle days halve the prior first.
    EXPECT_NEAR(FormTracker::update(0.1, day, date("2017-04-11"), -0.5, config),
                0.8 * 0.05 - 0.1, 1e-12);
}

TEST(FormTrackerTest, FormStaysBoundedBySurprise) {
    FormConfig config;
    double form = 0.0;
    auto day = date("2018-01-01");
    for (int i = 0; i < 200; ++i) {
        form = FormTracker::update(form, day, day, 1.0, config);
    }
    EXPECT_LE(form, 1.0 + 1e-12);
    EXPECT_GT(form, 0.99);
}

// --- Blender ---

TEST(BlenderTest, DefaultWeights) {
    BlendConfig config;
    EXPECT_DOUBLE_EQ(Blender::blend(1500.0, 1500.0, 0.0, config), 1500.0);
    EXPECT_NEAR(Blender::blend(1500.0, 1600.0, 0.0, config), 1570.0, 1e-9);
    EXPECT_NEAR(Blender::blend(1500.0, 1600.0, 0.2, config), 1580.0, 1e-9);
}

TEST(BlenderTest, BetaOneIgnoresBaseline) {
    BlendConfig config{1.0, 0.0, 0.0};
    EXPECT_DOUBLE_EQ(Blender::blend(1400.0, 1650.0, 0.7, config), 1650.0);
}

TEST(BlenderTest, EffectiveRatingDecaysFormToDate) {
    RatingConfig config;
    Player player;
    player.baselineRating = 1500.0;
    player.currentRating = 1500.0;
    player.formSignal = 0.2;
    player.lastActive = date("2019-01-01");

    double fresh = Blender::effectiveRating(player, date("2019-01-01"), config);
    double stale = Blender::effectiveRating(player, date("2024-01-01"), config);
    EXPECT_NEAR(fresh, 1510.0, 1e-9);
    EXPECT_NEAR(stale, 1500.0, 1e-6);
}
