#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "tre/rating/rating_config.hpp"

using namespace tre::rating;
using tre::foundation::ConfigManager;
using tre::foundation::ErrorCode;

// --- TierWeightTable ---

TEST(TierWeightTableTest, DefaultsCoverBothCircuits) {
    auto table = TierWeightTable::defaults();
    EXPECT_EQ(table.size(), 2u);
    EXPECT_DOUBLE_EQ(table.weightFor(Tier::Lower).value(), 24.0);
    EXPECT_DOUBLE_EQ(table.weightFor(Tier::Top).value(), 32.0);
    EXPECT_FALSE(table.contains(Tier::Major));
    EXPECT_TRUE(table.validate().hasValue());
}

TEST(TierWeightTableTest, LowerMustStayBelowTop) {
    TierWeightTable table;
    table.set(Tier::Lower, 32.0);
    table.set(Tier::Top, 32.0);
    auto result = table.validate();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidParameter);
}

TEST(TierWeightTableTest, RejectsEmptyAndNonPositive) {
    TierWeightTable empty;
    EXPECT_TRUE(empty.validate().hasError());

    TierWeightTable negative;
    negative.set(Tier::Top, -4.0);
    EXPECT_TRUE(negative.validate().hasError());
}

// --- RatingConfig / EngineConfig validation ---

TEST(RatingConfigTest, DefaultsAreValid) {
    RatingConfig config;
    EXPECT_TRUE(config.validate().hasValue());
    EXPECT_DOUBLE_EQ(config.defaultBaseline, 1500.0);
    EXPECT_DOUBLE_EQ(config.logisticScale, 400.0);
    EXPECT_DOUBLE_EQ(config.blend.beta, 0.7);
    EXPECT_DOUBLE_EQ(config.form.halfLifeDays, 60.0);
}

TEST(RatingConfigTest, RejectsOutOfRangeParameters) {
    RatingConfig scale;
    scale.logisticScale = 0.0;
    EXPECT_EQ(scale.validate().error().code(), ErrorCode::InvalidParameter);

    RatingConfig beta;
    beta.blend.beta = 1.5;
    EXPECT_TRUE(beta.validate().hasError());

    RatingConfig rate;
    rate.form.updateRate = 0.0;
    EXPECT_TRUE(rate.validate().hasError());

    RatingConfig margin;
    margin.margin.maxMultiplier = 0.5;
    EXPECT_TRUE(margin.validate().hasError());

    RatingConfig bonus;
    bonus.margin.straightSetsBonus = -0.1;
    EXPECT_EQ(bonus.validate().error().code(), ErrorCode::InvalidParameter);
}

TEST(EngineConfigTest, ValidatesSplitAndBuckets) {
    EngineConfig config;
    config.split = SplitConfig{2010, 2020, 2};
    EXPECT_TRUE(config.validate().hasValue());

    config.split.testSizeYears = 12;
    EXPECT_EQ(config.validate().error().code(), ErrorCode::InvalidTestSize);

    config.split.testSizeYears = 2;
    config.evaluation.calibrationBuckets = 0;
    EXPECT_TRUE(config.validate().hasError());
}

// --- buildEngineConfig ---

class BuildEngineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmpDir_ = std::filesystem::temp_directory_path() /
                  (std::string("tre_cfg_") + info->name());
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    void load(const std::string& yaml) {
        auto path = tmpDir_ / "engine.yaml";
        {
            std::ofstream ofs(path);
            ofs << yaml;
        }
        ASSERT_TRUE(config_.load(path).hasValue());
    }

    std::filesystem::path tmpDir_;
    ConfigManager config_;
    SplitConfig split_{2010, 2020, 2};
};

TEST_F(BuildEngineConfigTest, EmptyConfigKeepsDefaults) {
    auto built = buildEngineConfig(config_, split_);
    ASSERT_TRUE(built.hasValue());
    EXPECT_EQ(built.value().split.yearTo, 2020);
    EXPECT_DOUBLE_EQ(built.value().rating.blend.gamma, 50.0);
    EXPECT_EQ(built.value().evaluation.calibrationBuckets, 10u);
    EXPECT_EQ(built.value().rating.tierWeights.size(), 2u);
}

TEST_F(BuildEngineConfigTest, OverlaysPresentKeys) {
    load(R"(
rating:
  logistic_scale: 480
  blend:
    beta: 0.5
  form:
    half_life_days: 90
  experience:
    shape: 0.4
  margin:
    straight_sets_bonus: 0.25
evaluation:
  calibration_buckets: 20
)");
    auto built = buildEngineConfig(config_, split_);
    ASSERT_TRUE(built.hasValue());
    const auto& r = built.value().rating;
    EXPECT_DOUBLE_EQ(r.logisticScale, 480.0);
    EXPECT_DOUBLE_EQ(r.blend.beta, 0.5);
    EXPECT_DOUBLE_EQ(r.blend.gamma, 50.0);
    EXPECT_DOUBLE_EQ(r.form.halfLifeDays, 90.0);
    EXPECT_DOUBLE_EQ(r.experience.shape, 0.4);
    EXPECT_DOUBLE_EQ(r.margin.straightSetsBonus, 0.25);
    EXPECT_DOUBLE_EQ(r.margin.maxMultiplier, 1.5);
    EXPECT_EQ(built.value().evaluation.calibrationBuckets, 20u);
}

TEST_F(BuildEngineConfigTest, TierWeightsReplaceWholeTable) {
    load(R"(
rating:
  tier_weights:
    itf: 20
    top: 30
    grand_slam: 40
)");
    auto built = buildEngineConfig(config_, split_);
    ASSERT_TRUE(built.hasValue());
    const auto& tiers = built.value().rating.tierWeights;
    EXPECT_EQ(tiers.size(), 3u);
    EXPECT_DOUBLE_EQ(tiers.weightFor(Tier::Lower).value(), 20.0);
    EXPECT_DOUBLE_EQ(tiers.weightFor(Tier::Major).value(), 40.0);
    EXPECT_FALSE(tiers.contains(Tier::Qualifying));
}

TEST_F(BuildEngineConfigTest, ConfiguredLowerAboveTopFailsValidation) {
    load("rating:\n  tier_weights:\n    lower: 40\n    top: 32\n");
    auto built = buildEngineConfig(config_, split_);
    ASSERT_TRUE(built.hasValue());
    auto valid = built.value().validate();
    ASSERT_TRUE(valid.hasError());
    EXPECT_TRUE(valid.error().isConfigurationError());
}

TEST_F(BuildEngineConfigTest, UnknownTierNameIsRejected) {
    load("rating:\n  tier_weights:\n    challenger: 28\n");
    auto built = buildEngineConfig(config_, split_);
    ASSERT_TRUE(built.hasError());
    EXPECT_EQ(built.error().code(), ErrorCode::UnknownTier);
}

TEST_F(BuildEngineConfigTest, WrongTypeIsRejected) {
    load("rating:\n  blend:\n    beta: strong\n");
    auto built = buildEngineConfig(config_, split_);
    ASSERT_TRUE(built.hasError());
    EXPECT_EQ(built.error().code(), ErrorCode::ConfigTypeMismatch);
}
