/// @file rating_config.cpp
/// @brief RatingConfig validation and YAML overlay.

#include "tre/rating/rating_config.hpp"

#include <cmath>
#include <string>
#include <utility>

#include "tre/rating/temporal_splitter.hpp"

namespace tre::rating {

using foundation::ConfigManager;
using foundation::EngineError;
using foundation::ErrorCode;

namespace {

EngineResult<void> invalid(const std::string& what) {
    return EngineResult<void>::err(EngineError(ErrorCode::InvalidParameter, what));
}

/// Copy an optional key into @p target; only a type mismatch is an error.
template <typename T>
EngineResult<void> overlay(const ConfigManager& config, const char* key, T& target) {
    auto value = config.get<T>(key);
    if (value) {
        target = value.value();
        return EngineResult<void>::ok();
    }
    if (value.error().code() == ErrorCode::ConfigKeyNotFound) {
        return EngineResult<void>::ok();
    }
    return EngineResult<void>::err(value.error());
}

} // namespace

// ---------------------------------------------------------------------------
// TierWeightTable
// ---------------------------------------------------------------------------
TierWeightTable TierWeightTable::defaults() {
    TierWeightTable table;
    table.set(Tier::Lower, 24.0);
    table.set(Tier::Top, 32.0);
    return table;
}

EngineResult<double> TierWeightTable::weightFor(Tier tier) const {
    auto it = weights_.find(tier);
    if (it == weights_.end()) {
        return EngineResult<double>::err(
            EngineError(ErrorCode::UnknownTier,
                        "no weight configured for tier '" + std::string(tierName(tier)) + "'",
                        tier));
    }
    return EngineResult<double>::ok(it->second);
}

EngineResult<void> TierWeightTable::validate() const {
    if (weights_.empty()) {
        return invalid("tier weight table is empty");
    }
    for (const auto& [tier, weight] : weights_) {
        if (!std::isfinite(weight) || weight <= 0.0) {
            return invalid("tier weight for '" + std::string(tierName(tier)) + "' must be positive");
        }
    }
    auto lower = weights_.find(Tier::Lower);
    auto top = weights_.find(Tier::Top);
    if (lower != weights_.end() && top != weights_.end() && lower->second >= top->second) {
        return invalid("lower-tier weight must be strictly smaller than top-tier weight");
    }
    return EngineResult<void>::ok();
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------
EngineResult<void> RatingConfig::validate() const {
    if (!std::isfinite(defaultBaseline)) {
        return invalid("rating.default_baseline must be finite");
    }
    if (!(logisticScale > 0.0) || !std::isfinite(logisticScale)) {
        return invalid("rating.logistic_scale must be positive");
    }
    if (auto tiers = tierWeights.validate(); !tiers) {
        return tiers;
    }
    if (!(margin.maxMultiplier >= 1.0) || !std::isfinite(margin.maxMultiplier)) {
        return invalid("rating.margin.max_multiplier must be >= 1");
    }
    if (!(margin.scaleGames > 0.0)) {
        return invalid("rating.margin.scale_games must be positive");
    }
    if (!(margin.straightSetsBonus >= 0.0) || !std::isfinite(margin.straightSetsBonus)) {
        return invalid("rating.margin.straight_sets_bonus must be >= 0");
    }
    if (!(experience.offset > 0.0)) {
        return invalid("rating.experience.offset must be positive");
    }
    if (!(experience.shape >= 0.0)) {
        return invalid("rating.experience.shape must be >= 0");
    }
    if (!(form.halfLifeDays > 0.0)) {
        return invalid("rating.form.half_life_days must be positive");
    }
    if (!(form.updateRate > 0.0 && form.updateRate <= 1.0)) {
        return invalid("rating.form.update_rate must be in (0, 1]");
    }
    if (!(blend.beta >= 0.0 && blend.beta <= 1.0)) {
        return invalid("rating.blend.beta must be in [0, 1]");
    }
    if (!(blend.gamma >= 0.0) || !std::isfinite(blend.gamma)) {
        return invalid("rating.blend.gamma must be >= 0");
    }
    if (!(blend.epsilon >= 0.0 && blend.epsilon <= 1.0)) {
        return invalid("rating.blend.epsilon must be in [0, 1]");
    }
    return EngineResult<void>::ok();
}

EngineResult<void> EngineConfig::validate() const {
    if (auto r = rating.validate(); !r) {
        return r;
    }
    if (auto s = TemporalSplitter::validate(split); !s) {
        return s;
    }
    if (evaluation.calibrationBuckets == 0) {
        return invalid("evaluation.calibration_buckets must be at least 1");
    }
    return EngineResult<void>::ok();
}

// ---------------------------------------------------------------------------
// YAML overlay
// ---------------------------------------------------------------------------
EngineResult<EngineConfig> buildEngineConfig(const ConfigManager& config,
                                             const SplitConfig& split) {
    EngineConfig cfg;
    cfg.split = split;
    auto& r = cfg.rating;

    for (auto result : {
             overlay(config, "rating.default_baseline", r.defaultBaseline),
             overlay(config, "rating.logistic_scale", r.logisticScale),
             overlay(config, "rating.margin.max_multiplier", r.margin.maxMultiplier),
             overlay(config, "rating.margin.scale_games", r.margin.scaleGames),
             overlay(config, "rating.margin.straight_sets_bonus", r.margin.straightSetsBonus),
             overlay(config, "rating.experience.offset", r.experience.offset),
             overlay(config, "rating.experience.shape", r.experience.shape),
             overlay(config, "rating.form.half_life_days", r.form.halfLifeDays),
             overlay(config, "rating.form.update_rate", r.form.updateRate),
             overlay(config, "rating.blend.beta", r.blend.beta),
             overlay(config, "rating.blend.gamma", r.blend.gamma),
             overlay(config, "rating.blend.epsilon", r.blend.epsilon),
             overlay(config, "evaluation.calibration_buckets", cfg.evaluation.calibrationBuckets),
         }) {
        if (!result) {
            return EngineResult<EngineConfig>::err(result.error());
        }
    }

    auto tierKeys = config.keysWithPrefix("rating.tier_weights");
    if (!tierKeys.empty()) {
        r.tierWeights.clear();
        for (const auto& name : tierKeys) {
            auto tier = parseTier(name);
            if (!tier) {
                return EngineResult<EngineConfig>::err(
                    EngineError(ErrorCode::UnknownTier,
                                "unknown tier in rating.tier_weights: '" + name + "'"));
            }
            auto weight = config.get<double>("rating.tier_weights." + name);
            if (!weight) {
                return EngineResult<EngineConfig>::err(weight.error());
            }
            r.tierWeights.set(*tier, weight.value());
        }
    }

    return EngineResult<EngineConfig>::ok(std::move(cfg));
}

} // namespace tre::rating
