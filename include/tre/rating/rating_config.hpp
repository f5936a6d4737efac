#pragma once

/// @file rating_config.hpp
/// @brief Tunable parameters of the rating engine and their YAML binding.
///
/// Every constant the model depends on (tier weights, margin curve, form
/// half-life, blend weights) lives here with a documented default so it can
/// be tuned against the evaluation metrics instead of being hard-coded.

#include <cstdint>
#include <map>

#include "tre/foundation/config_manager.hpp"
#include "tre/foundation/engine_result.hpp"
#include "tre/rating/match_types.hpp"

namespace tre::rating {

using foundation::EngineResult;

/// Tier -> K-factor lookup. New tiers are enabled by adding an entry in
/// config ("rating.tier_weights.<tier>"), not by code changes.
class TierWeightTable {
public:
    /// Default table: lower-tier circuit 24, top-tier circuit 32.
    static TierWeightTable defaults();

    void set(Tier tier, double weight) { weights_[tier] = weight; }
    void clear() { weights_.clear(); }

    [[nodiscard]] bool contains(Tier tier) const { return weights_.count(tier) > 0; }
    [[nodiscard]] std::size_t size() const { return weights_.size(); }

    /// @return The weight or UnknownTier.
    [[nodiscard]] EngineResult<double> weightFor(Tier tier) const;

    /// Weights must be positive, and lower must be strictly below top when
    /// both are present.
    [[nodiscard]] EngineResult<void> validate() const;

    [[nodiscard]] const std::map<Tier, double>& entries() const { return weights_; }

private:
    std::map<Tier, double> weights_;
};

/// M(score) = 1 + (maxMultiplier - 1 + b) * (1 - exp(-max(0, margin) / scaleGames)),
/// where b is straightSetsBonus for a straight-sets win and 0 otherwise.
struct MarginConfig {
    double maxMultiplier = 1.5;      ///< Upper bound of M (blowouts) without the bonus.
    double scaleGames = 6.0;         ///< Games margin at which ~63% of the bonus applies.
    double straightSetsBonus = 0.1;  ///< Extra ceiling for a win without dropping a set.
};

/// X = (offset / (offset + meanMatchesPlayed))^shape. shape = 0 disables it.
struct ExperienceConfig {
    double offset = 5.0;
    double shape = 0.0;
};

struct FormConfig {
    double halfLifeDays = 60.0;  ///< Inactivity half-life of the form signal.
    double updateRate = 0.2;     ///< Weight of the newest surprise.
};

/// effective = baseline + beta * (current - baseline) + gamma * form;
/// baseline absorbs epsilon * delta per match.
struct BlendConfig {
    double beta = 0.7;
    double gamma = 50.0;
    double epsilon = 0.1;
};

struct RatingConfig {
    double defaultBaseline = 1500.0;
    double logisticScale = 400.0;
    TierWeightTable tierWeights = TierWeightTable::defaults();
    MarginConfig margin;
    ExperienceConfig experience;
    FormConfig form;
    BlendConfig blend;

    /// @return InvalidParameter naming the first out-of-range field.
    [[nodiscard]] EngineResult<void> validate() const;
};

/// Year range and held-out size, supplied by the command line.
struct SplitConfig {
    int yearFrom = 0;
    int yearTo = 0;
    int testSizeYears = 0;
};

struct EvaluationConfig {
    uint32_t calibrationBuckets = 10;
};

struct EngineConfig {
    RatingConfig rating;
    SplitConfig split;
    EvaluationConfig evaluation;

    /// Validates rating parameters, the split and the bucket count.
    [[nodiscard]] EngineResult<void> validate() const;
};

/// Overlay values found in @p config onto the defaults.
///
/// Absent keys keep their defaults; present keys with the wrong type or an
/// unknown tier name fail with a configuration error. If any
/// "rating.tier_weights.*" key is present the default table is replaced
/// entirely by the configured one.
[[nodiscard]] EngineResult<EngineConfig> buildEngineConfig(
    const foundation::ConfigManager& config, const SplitConfig& split);

} // namespace tre::rating
