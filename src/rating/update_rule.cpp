/// @file update_rule.cpp
/// @brief UpdateRule implementation.

#include "tre/rating/update_rule.hpp"

#include <algorithm>
#include <cmath>

#include "tre/rating/predictor.hpp"

namespace tre::rating {

double UpdateRule::marginMultiplier(const Score& score, const MarginConfig& config) {
    double margin = std::max(0, score.gameMargin());
    double saturation = 1.0 - std::exp(-margin / config.scaleGames);
    double ceiling = config.maxMultiplier - 1.0;
    if (score.straightSets()) {
        ceiling += config.straightSetsBonus;
    }
    return 1.0 + ceiling * saturation;
}

double UpdateRule::experienceScale(double meanMatchesPlayed, const ExperienceConfig& config) {
    if (config.shape == 0.0) {
        return 1.0;
    }
    return std::pow(config.offset / (config.offset + meanMatchesPlayed), config.shape);
}

EngineResult<RatingDelta> UpdateRule::compute(const Match& match,
                                              double effectiveA,
                                              double effectiveB,
                                              double meanMatchesPlayed,
                                              const RatingConfig& config) {
    auto tierWeight = config.tierWeights.weightFor(match.tier);
    if (!tierWeight) {
        return EngineResult<RatingDelta>::err(tierWeight.error());
    }

    RatingDelta delta;
    delta.expectedA = Predictor::winProbability(effectiveA, effectiveB, config.logisticScale);
    delta.actualA = match.aWon() ? 1.0 : 0.0;
    delta.kFactor = tierWeight.value() * experienceScale(meanMatchesPlayed, config.experience);

    if (match.score) {
        delta.marginMultiplier = marginMultiplier(*match.score, config.margin);
    } else {
        delta.marginMultiplier = 1.0;
        delta.neutralMargin = true;
    }

    delta.deltaA = delta.kFactor * delta.marginMultiplier * delta.surpriseA();
    delta.deltaB = -delta.deltaA;
    return EngineResult<RatingDelta>::ok(delta);
}

} // namespace tre::rating
