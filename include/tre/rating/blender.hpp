#pragma once

/// @file blender.hpp
/// @brief Combines historical ability, current ability and form into one rating.

#include "tre/rating/player.hpp"
#include "tre/rating/rating_config.hpp"

namespace tre::rating {

/// Static utility class computing the effective rating fed to the Predictor.
///
///   effective = baseline + beta * (current - baseline) + gamma * form
///
/// beta = 0 predicts from long-run ability alone, beta = 1 from current
/// ability alone; gamma is expressed in rating points per unit of form.
class Blender {
public:
    Blender() = delete;

    [[nodiscard]] static double blend(double baseline, double current, double form,
                                      const BlendConfig& config);

    /// Effective rating of @p player as of @p asOf, with form decayed to that date.
    [[nodiscard]] static double effectiveRating(const Player& player, const Date& asOf,
                                                const RatingConfig& config);
};

} // namespace tre::rating
