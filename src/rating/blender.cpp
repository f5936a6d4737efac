/// @file blender.cpp
/// @brief Blender implementation.

#include "tre/rating/blender.hpp"

#include "tre/rating/form_tracker.hpp"

namespace tre::rating {

double Blender::blend(double baseline, double current, double form,
                      const BlendConfig& config) {
    return baseline + config.beta * (current - baseline) + config.gamma * form;
}

double Blender::effectiveRating(const Player& player, const Date& asOf,
                                const RatingConfig& config) {
    double form = FormTracker::decayed(player.formSignal, player.lastActive, asOf,
                                       config.form.halfLifeDays);
    return blend(player.baselineRating, player.currentRating, form, config.blend);
}

} // namespace tre::rating
