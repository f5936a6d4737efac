/// @file form_tracker.cpp
/// @brief FormTracker implementation.

#include "tre/rating/form_tracker.hpp"

#include <cmath>

namespace tre::rating {

double FormTracker::decayed(double form,
                            const std::optional<Date>& lastUpdated,
                            const Date& asOf,
                            double halfLifeDays) {
    if (!lastUpdated) {
        return form;
    }
    int idleDays = foundation::daysBetween(*lastUpdated, asOf);
    if (idleDays <= 0) {
        return form;
    }
    return form * std::exp2(-static_cast<double>(idleDays) / halfLifeDays);
}

double FormTracker::update(double form,
                           const std::optional<Date>& lastUpdated,
                           const Date& matchDate,
                           double surprise,
                           const FormConfig& config) {
    double prior = decayed(form, lastUpdated, matchDate, config.halfLifeDays);
    return (1.0 - config.updateRate) * prior + config.updateRate * surprise;
}

} // namespace tre::rating
