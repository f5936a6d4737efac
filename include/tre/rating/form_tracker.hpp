#pragma once

/// @file form_tracker.hpp
/// @brief Short-window form signal with inactivity decay.

#include <optional>

#include "tre/rating/rating_config.hpp"

namespace tre::rating {

/// Static utility class maintaining the form signal.
///
/// The form signal is an exponentially weighted average of surprise terms
/// (S - E). Between matches it relaxes toward zero with a half-life in days:
///   f(t) = f(t0) * 2^(-(t - t0) / halfLife)
/// On a match the decayed value is blended with the new surprise:
///   f' = (1 - rate) * f(t) + rate * (S - E)
/// Tier weight plays no part: form tracks surprise, not rating movement.
class FormTracker {
public:
    FormTracker() = delete;

    /// Form as seen at @p asOf. Unchanged when @p lastUpdated is unset or
    /// not earlier than @p asOf.
    [[nodiscard]] static double decayed(double form,
                                        const std::optional<Date>& lastUpdated,
                                        const Date& asOf,
                                        double halfLifeDays);

    /// Form after a match on @p matchDate with surprise @p surprise.
    [[nodiscard]] static double update(double form,
                                       const std::optional<Date>& lastUpdated,
                                       const Date& matchDate,
                                       double surprise,
                                       const FormConfig& config);
};

} // namespace tre::rating
