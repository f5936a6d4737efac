#pragma once

/// @file player.hpp
/// @brief Per-player rating state held by the RatingStore.

#include <cstdint>
#include <optional>

#include "tre/rating/match_types.hpp"

namespace tre::rating {

/// Mutable rating state of one player.
///
/// baselineRating moves slowly (epsilon share of every delta) and tracks
/// long-run ability; currentRating absorbs every delta in full. formSignal
/// is the decaying average of recent prediction surprise, valid as of
/// lastActive.
struct Player {
    PlayerId id;
    double baselineRating = 1500.0;
    double currentRating = 1500.0;
    double formSignal = 0.0;            ///< In (-1, 1).
    std::optional<Date> lastActive;     ///< Unset until the first match.
    uint32_t matchesPlayed = 0;
};

} // namespace tre::rating
