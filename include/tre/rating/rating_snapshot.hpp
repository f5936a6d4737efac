#pragma once

/// @file rating_snapshot.hpp
/// @brief Immutable, dated copy of every player's rating fields.

#include <cstdint>
#include <optional>
#include <vector>

#include "tre/rating/match_types.hpp"

namespace tre::rating {

/// One player's row in a snapshot. Form is decayed to the snapshot date.
struct PlayerRatingRecord {
    PlayerId id;
    double baselineRating = 0.0;
    double currentRating = 0.0;
    double formSignal = 0.0;
    double effectiveRating = 0.0;
    std::optional<Date> lastActive;
    uint32_t matchesPlayed = 0;
};

/// Ratings as of a date, ordered by effective rating (highest first; ties
/// by ascending player id). Produced by RatingStore::snapshot().
class RatingSnapshot {
public:
    RatingSnapshot(Date asOf, std::vector<PlayerRatingRecord> records);

    [[nodiscard]] const Date& asOf() const noexcept { return asOf_; }
    [[nodiscard]] const std::vector<PlayerRatingRecord>& records() const noexcept { return records_; }
    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }

    /// Lookup by player; nullptr when the player had not appeared yet.
    [[nodiscard]] const PlayerRatingRecord* find(PlayerId id) const;

    /// One-based rank of @p id, or nullopt when absent.
    [[nodiscard]] std::optional<std::size_t> rankOf(PlayerId id) const;

private:
    Date asOf_;
    std::vector<PlayerRatingRecord> records_;
};

} // namespace tre::rating
