#pragma once

/// @file rating_store.hpp
/// @brief Owner of every player's mutable rating state.

#include <cstddef>
#include <unordered_map>

#include "tre/foundation/engine_result.hpp"
#include "tre/rating/player.hpp"
#include "tre/rating/rating_config.hpp"
#include "tre/rating/rating_snapshot.hpp"
#include "tre/rating/update_rule.hpp"

namespace tre::rating {

/// Post-match values for both participants of one match.
struct MatchUpdate {
    RatingDelta delta;
    double formA = 0.0;  ///< Form signal of A after the match.
    double formB = 0.0;  ///< Form signal of B after the match.
};

/// Holds rating state for every player seen so far.
///
/// A store is created per run and passed explicitly to the engine; there is
/// no process-wide ratings table. It has exactly one writer (the sweep) and
/// is not synchronized.
///
/// Example:
/// @code
///   RatingStore store(config.rating.defaultBaseline, config.rating.blend.epsilon);
///   RatingEngine engine(config);
///   auto report = engine.run(matches, store);
/// @endcode
class RatingStore {
public:
    RatingStore(double defaultBaseline, double baselineFraction);

    /// Return the player, registering it with the default baseline on
    /// first sight. Invalid ids are never registered.
    const Player& get(PlayerId id);

    /// Non-registering lookup; nullptr if the player has not appeared.
    [[nodiscard]] const Player* find(PlayerId id) const;

    /// Apply one match to both participants.
    ///
    /// current += delta, baseline += baselineFraction * delta, form is
    /// replaced, lastActive is set to the match date and matchesPlayed is
    /// incremented. Inputs are checked before anything is written, so a
    /// failed call leaves the store untouched.
    ///
    /// @return InvalidPlayer for an invalid id, a self-match, or a winner
    ///         that is neither participant.
    EngineResult<void> apply(const Match& match, const MatchUpdate& update);

    /// Copy every player's rating fields as of @p asOf.
    [[nodiscard]] RatingSnapshot snapshot(const Date& asOf, const RatingConfig& config) const;

    [[nodiscard]] std::size_t size() const noexcept { return players_.size(); }
    [[nodiscard]] double defaultBaseline() const noexcept { return defaultBaseline_; }
    [[nodiscard]] double baselineFraction() const noexcept { return baselineFraction_; }

private:
    Player makePlayer(PlayerId id) const;

    double defaultBaseline_;
    double baselineFraction_;
    Player unregistered_;  ///< Returned by get() for invalid ids.
    std::unordered_map<PlayerId, Player> players_;
};

} // namespace tre::rating
