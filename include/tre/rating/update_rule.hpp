#pragma once

/// @file update_rule.hpp
/// @brief Per-match rating delta computation.

#include <optional>

#include "tre/rating/rating_config.hpp"

namespace tre::rating {

/// Outcome of UpdateRule::compute for one match.
struct RatingDelta {
    double expectedA = 0.5;         ///< Pre-match P(A wins).
    double actualA = 0.0;           ///< 1 if A won, else 0.
    double kFactor = 0.0;           ///< Tier weight times experience scaling.
    double marginMultiplier = 1.0;  ///< M(score); 1.0 when the score is missing.
    double deltaA = 0.0;
    double deltaB = 0.0;            ///< Always -deltaA.
    bool neutralMargin = false;     ///< True when M fell back for a missing score.

    /// S_A - E_A, the surprise fed to the FormTracker.
    [[nodiscard]] double surpriseA() const noexcept { return actualA - expectedA; }
};

/// Static utility class implementing
///   delta_A = K_tier * X * M(score) * (S_A - E_A),  delta_B = -delta_A
/// with E_A taken from the Predictor on the pre-match effective ratings.
class UpdateRule {
public:
    UpdateRule() = delete;

    /// Margin multiplier for a score; 1.0 at the narrowest win, strictly
    /// increasing in the games margin beyond that, bounded by maxMultiplier
    /// plus straightSetsBonus when the winner dropped no set.
    [[nodiscard]] static double marginMultiplier(const Score& score,
                                                 const MarginConfig& config);

    /// Experience scaling for a pair whose mean prior match count is
    /// @p meanMatchesPlayed. Exactly 1.0 when the shape is 0.
    [[nodiscard]] static double experienceScale(double meanMatchesPlayed,
                                                const ExperienceConfig& config);

    /// Compute the deltas for @p match.
    ///
    /// @param effectiveA  Player A's pre-match effective rating.
    /// @param effectiveB  Player B's pre-match effective rating.
    /// @param meanMatchesPlayed  Mean of both players' prior match counts.
    /// @return The delta, or UnknownTier if the match tier has no weight.
    [[nodiscard]] static EngineResult<RatingDelta> compute(
        const Match& match,
        double effectiveA,
        double effectiveB,
        double meanMatchesPlayed,
        const RatingConfig& config);
};

} // namespace tre::rating
