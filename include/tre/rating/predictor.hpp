#pragma once

/// @file predictor.hpp
/// @brief Logistic win-probability link between effective ratings.

namespace tre::rating {

/// Static utility class mapping a rating differential to a win probability.
///
/// Uses the standard Elo link with base 10:
///   P(A beats B) = 1 / (1 + 10^(-(R_A - R_B) / S))
///
/// The scaled differential is clamped to +/-kMaxExponent, which keeps the
/// output strictly inside (0, 1) for every finite input while leaving
/// P(A, B) + P(B, A) = 1.
class Predictor {
public:
    Predictor() = delete;

    /// Default logistic scale: a 400 point gap gives ~0.909.
    static constexpr double kDefaultScale = 400.0;

    /// Bound on |(R_A - R_B) / S|; 10^12 keeps both tails representable.
    static constexpr double kMaxExponent = 12.0;

    /// Probability that the player rated @p ratingA beats the player rated @p ratingB.
    [[nodiscard]] static double winProbability(double ratingA, double ratingB,
                                               double scale = kDefaultScale);

    /// Natural-log likelihood of an observed result given @p probabilityA.
    [[nodiscard]] static double logLikelihood(double probabilityA, bool aWon);
};

} // namespace tre::rating
