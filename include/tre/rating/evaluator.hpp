#pragma once

/// @file evaluator.hpp
/// @brief Scoring of pre-match predictions on the held-out window.

#include <cstddef>
#include <cstdint>
#include <vector>

#include "tre/rating/match_types.hpp"

namespace tre::rating {

/// One evaluation-window prediction, recorded before the match updates ratings.
struct PredictionRecord {
    Date date;
    PlayerId playerA;
    PlayerId playerB;
    PlayerId winner;
    Tier tier = Tier::Top;
    double effectiveA = 0.0;
    double effectiveB = 0.0;
    double probabilityA = 0.5;       ///< P(A beats B).
    double winnerProbability = 0.5;  ///< Probability given to the actual winner.
    bool correct = false;            ///< winnerProbability >= 0.5.
};

/// Fixed-width probability bucket over P(A beats B).
struct CalibrationBucket {
    double lower = 0.0;
    double upper = 0.0;
    std::size_t count = 0;
    double meanPredicted = 0.0;      ///< Mean P(A) of the bucket; 0 when empty.
    double observedFrequency = 0.0;  ///< Share of bucket matches A won; 0 when empty.
};

struct EvaluationSummary {
    std::size_t matches = 0;
    double accuracy = 0.0;
    double brierScore = 0.0;       ///< Mean (P(A) - outcome_A)^2.
    double logLikelihood = 0.0;    ///< Sum of ln P(actual winner).
    double meanLogLoss = 0.0;      ///< -logLikelihood / matches.
    std::vector<CalibrationBucket> calibration;
};

/// Collects predictions in chronological order and aggregates them.
///
/// The caller must record each prediction before applying the match's
/// rating update; the Evaluator itself never touches ratings.
class Evaluator {
public:
    static constexpr uint32_t kDefaultBuckets = 10;

    explicit Evaluator(uint32_t calibrationBuckets = kDefaultBuckets);

    /// Record the pre-match prediction for @p match.
    const PredictionRecord& record(const Match& match, double effectiveA, double effectiveB,
                                   double probabilityA);

    [[nodiscard]] const std::vector<PredictionRecord>& predictions() const noexcept {
        return predictions_;
    }

    /// Accuracy, Brier score, log-likelihood and calibration over everything
    /// recorded so far. All zero (buckets empty) when nothing was recorded.
    [[nodiscard]] EvaluationSummary summarize() const;

private:
    uint32_t buckets_;
    std::vector<PredictionRecord> predictions_;
};

} // namespace tre::rating
