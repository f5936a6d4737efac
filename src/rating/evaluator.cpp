/// @file evaluator.cpp
/// @brief Evaluator implementation.

#include "tre/rating/evaluator.hpp"

#include <algorithm>

#include "tre/rating/predictor.hpp"

namespace tre::rating {

Evaluator::Evaluator(uint32_t calibrationBuckets)
    : buckets_(std::max<uint32_t>(1, calibrationBuckets)) {}

const PredictionRecord& Evaluator::record(const Match& match, double effectiveA,
                                          double effectiveB, double probabilityA) {
    PredictionRecord record;
    record.date = match.date;
    record.playerA = match.playerA;
    record.playerB = match.playerB;
    record.winner = match.winner;
    record.tier = match.tier;
    record.effectiveA = effectiveA;
    record.effectiveB = effectiveB;
    record.probabilityA = probabilityA;
    record.winnerProbability = match.aWon() ? probabilityA : 1.0 - probabilityA;
    record.correct = record.winnerProbability >= 0.5;
    predictions_.push_back(record);
    return predictions_.back();
}

EvaluationSummary Evaluator::summarize() const {
    EvaluationSummary summary;
    summary.matches = predictions_.size();

    double width = 1.0 / static_cast<double>(buckets_);
    summary.calibration.resize(buckets_);
    for (uint32_t i = 0; i < buckets_; ++i) {
        summary.calibration[i].lower = width * i;
        summary.calibration[i].upper = i + 1 == buckets_ ? 1.0 : width * (i + 1);
    }

    if (predictions_.empty()) {
        return summary;
    }

    std::size_t correct = 0;
    double squaredError = 0.0;
    std::vector<double> predictedSum(buckets_, 0.0);
    std::vector<std::size_t> winsA(buckets_, 0);

    for (const auto& p : predictions_) {
        bool aWon = p.winner == p.playerA;
        double outcomeA = aWon ? 1.0 : 0.0;

        if (p.correct) {
            ++correct;
        }
        squaredError += (p.probabilityA - outcomeA) * (p.probabilityA - outcomeA);
        summary.logLikelihood += Predictor::logLikelihood(p.probabilityA, aWon);

        auto idx = static_cast<std::size_t>(p.probabilityA * buckets_);
        idx = std::min<std::size_t>(idx, buckets_ - 1);
        ++summary.calibration[idx].count;
        predictedSum[idx] += p.probabilityA;
        if (aWon) {
            ++winsA[idx];
        }
    }

    auto n = static_cast<double>(summary.matches);
    summary.accuracy = static_cast<double>(correct) / n;
    summary.brierScore = squaredError / n;
    summary.meanLogLoss = -summary.logLikelihood / n;

    for (uint32_t i = 0; i < buckets_; ++i) {
        auto& bucket = summary.calibration[i];
        if (bucket.count == 0) {
            continue;
        }
        auto count = static_cast<double>(bucket.count);
        bucket.meanPredicted = predictedSum[i] / count;
        bucket.observedFrequency = static_cast<double>(winsA[i]) / count;
    }

    return summary;
}

} // namespace tre::rating
