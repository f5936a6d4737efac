/// @file predictor.cpp
/// @brief Predictor implementation.

#include "tre/rating/predictor.hpp"

#include <algorithm>
#include <cmath>

namespace tre::rating {

double Predictor::winProbability(double ratingA, double ratingB, double scale) {
    double exponent = (ratingB - ratingA) / scale;
    exponent = std::clamp(exponent, -kMaxExponent, kMaxExponent);
    return 1.0 / (1.0 + std::pow(10.0, exponent));
}

double Predictor::logLikelihood(double probabilityA, bool aWon) {
    return std::log(aWon ? probabilityA : 1.0 - probabilityA);
}

} // namespace tre::rating
