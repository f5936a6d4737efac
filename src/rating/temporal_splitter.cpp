/// @file temporal_splitter.cpp
/// @brief TemporalSplitter implementation.

#include "tre/rating/temporal_splitter.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "tre/foundation/engine_logger.hpp"

namespace tre::rating {

using foundation::EngineError;
using foundation::ErrorCode;
using foundation::LogCategory;

EngineResult<void> TemporalSplitter::validate(const SplitConfig& config) {
    for (int year : {config.yearFrom, config.yearTo}) {
        if (year < kMinYear || year > kMaxYear) {
            return EngineResult<void>::err(
                EngineError(ErrorCode::InvalidYearRange,
                            "year " + std::to_string(year) + " is outside " +
                                std::to_string(kMinYear) + ".." + std::to_string(kMaxYear),
                            config));
        }
    }
    if (config.yearFrom >= config.yearTo) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::InvalidYearRange,
                        "year_from (" + std::to_string(config.yearFrom) +
                            ") must be before year_to (" + std::to_string(config.yearTo) + ")",
                        config));
    }
    int span = config.yearTo - config.yearFrom;
    if (config.testSizeYears < 1 || config.testSizeYears >= span) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::InvalidTestSize,
                        "test_size_years (" + std::to_string(config.testSizeYears) +
                            ") must be between 1 and " + std::to_string(span - 1),
                        config));
    }
    return EngineResult<void>::ok();
}

EngineResult<TemporalSplit> TemporalSplitter::split(std::vector<Match> matches,
                                                    const SplitConfig& config) {
    if (auto valid = validate(config); !valid) {
        return EngineResult<TemporalSplit>::err(valid.error());
    }
    if (config.yearFrom < kRecommendedFirstYear) {
        TRE_LOG_WARN(LogCategory::Config,
                     "year_from " + std::to_string(config.yearFrom) +
                         " precedes " + std::to_string(kRecommendedFirstYear) +
                         "; early source data is sparse and less reliable");
    }

    std::stable_sort(matches.begin(), matches.end(),
                     [](const Match& lhs, const Match& rhs) { return lhs.date < rhs.date; });

    TemporalSplit result;
    int evaluationStart = config.yearTo - config.testSizeYears;
    result.fitWindow = YearWindow{config.yearFrom, evaluationStart - 1};
    result.evaluationWindow = YearWindow{evaluationStart, config.yearTo};

    for (auto& match : matches) {
        int year = foundation::yearOf(match.date);
        if (year < config.yearFrom) {
            ++result.excludedBefore;
        } else if (year > config.yearTo) {
            ++result.excludedAfter;
        } else if (year < evaluationStart) {
            result.fit.push_back(std::move(match));
        } else {
            result.evaluation.push_back(std::move(match));
        }
    }

    TRE_LOG_INFO(LogCategory::Core,
                 "split: " + std::to_string(result.fit.size()) + " fit, " +
                     std::to_string(result.evaluation.size()) + " evaluation, " +
                     std::to_string(result.excludedBefore + result.excludedAfter) +
                     " outside [" + std::to_string(config.yearFrom) + ", " +
                     std::to_string(config.yearTo) + "]");

    return EngineResult<TemporalSplit>::ok(std::move(result));
}

} // namespace tre::rating
