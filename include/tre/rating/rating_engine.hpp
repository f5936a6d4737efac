#pragma once

/// @file rating_engine.hpp
/// @brief Sequential fit-then-evaluate sweep over a match history.

#include <optional>
#include <string>
#include <vector>

#include "tre/rating/evaluator.hpp"
#include "tre/rating/rating_config.hpp"
#include "tre/rating/rating_snapshot.hpp"
#include "tre/rating/rating_store.hpp"
#include "tre/rating/temporal_splitter.hpp"

namespace tre::rating {

/// Everything a run produces for the exporters.
struct RunReport {
    std::string runLabel;                  ///< e.g. "2010_to_2020_test_2".
    YearWindow fitWindow;
    YearWindow evaluationWindow;
    std::size_t fitMatches = 0;
    std::size_t evaluationMatches = 0;
    std::size_t excludedMatches = 0;       ///< Outside [yearFrom, yearTo].
    std::optional<RatingSnapshot> fitSnapshot;    ///< As of Dec 31 of the last fit year.
    std::optional<RatingSnapshot> finalSnapshot;  ///< As of Dec 31 of yearTo.
    std::vector<PredictionRecord> predictions;
    EvaluationSummary summary;
    std::vector<DataQualityWarning> warnings;
};

/// Drives MatchFeed output through split, fit, evaluation and snapshots.
///
/// The engine holds configuration only; all rating state lives in the
/// RatingStore the caller passes in. Processing is strictly sequential in
/// date order, and for each evaluation match the prediction is recorded
/// before that match's update is applied.
///
/// Example:
/// @code
///   RatingEngine engine(config);
///   RatingStore store(config.rating.defaultBaseline, config.rating.blend.epsilon);
///   auto report = engine.run(std::move(matches), store);
///   if (!report) {
///       // configuration error: nothing was processed
///   }
/// @endcode
class RatingEngine {
public:
    explicit RatingEngine(EngineConfig config);

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

    /// Check that every match tier has a configured weight.
    /// @return UnknownTier for the first uncovered match.
    [[nodiscard]] EngineResult<void> validateTiers(const std::vector<Match>& matches) const;

    /// Update @p store with a single match.
    ///
    /// A missing score applies a neutral margin and appends a warning to
    /// @p warnings when given.
    EngineResult<RatingDelta> processMatch(const Match& match, RatingStore& store,
                                           std::vector<DataQualityWarning>* warnings = nullptr) const;

    /// Apply @p matches in order without recording predictions.
    /// @return MatchOutOfOrder if a match predates its predecessor.
    EngineResult<void> replay(const std::vector<Match>& matches, RatingStore& store,
                              std::vector<DataQualityWarning>* warnings = nullptr) const;

    /// Full run: validate configuration and tiers before touching @p store,
    /// split by year, fit, then predict-and-update through the evaluation
    /// window.
    EngineResult<RunReport> run(std::vector<Match> matches, RatingStore& store) const;

private:
    EngineConfig config_;
};

/// Directory-friendly label of a split, "<yf>_to_<yt>_test_<ts>".
[[nodiscard]] std::string runLabel(const SplitConfig& split);

} // namespace tre::rating
