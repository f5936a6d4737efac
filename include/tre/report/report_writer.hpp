#pragma once

/// @file report_writer.hpp
/// @brief Writes a finished run to its output directory.
///
/// Layout of one run under the output root:
/// @code
///   <root>/<yf>_to_<yt>_test_<ts>/
///     rankings_fit_end.csv   ratings as of the end of the fit window
///     rankings_final.csv     ratings as of the end of the evaluation window
///     predictions.csv        one row per evaluation match
///     calibration.csv        reliability buckets over P(A)
///     metrics.yaml           accuracy, Brier score, log-likelihood, counts
///     warnings.csv           data quality warnings of the run
/// @endcode

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "tre/feed/player_directory.hpp"
#include "tre/foundation/engine_result.hpp"
#include "tre/rating/rating_engine.hpp"

namespace tre::report {

using foundation::EngineResult;

/// Renders RunReport parts as CSV and YAML, using player names from the
/// directory the feed filled.
class ReportWriter {
public:
    static constexpr const char* kRankingsFitEnd = "rankings_fit_end.csv";
    static constexpr const char* kRankingsFinal = "rankings_final.csv";
    static constexpr const char* kPredictions = "predictions.csv";
    static constexpr const char* kCalibration = "calibration.csv";
    static constexpr const char* kMetrics = "metrics.yaml";
    static constexpr const char* kWarnings = "warnings.csv";

    ReportWriter(std::filesystem::path outputRoot, const feed::PlayerDirectory& directory);

    /// Directory a run with @p report's label is written to.
    [[nodiscard]] std::filesystem::path runDirectory(const rating::RunReport& report) const;

    /// Create the run directory and write every file into it.
    /// @return The run directory, or ExportFailed naming the failing file.
    EngineResult<std::filesystem::path> write(const rating::RunReport& report) const;

    void writeRankings(std::ostream& out, const rating::RatingSnapshot& snapshot) const;
    void writePredictions(std::ostream& out,
                          const std::vector<rating::PredictionRecord>& predictions) const;
    void writeWarnings(std::ostream& out,
                       const std::vector<rating::DataQualityWarning>& warnings) const;
    static void writeCalibration(std::ostream& out, const rating::EvaluationSummary& summary);
    [[nodiscard]] static std::string metricsYaml(const rating::RunReport& report);

private:
    [[nodiscard]] std::string displayName(foundation::PlayerId id) const;

    std::filesystem::path outputRoot_;
    const feed::PlayerDirectory& directory_;
};

/// Quote @p field for CSV when it contains a comma, quote or newline.
[[nodiscard]] std::string csvField(const std::string& field);

} // namespace tre::report
