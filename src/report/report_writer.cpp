/// @file report_writer.cpp
/// @brief ReportWriter implementation (CSV files plus a YAML metrics file).

#include "tre/report/report_writer.hpp"

#include <cstdio>
#include <fstream>
#include <functional>
#include <system_error>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "tre/foundation/engine_logger.hpp"

namespace tre::report {

using foundation::EngineError;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

std::string number(double value, int precision) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
    return buf;
}

/// Open @p path, run @p body on the stream and verify the write.
EngineResult<void> writeFile(const std::filesystem::path& path,
                             const std::function<void(std::ostream&)>& body) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::ExportFailed, "cannot open " + path.string() + " for writing"));
    }
    body(out);
    out.flush();
    if (!out) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::ExportFailed, "write to " + path.string() + " failed"));
    }
    return EngineResult<void>::ok();
}

} // namespace

std::string csvField(const std::string& field) {
    if (field.find_first_of(",\"\n\r") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

ReportWriter::ReportWriter(std::filesystem::path outputRoot,
                           const feed::PlayerDirectory& directory)
    : outputRoot_(std::move(outputRoot)), directory_(directory) {}

std::filesystem::path ReportWriter::runDirectory(const rating::RunReport& report) const {
    return outputRoot_ / report.runLabel;
}

std::string ReportWriter::displayName(foundation::PlayerId id) const {
    if (auto name = directory_.nameOf(id)) {
        return *name;
    }
    return "#" + std::to_string(id.value());
}

void ReportWriter::writeRankings(std::ostream& out,
                                 const rating::RatingSnapshot& snapshot) const {
    out << "rank,player,effective_rating,current_rating,baseline_rating,form,"
           "matches_played,last_active\n";
    std::size_t rank = 0;
    for (const auto& record : snapshot.records()) {
        out << ++rank << ','
            << csvField(displayName(record.id)) << ','
            << number(record.effectiveRating, 2) << ','
            << number(record.currentRating, 2) << ','
            << number(record.baselineRating, 2) << ','
            << number(record.formSignal, 4) << ','
            << record.matchesPlayed << ','
            << (record.lastActive ? foundation::formatDate(*record.lastActive) : "") << '\n';
    }
}

void ReportWriter::writePredictions(
    std::ostream& out, const std::vector<rating::PredictionRecord>& predictions) const {
    out << "date,player_a,player_b,winner,tier,effective_a,effective_b,"
           "prob_a,prob_winner,correct\n";
    for (const auto& p : predictions) {
        out << foundation::formatDate(p.date) << ','
            << csvField(displayName(p.playerA)) << ','
            << csvField(displayName(p.playerB)) << ','
            << csvField(displayName(p.winner)) << ','
            << rating::tierName(p.tier) << ','
            << number(p.effectiveA, 2) << ','
            << number(p.effectiveB, 2) << ','
            << number(p.probabilityA, 6) << ','
            << number(p.winnerProbability, 6) << ','
            << (p.correct ? 1 : 0) << '\n';
    }
}

void ReportWriter::writeWarnings(
    std::ostream& out, const std::vector<rating::DataQualityWarning>& warnings) const {
    out << "date,player_a,player_b,reason\n";
    for (const auto& w : warnings) {
        auto name = [this](foundation::PlayerId id) {
            return id.isValid() ? csvField(displayName(id)) : std::string();
        };
        out << (w.date ? foundation::formatDate(*w.date) : "") << ','
            << name(w.playerA) << ','
            << name(w.playerB) << ','
            << csvField(w.reason) << '\n';
    }
}

void ReportWriter::writeCalibration(std::ostream& out,
                                    const rating::EvaluationSummary& summary) {
    out << "bucket_lower,bucket_upper,count,mean_predicted,observed_frequency\n";
    for (const auto& bucket : summary.calibration) {
        out << number(bucket.lower, 2) << ','
            << number(bucket.upper, 2) << ','
            << bucket.count << ','
            << number(bucket.meanPredicted, 6) << ','
            << number(bucket.observedFrequency, 6) << '\n';
    }
}

std::string ReportWriter::metricsYaml(const rating::RunReport& report) {
    YAML::Emitter out;
    out.SetDoublePrecision(6);
    out << YAML::BeginMap;
    out << YAML::Key << "run" << YAML::Value << report.runLabel;

    out << YAML::Key << "fit_window" << YAML::Value << YAML::Flow << YAML::BeginSeq
        << report.fitWindow.firstYear << report.fitWindow.lastYear << YAML::EndSeq;
    out << YAML::Key << "evaluation_window" << YAML::Value << YAML::Flow << YAML::BeginSeq
        << report.evaluationWindow.firstYear << report.evaluationWindow.lastYear
        << YAML::EndSeq;

    out << YAML::Key << "matches" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "fit" << YAML::Value << report.fitMatches;
    out << YAML::Key << "evaluation" << YAML::Value << report.evaluationMatches;
    out << YAML::Key << "excluded" << YAML::Value << report.excludedMatches;
    out << YAML::EndMap;

    const auto& s = report.summary;
    out << YAML::Key << "metrics" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "accuracy" << YAML::Value << s.accuracy;
    out << YAML::Key << "brier_score" << YAML::Value << s.brierScore;
    out << YAML::Key << "log_likelihood" << YAML::Value << s.logLikelihood;
    out << YAML::Key << "mean_log_loss" << YAML::Value << s.meanLogLoss;
    out << YAML::EndMap;

    out << YAML::Key << "players" << YAML::Value
        << (report.finalSnapshot ? report.finalSnapshot->size() : std::size_t{0});
    out << YAML::Key << "warnings" << YAML::Value << report.warnings.size();
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

EngineResult<std::filesystem::path> ReportWriter::write(const rating::RunReport& report) const {
    auto dir = runDirectory(report);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return EngineResult<std::filesystem::path>::err(
            EngineError(ErrorCode::ExportFailed,
                        "cannot create " + dir.string() + ": " + ec.message()));
    }

    std::vector<std::pair<const char*, std::function<void(std::ostream&)>>> files;
    if (report.fitSnapshot) {
        files.emplace_back(kRankingsFitEnd,
                           [&](std::ostream& out) { writeRankings(out, *report.fitSnapshot); });
    }
    if (report.finalSnapshot) {
        files.emplace_back(kRankingsFinal,
                           [&](std::ostream& out) { writeRankings(out, *report.finalSnapshot); });
    }
    files.emplace_back(kPredictions,
                       [&](std::ostream& out) { writePredictions(out, report.predictions); });
    files.emplace_back(kCalibration,
                       [&](std::ostream& out) { writeCalibration(out, report.summary); });
    files.emplace_back(kMetrics, [&](std::ostream& out) { out << metricsYaml(report); });
    files.emplace_back(kWarnings,
                       [&](std::ostream& out) { writeWarnings(out, report.warnings); });

    for (const auto& [name, body] : files) {
        if (auto written = writeFile(dir / name, body); !written) {
            TRE_LOG_ERROR(LogCategory::Export, written.error().message());
            return EngineResult<std::filesystem::path>::err(written.error());
        }
    }

    TRE_LOG_INFO(LogCategory::Export, "report written to " + dir.string());
    return EngineResult<std::filesystem::path>::ok(std::move(dir));
}

} // namespace tre::report
