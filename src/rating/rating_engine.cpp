/// @file rating_engine.cpp
/// @brief RatingEngine implementation.

#include "tre/rating/rating_engine.hpp"

#include <chrono>
#include <string>
#include <utility>

#include "tre/foundation/engine_logger.hpp"
#include "tre/rating/blender.hpp"
#include "tre/rating/form_tracker.hpp"
#include "tre/rating/predictor.hpp"

namespace tre::rating {

using foundation::EngineError;
using foundation::EngineLogger;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

Date endOfYear(int year) {
    return Date{std::chrono::year{year}, std::chrono::December, std::chrono::day{31}};
}

/// Reason a match cannot be rated, or nullopt when it is usable.
std::optional<std::string> structuralProblem(const Match& match) {
    if (!match.playerA.isValid() || !match.playerB.isValid()) {
        return "invalid player id";
    }
    if (match.playerA == match.playerB) {
        return "player listed on both sides";
    }
    if (match.winner != match.playerA && match.winner != match.playerB) {
        return "winner is not a participant";
    }
    return std::nullopt;
}

void warn(std::vector<DataQualityWarning>* sink, const Match& match, std::string reason) {
    LogContext ctx;
    ctx.matchDate = foundation::formatDate(match.date);
    ctx.extra["player_a"] = std::to_string(match.playerA.value());
    ctx.extra["player_b"] = std::to_string(match.playerB.value());
    ctx.extra["reason"] = reason;
    EngineLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Feed,
                                            "data quality issue", ctx);
    if (sink != nullptr) {
        sink->push_back(DataQualityWarning{match.date, match.playerA, match.playerB,
                                           std::move(reason)});
    }
}

} // namespace

std::string runLabel(const SplitConfig& split) {
    return std::to_string(split.yearFrom) + "_to_" + std::to_string(split.yearTo) +
           "_test_" + std::to_string(split.testSizeYears);
}

RatingEngine::RatingEngine(EngineConfig config) : config_(std::move(config)) {}

EngineResult<void> RatingEngine::validateTiers(const std::vector<Match>& matches) const {
    for (const auto& match : matches) {
        if (!config_.rating.tierWeights.contains(match.tier)) {
            return EngineResult<void>::err(
                EngineError(ErrorCode::UnknownTier,
                            "match on " + foundation::formatDate(match.date) +
                                " uses tier '" + std::string(tierName(match.tier)) +
                                "' which has no configured weight",
                            match.tier));
        }
    }
    return EngineResult<void>::ok();
}

EngineResult<RatingDelta> RatingEngine::processMatch(
    const Match& match, RatingStore& store,
    std::vector<DataQualityWarning>* warnings) const {
    const auto& rating = config_.rating;

    // Copies: registering B may rehash the store.
    Player a = store.get(match.playerA);
    Player b = store.get(match.playerB);

    double effectiveA = Blender::effectiveRating(a, match.date, rating);
    double effectiveB = Blender::effectiveRating(b, match.date, rating);
    double meanPlayed = (static_cast<double>(a.matchesPlayed) +
                         static_cast<double>(b.matchesPlayed)) / 2.0;

    auto computed = UpdateRule::compute(match, effectiveA, effectiveB, meanPlayed, rating);
    if (!computed) {
        return computed;
    }
    const auto& delta = computed.value();
    if (delta.neutralMargin) {
        warn(warnings, match, "missing or malformed score; neutral margin applied");
    }

    MatchUpdate update;
    update.delta = delta;
    update.formA = FormTracker::update(a.formSignal, a.lastActive, match.date,
                                       delta.surpriseA(), rating.form);
    update.formB = FormTracker::update(b.formSignal, b.lastActive, match.date,
                                       -delta.surpriseA(), rating.form);

    if (auto applied = store.apply(match, update); !applied) {
        return EngineResult<RatingDelta>::err(applied.error());
    }

    if (EngineLogger::instance().isEnabled(LogLevel::Debug, LogCategory::Rating)) {
        LogContext ctx;
        ctx.matchDate = foundation::formatDate(match.date);
        ctx.playerId = match.playerA;
        ctx.extra["expected_a"] = std::to_string(delta.expectedA);
        ctx.extra["k"] = std::to_string(delta.kFactor);
        ctx.extra["margin"] = std::to_string(delta.marginMultiplier);
        ctx.extra["delta_a"] = std::to_string(delta.deltaA);
        EngineLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Rating,
                                                "match applied", ctx);
    }

    return computed;
}

EngineResult<void> RatingEngine::replay(const std::vector<Match>& matches, RatingStore& store,
                                        std::vector<DataQualityWarning>* warnings) const {
    const Match* previous = nullptr;
    for (const auto& match : matches) {
        if (previous != nullptr && match.date < previous->date) {
            return EngineResult<void>::err(
                EngineError(ErrorCode::MatchOutOfOrder,
                            "match on " + foundation::formatDate(match.date) +
                                " follows a match on " + foundation::formatDate(previous->date)));
        }
        auto processed = processMatch(match, store, warnings);
        if (!processed) {
            return EngineResult<void>::err(processed.error());
        }
        previous = &match;
    }
    return EngineResult<void>::ok();
}

EngineResult<RunReport> RatingEngine::run(std::vector<Match> matches, RatingStore& store) const {
    // Configuration problems surface before any match is touched.
    if (auto valid = config_.validate(); !valid) {
        return EngineResult<RunReport>::err(valid.error());
    }
    if (auto tiers = validateTiers(matches); !tiers) {
        return EngineResult<RunReport>::err(tiers.error());
    }

    RunReport report;
    report.runLabel = runLabel(config_.split);

    std::vector<Match> usable;
    usable.reserve(matches.size());
    for (auto& match : matches) {
        if (auto problem = structuralProblem(match)) {
            warn(&report.warnings, match, *problem);
            continue;
        }
        usable.push_back(std::move(match));
    }

    auto split = TemporalSplitter::split(std::move(usable), config_.split);
    if (!split) {
        return EngineResult<RunReport>::err(split.error());
    }
    auto& windows = split.value();
    report.fitWindow = windows.fitWindow;
    report.evaluationWindow = windows.evaluationWindow;
    report.fitMatches = windows.fit.size();
    report.evaluationMatches = windows.evaluation.size();
    report.excludedMatches = windows.excludedBefore + windows.excludedAfter;

    LogContext runCtx;
    runCtx.runId = report.runLabel;
    EngineLogger::instance().logWithContext(
        LogLevel::Info, LogCategory::Core,
        "fitting on " + std::to_string(report.fitMatches) + " matches", runCtx);

    if (auto fitted = replay(windows.fit, store, &report.warnings); !fitted) {
        return EngineResult<RunReport>::err(fitted.error());
    }
    report.fitSnapshot = store.snapshot(endOfYear(windows.fitWindow.lastYear), config_.rating);

    EngineLogger::instance().logWithContext(
        LogLevel::Info, LogCategory::Evaluation,
        "evaluating " + std::to_string(report.evaluationMatches) + " matches", runCtx);

    Evaluator evaluator(config_.evaluation.calibrationBuckets);
    for (const auto& match : windows.evaluation) {
        // Predict from the pre-match state, then let the match update it.
        const Player a = store.get(match.playerA);
        const Player b = store.get(match.playerB);
        double effectiveA = Blender::effectiveRating(a, match.date, config_.rating);
        double effectiveB = Blender::effectiveRating(b, match.date, config_.rating);
        double probabilityA = Predictor::winProbability(effectiveA, effectiveB,
                                                        config_.rating.logisticScale);
        evaluator.record(match, effectiveA, effectiveB, probabilityA);

        auto processed = processMatch(match, store, &report.warnings);
        if (!processed) {
            return EngineResult<RunReport>::err(processed.error());
        }
    }

    report.summary = evaluator.summarize();
    report.predictions = evaluator.predictions();
    report.finalSnapshot = store.snapshot(endOfYear(windows.evaluationWindow.lastYear),
                                          config_.rating);

    runCtx.extra["accuracy"] = std::to_string(report.summary.accuracy);
    runCtx.extra["brier"] = std::to_string(report.summary.brierScore);
    runCtx.extra["warnings"] = std::to_string(report.warnings.size());
    EngineLogger::instance().logWithContext(LogLevel::Info, LogCategory::Evaluation,
                                            "run complete", runCtx);

    return EngineResult<RunReport>::ok(std::move(report));
}

} // namespace tre::rating
