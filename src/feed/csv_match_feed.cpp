/// @file csv_match_feed.cpp
/// @brief CsvMatchFeed implementation.

#include "tre/feed/csv_match_feed.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <optional>
#include <utility>

#include "tre/foundation/date.hpp"
#include "tre/foundation/engine_logger.hpp"

namespace tre::feed {

using foundation::EngineError;
using foundation::EngineLogger;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

enum Column : std::size_t {
    kDate,
    kPlayerA,
    kPlayerB,
    kWinner,
    kScore,
    kTier,
    kSurface,
    kColumnCount
};

constexpr std::array<std::string_view, kColumnCount> kColumnNames = {
    "date", "player_a", "player_b", "winner", "score", "tier", "surface"
};

constexpr std::size_t kRequiredColumns = kWinner + 1;

std::string trim(std::string_view text) {
    auto begin = text.find_first_not_of(" \t\r");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r");
    return std::string(text.substr(begin, end - begin + 1));
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

std::vector<std::string> splitCsvLine(std::string_view line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    bool wasQuoted = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            quoted = true;
            wasQuoted = true;
        } else if (c == ',') {
            fields.push_back(wasQuoted ? field : trim(field));
            field.clear();
            wasQuoted = false;
        } else {
            field += c;
        }
    }
    fields.push_back(wasQuoted ? field : trim(field));
    return fields;
}

CsvMatchFeed::CsvMatchFeed(PlayerDirectory& directory) : directory_(directory) {}

void CsvMatchFeed::skip(std::string reason) {
    ++rowsSkipped_;
    LogContext ctx;
    ctx.extra["reason"] = reason;
    EngineLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Feed,
                                            "row skipped", ctx);
    DataQualityWarning warning;
    warning.reason = std::move(reason);
    warnings_.push_back(std::move(warning));
}

void CsvMatchFeed::flag(const Match& match, std::string reason) {
    LogContext ctx;
    ctx.matchDate = foundation::formatDate(match.date);
    ctx.extra["reason"] = reason;
    EngineLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Feed,
                                            "row kept with warning", ctx);
    DataQualityWarning warning;
    warning.date = match.date;
    warning.playerA = match.playerA;
    warning.playerB = match.playerB;
    warning.reason = std::move(reason);
    warnings_.push_back(std::move(warning));
}

EngineResult<void> CsvMatchFeed::read(std::istream& in, Tier defaultTier,
                                      std::string_view sourceName) {
    std::string line;
    if (!std::getline(in, line)) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::FeedMalformedHeader,
                        std::string(sourceName) + ": empty input, header expected"));
    }

    std::array<std::optional<std::size_t>, kColumnCount> columns;
    auto header = splitCsvLine(line);
    for (std::size_t i = 0; i < header.size(); ++i) {
        auto name = lowercase(header[i]);
        for (std::size_t c = 0; c < kColumnCount; ++c) {
            if (name == kColumnNames[c]) {
                columns[c] = i;
            }
        }
    }
    for (std::size_t c = 0; c < kRequiredColumns; ++c) {
        if (!columns[c]) {
            return EngineResult<void>::err(
                EngineError(ErrorCode::FeedMalformedHeader,
                            std::string(sourceName) + ": missing required column '" +
                                std::string(kColumnNames[c]) + "'"));
        }
    }

    std::size_t lineNumber = 1;
    std::size_t accepted = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (trim(line).empty()) {
            continue;
        }
        auto fields = splitCsvLine(line);
        auto cell = [&](Column c) -> std::string {
            if (!columns[c] || *columns[c] >= fields.size()) {
                return {};
            }
            return fields[*columns[c]];
        };
        auto where = std::string(sourceName) + ":" + std::to_string(lineNumber);

        auto date = foundation::parseDate(cell(kDate));
        if (!date) {
            skip(where + ": " + std::string(date.error().message()));
            continue;
        }
        auto nameA = cell(kPlayerA);
        auto nameB = cell(kPlayerB);
        auto winnerName = cell(kWinner);
        if (nameA.empty() || nameB.empty()) {
            skip(where + ": missing player name");
            continue;
        }
        if (nameA == nameB) {
            skip(where + ": player '" + nameA + "' listed on both sides");
            continue;
        }
        if (winnerName != nameA && winnerName != nameB) {
            skip(where + ": winner '" + winnerName + "' did not play this match");
            continue;
        }

        Tier tier = defaultTier;
        if (auto tierText = cell(kTier); !tierText.empty()) {
            auto parsed = rating::parseTier(tierText);
            if (!parsed) {
                return EngineResult<void>::err(
                    EngineError(ErrorCode::UnknownTier,
                                where + ": unknown tier '" + tierText + "'"));
            }
            tier = *parsed;
        }

        Match match;
        match.date = date.value();
        match.playerA = directory_.intern(nameA);
        match.playerB = directory_.intern(nameB);
        match.winner = winnerName == nameA ? match.playerA : match.playerB;
        match.score = rating::parseScore(cell(kScore));
        match.tier = tier;
        if (auto surfaceText = cell(kSurface); !surfaceText.empty()) {
            match.surface = rating::parseSurface(surfaceText);
            if (!match.surface) {
                flag(match, where + ": unknown surface '" + surfaceText + "'");
            }
        }
        matches_.push_back(std::move(match));
        ++accepted;
    }

    TRE_LOG_INFO(LogCategory::Feed,
                 std::string(sourceName) + ": " + std::to_string(accepted) +
                     " matches read as '" + std::string(rating::tierName(defaultTier)) +
                     "' by default");
    return EngineResult<void>::ok();
}

EngineResult<void> CsvMatchFeed::readFile(const MatchSource& source) {
    std::ifstream in(source.path);
    if (!in) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::FeedOpenFailed,
                        "failed to open match file: " + source.path.string()));
    }
    return read(in, source.defaultTier, source.path.filename().string());
}

std::vector<Match> CsvMatchFeed::takeMatches() {
    std::stable_sort(matches_.begin(), matches_.end(),
                     [](const Match& lhs, const Match& rhs) { return lhs.date < rhs.date; });
    std::vector<Match> out = std::move(matches_);
    matches_.clear();
    return out;
}

} // namespace tre::feed
