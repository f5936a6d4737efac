#pragma once

/// @file csv_match_feed.hpp
/// @brief Reader for normalized match CSV files from the two circuits.

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "tre/feed/player_directory.hpp"
#include "tre/foundation/engine_result.hpp"
#include "tre/rating/match_types.hpp"

namespace tre::feed {

using foundation::EngineResult;
using rating::DataQualityWarning;
using rating::Match;
using rating::Tier;

/// One input file and the tier its rows default to.
struct MatchSource {
    Tier defaultTier = Tier::Top;
    std::filesystem::path path;
};

/// Reads normalized CSV match records into a merged, date-ordered sequence.
///
/// Expected header (column order is free, extra columns are ignored):
/// @code
///   date,player_a,player_b,winner,score,tier,surface
/// @endcode
/// date, player_a, player_b and winner are required; score, tier and
/// surface are optional. An empty tier cell takes the source's default.
///
/// Row-level problems (bad date, missing player, winner not in the match)
/// skip the row and add a DataQualityWarning. A malformed score is kept as
/// "no score". An unrecognised surface keeps the row without a surface and
/// adds a warning. An unrecognised tier name is a configuration error and
/// stops the read.
class CsvMatchFeed {
public:
    explicit CsvMatchFeed(PlayerDirectory& directory);

    /// Read all rows of @p in; @p sourceName labels warnings.
    EngineResult<void> read(std::istream& in, Tier defaultTier, std::string_view sourceName);

    /// Open and read @p source.path.
    EngineResult<void> readFile(const MatchSource& source);

    /// Matches read so far, stable-sorted by date (sources interleave by
    /// date; same-day matches keep read order). Leaves the feed empty.
    [[nodiscard]] std::vector<Match> takeMatches();

    [[nodiscard]] const std::vector<DataQualityWarning>& warnings() const noexcept {
        return warnings_;
    }

    [[nodiscard]] std::size_t rowsSkipped() const noexcept { return rowsSkipped_; }

private:
    void skip(std::string reason);
    void flag(const Match& match, std::string reason);

    PlayerDirectory& directory_;
    std::vector<Match> matches_;
    std::vector<DataQualityWarning> warnings_;
    std::size_t rowsSkipped_ = 0;
};

/// Split one CSV line into fields. Double-quoted fields may contain commas
/// and "" escapes; surrounding whitespace is trimmed from unquoted fields.
[[nodiscard]] std::vector<std::string> splitCsvLine(std::string_view line);

} // namespace tre::feed
