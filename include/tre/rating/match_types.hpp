#pragma once

/// @file match_types.hpp
/// @brief Match records, tiers, surfaces and score types.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "tre/foundation/date.hpp"
#include "tre/foundation/types.hpp"

namespace tre::rating {

using foundation::Date;
using foundation::PlayerId;

/// Governing circuit of a match.
///
/// Lower and Top are the two source circuits; Qualifying and Major are
/// sub-tiers of the top circuit. A tier only becomes usable once the
/// configured weight table contains it.
enum class Tier : uint8_t {
    Lower,       ///< Lower-tier circuit (ITF).
    Qualifying,  ///< Top-tier qualifying draws.
    Top,         ///< Top-tier main draws.
    Major        ///< Grand slams.
};

/// Canonical config/CSV name of a tier ("lower", "qualifying", "top", "major").
constexpr std::string_view tierName(Tier tier) {
    switch (tier) {
        case Tier::Lower:      return "lower";
        case Tier::Qualifying: return "qualifying";
        case Tier::Top:        return "top";
        case Tier::Major:      return "major";
    }
    return "unknown";
}

/// Parse a tier name. Accepts the canonical names plus the circuit aliases
/// "itf", "qual", "wta", "atp", "tour", "slam" and "grand_slam" (case-insensitive).
[[nodiscard]] std::optional<Tier> parseTier(std::string_view name);

/// Court surface. Carried for export only; ratings are surface-agnostic.
enum class Surface : uint8_t {
    Hard,
    Clay,
    Grass,
    Carpet
};

constexpr std::string_view surfaceName(Surface surface) {
    switch (surface) {
        case Surface::Hard:   return "hard";
        case Surface::Clay:   return "clay";
        case Surface::Grass:  return "grass";
        case Surface::Carpet: return "carpet";
    }
    return "unknown";
}

[[nodiscard]] std::optional<Surface> parseSurface(std::string_view name);

/// Games and sets from the winner's perspective.
struct Score {
    uint32_t gamesWon = 0;
    uint32_t gamesLost = 0;
    uint32_t setsWon = 0;
    uint32_t setsLost = 0;

    /// Winner's games minus loser's games (may be negative).
    [[nodiscard]] int gameMargin() const noexcept {
        return static_cast<int>(gamesWon) - static_cast<int>(gamesLost);
    }

    [[nodiscard]] bool straightSets() const noexcept { return setsLost == 0; }

    bool operator==(const Score&) const = default;
};

/// Parse a score line such as "6-4 3-6 7-6(5)".
///
/// Tie-break counts in parentheses are dropped and tokens that are not
/// "w-l" pairs (RET, W/O, DEF) are ignored. Returns nullopt unless the
/// winner took at least 12 games and at least 2 sets.
[[nodiscard]] std::optional<Score> parseScore(std::string_view text);

/// A completed singles match. Immutable once read from the feed.
struct Match {
    Date date;
    PlayerId playerA;
    PlayerId playerB;
    PlayerId winner;
    std::optional<Score> score;  ///< nullopt when missing or malformed.
    Tier tier = Tier::Top;
    std::optional<Surface> surface;

    [[nodiscard]] bool aWon() const noexcept { return winner == playerA; }
    [[nodiscard]] PlayerId loser() const noexcept { return aWon() ? playerB : playerA; }
};

/// A recoverable per-match data problem. The run continues.
struct DataQualityWarning {
    std::optional<Date> date;
    PlayerId playerA;
    PlayerId playerB;
    std::string reason;
};

} // namespace tre::rating
