/// @file match_types.cpp
/// @brief Tier/surface name parsing and score normalization.

#include "tre/rating/match_types.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace tre::rating {

namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool parseGames(std::string_view text, uint32_t& out) {
    if (text.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

// Drops "(...)" groups: "7-6(5) 6-7(10)" -> "7-6 6-7".
std::string stripTiebreaks(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    int depth = 0;
    for (char c : text) {
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            depth = std::max(0, depth - 1);
        } else if (depth == 0) {
            out += c;
        }
    }
    return out;
}

} // namespace

std::optional<Tier> parseTier(std::string_view name) {
    auto key = lowercase(name);
    if (key == "lower" || key == "itf") {
        return Tier::Lower;
    }
    if (key == "qualifying" || key == "qual") {
        return Tier::Qualifying;
    }
    if (key == "top" || key == "wta" || key == "atp" || key == "tour") {
        return Tier::Top;
    }
    if (key == "major" || key == "slam" || key == "grand_slam") {
        return Tier::Major;
    }
    return std::nullopt;
}

std::optional<Surface> parseSurface(std::string_view name) {
    auto key = lowercase(name);
    for (auto surface : {Surface::Hard, Surface::Clay, Surface::Grass, Surface::Carpet}) {
        if (surfaceName(surface) == key) {
            return surface;
        }
    }
    return std::nullopt;
}

std::optional<Score> parseScore(std::string_view text) {
    auto cleaned = stripTiebreaks(text);

    Score score;
    std::size_t pos = 0;
    while (pos < cleaned.size()) {
        while (pos < cleaned.size() && std::isspace(static_cast<unsigned char>(cleaned[pos])) != 0) {
            ++pos;
        }
        auto end = pos;
        while (end < cleaned.size() && std::isspace(static_cast<unsigned char>(cleaned[end])) == 0) {
            ++end;
        }
        if (end == pos) {
            break;
        }

        std::string_view token(cleaned.data() + pos, end - pos);
        pos = end;

        auto dash = token.find('-');
        if (dash == std::string_view::npos) {
            continue;  // RET, W/O, DEF ...
        }
        uint32_t won = 0;
        uint32_t lost = 0;
        if (!parseGames(token.substr(0, dash), won) ||
            !parseGames(token.substr(dash + 1), lost)) {
            continue;
        }

        score.gamesWon += won;
        score.gamesLost += lost;
        if (won > lost) {
            ++score.setsWon;
        } else if (won < lost) {
            ++score.setsLost;
        }
    }

    // A completed best-of-three needs at least two sets and twelve games
    // for the winner; anything short of that is a retirement or garbage.
    if (score.gamesWon < 12 || score.setsWon < 2) {
        return std::nullopt;
    }
    return score;
}

} // namespace tre::rating
