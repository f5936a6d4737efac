#pragma once

/// @file temporal_splitter.hpp
/// @brief Calendar-year partitioning into fit and evaluation windows.

#include <cstddef>
#include <vector>

#include "tre/rating/rating_config.hpp"

namespace tre::rating {

/// Inclusive range of calendar years.
struct YearWindow {
    int firstYear = 0;
    int lastYear = 0;

    [[nodiscard]] bool contains(const Date& date) const noexcept {
        int year = foundation::yearOf(date);
        return year >= firstYear && year <= lastYear;
    }
};

/// Matches partitioned by window, each part in non-decreasing date order.
struct TemporalSplit {
    YearWindow fitWindow;
    YearWindow evaluationWindow;
    std::vector<Match> fit;
    std::vector<Match> evaluation;
    std::size_t excludedBefore = 0;  ///< Dated before yearFrom; never used.
    std::size_t excludedAfter = 0;   ///< Dated after yearTo; never used.
};

/// Static utility class for the year-based split.
///
/// For yearFrom = 2010, yearTo = 2020, testSizeYears = 2:
///   fit window        = [2010, 2018)  -> years 2010..2017
///   evaluation window = [2018, 2020]  -> years 2018..2020
class TemporalSplitter {
public:
    TemporalSplitter() = delete;

    /// Earliest year the source data is considered reliable for.
    static constexpr int kRecommendedFirstYear = 2010;

    /// Four-digit years only, the range match dates can be read in.
    static constexpr int kMinYear = 0;
    static constexpr int kMaxYear = 9999;

    /// @return InvalidYearRange if either year lies outside
    ///         [kMinYear, kMaxYear] or yearFrom >= yearTo; InvalidTestSize if
    ///         testSizeYears < 1 or testSizeYears >= yearTo - yearFrom.
    [[nodiscard]] static EngineResult<void> validate(const SplitConfig& config);

    /// Stable-sort @p matches by date and partition them. Matches sharing a
    /// date keep their feed order.
    [[nodiscard]] static EngineResult<TemporalSplit> split(std::vector<Match> matches,
                                                           const SplitConfig& config);
};

} // namespace tre::rating
