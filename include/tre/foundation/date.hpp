#pragma once

/// @file date.hpp
/// @brief Calendar date helpers for match records.

#include <chrono>
#include <string>
#include <string_view>

#include "tre/foundation/engine_result.hpp"

namespace tre::foundation {

/// Match dates carry day precision; no time-of-day is tracked.
using Date = std::chrono::year_month_day;

/// Parse "YYYY-MM-DD" or "YYYYMMDD".
/// @return The date or InvalidArgument for malformed or impossible dates.
[[nodiscard]] EngineResult<Date> parseDate(std::string_view text);

/// Format as "YYYY-MM-DD".
[[nodiscard]] std::string formatDate(const Date& date);

/// Signed number of days from @p from to @p to.
[[nodiscard]] int daysBetween(const Date& from, const Date& to);

/// Calendar year of @p date.
[[nodiscard]] inline int yearOf(const Date& date) {
    return static_cast<int>(date.year());
}

} // namespace tre::foundation
