/// @file date.cpp
/// @brief Date parsing and formatting.

#include "tre/foundation/date.hpp"

#include <cctype>
#include <cstdio>

namespace tre::foundation {

namespace {

bool parseDigits(std::string_view text, int& out) {
    if (text.empty()) {
        return false;
    }
    int value = 0;
    for (char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

EngineResult<Date> malformed(std::string_view text) {
    return EngineResult<Date>::err(
        EngineError(ErrorCode::InvalidArgument,
                    "malformed date: '" + std::string(text) + "'"));
}

} // namespace

EngineResult<Date> parseDate(std::string_view text) {
    std::string_view y;
    std::string_view m;
    std::string_view d;

    if (text.size() == 10 && text[4] == '-' && text[7] == '-') {
        y = text.substr(0, 4);
        m = text.substr(5, 2);
        d = text.substr(8, 2);
    } else if (text.size() == 8) {
        // Compact form used by tournament start dates (20190107).
        y = text.substr(0, 4);
        m = text.substr(4, 2);
        d = text.substr(6, 2);
    } else {
        return malformed(text);
    }

    int year = 0;
    int month = 0;
    int day = 0;
    if (!parseDigits(y, year) || !parseDigits(m, month) || !parseDigits(d, day)) {
        return malformed(text);
    }

    Date date{std::chrono::year{year},
              std::chrono::month{static_cast<unsigned>(month)},
              std::chrono::day{static_cast<unsigned>(day)}};
    if (!date.ok()) {
        return malformed(text);
    }
    return EngineResult<Date>::ok(date);
}

std::string formatDate(const Date& date) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  static_cast<int>(date.year()),
                  static_cast<unsigned>(date.month()),
                  static_cast<unsigned>(date.day()));
    return buf;
}

int daysBetween(const Date& from, const Date& to) {
    auto delta = std::chrono::sys_days{to} - std::chrono::sys_days{from};
    return static_cast<int>(delta.count());
}

} // namespace tre::foundation
