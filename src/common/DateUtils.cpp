#include "common/DateUtils.h"

#include <cctype>
#include <cstdio>

namespace instflow {
namespace utils {

// civil <-> serial day conversion (H. Hinnant's algorithm)
long long DateUtils::toDays(const Date& date) {
    int y = date.year;
    const unsigned m = static_cast<unsigned>(date.month);
    const unsigned d = static_cast<unsigned>(date.day);
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

Date DateUtils::fromDays(long long days) {
    days += 719468;
    const long long era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long y = static_cast<long long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return Date(static_cast<int>(y + (m <= 2 ? 1 : 0)), static_cast<int>(m), static_cast<int>(d));
}

Date DateUtils::addDays(const Date& date, int days) {
    return fromDays(toDays(date) + days);
}

long long DateUtils::daysBetween(const Date& from, const Date& to) {
    return toDays(to) - toDays(from);
}

int DateUtils::weekday(const Date& date) {
    // 1970-01-01 was a Thursday (index 3)
    const long long days = toDays(date);
    const long long idx = (days + 3) % 7;
    return static_cast<int>(idx < 0 ? idx + 7 : idx);
}

bool DateUtils::isWeekend(const Date& date) {
    return weekday(date) >= 5;
}

std::string DateUtils::formatIso(const Date& date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", date.year, date.month, date.day);
    return buf;
}

std::string DateUtils::formatExchange(const Date& date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d-%02d-%04d", date.day, date.month, date.year);
    return buf;
}

std::optional<Date> DateUtils::parseIso(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    for (size_t i : {0u, 1u, 2u, 3u, 5u, 6u, 8u, 9u}) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
    }
    Date d(std::stoi(text.substr(0, 4)), std::stoi(text.substr(5, 2)), std::stoi(text.substr(8, 2)));
    if (d.month < 1 || d.month > 12 || d.day < 1 || d.day > 31) {
        return std::nullopt;
    }
    // reject 2026-02-30 and friends
    if (fromDays(toDays(d)) != d) {
        return std::nullopt;
    }
    return d;
}

std::optional<int> DateUtils::parseClock(const std::string& text) {
    const auto colon = text.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) {
        return std::nullopt;
    }
    try {
        const int hh = std::stoi(text.substr(0, colon));
        const int mm = std::stoi(text.substr(colon + 1));
        if (hh < 0 || hh > 23 || mm < 0 || mm > 59) return std::nullopt;
        return hh * 60 + mm;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

long long DateUtils::toEpochSeconds(const Date& date) {
    return toDays(date) * 86400LL;
}

Date DateUtils::fromEpochSeconds(long long seconds, int utc_offset_minutes) {
    long long local = seconds + static_cast<long long>(utc_offset_minutes) * 60;
    long long days = local / 86400;
    if (local % 86400 < 0) --days;
    return fromDays(days);
}

LocalDateTime DateUtils::now(int utc_offset_minutes) {
    return fromTimePoint(std::chrono::system_clock::now(), utc_offset_minutes);
}

LocalDateTime DateUtils::fromTimePoint(Timestamp tp, int utc_offset_minutes) {
    const long long secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    const long long local = secs + static_cast<long long>(utc_offset_minutes) * 60;
    long long days = local / 86400;
    long long rem = local % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }

    LocalDateTime out;
    out.date = fromDays(days);
    out.minute_of_day = static_cast<int>(rem / 60);
    return out;
}

} // namespace utils
} // namespace instflow
