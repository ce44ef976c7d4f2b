#pragma once

#include "common/Types.h"
#include <optional>
#include <string>

namespace instflow {
namespace utils {

// Exchange-local wall clock reading
struct LocalDateTime {
    Date date;
    int minute_of_day = 0;  // 0..1439
};

class DateUtils {
public:
    // Days since 1970-01-01
    static long long toDays(const Date& date);
    static Date fromDays(long long days);

    static Date addDays(const Date& date, int days);
    static long long daysBetween(const Date& from, const Date& to);

    // 0 = Monday .. 6 = Sunday
    static int weekday(const Date& date);
    static bool isWeekend(const Date& date);

    static std::string formatIso(const Date& date);        // YYYY-MM-DD
    static std::string formatExchange(const Date& date);   // DD-MM-YYYY
    static std::optional<Date> parseIso(const std::string& text);

    // "HH:MM" -> minutes after midnight
    static std::optional<int> parseClock(const std::string& text);

    static long long toEpochSeconds(const Date& date);
    static Date fromEpochSeconds(long long seconds, int utc_offset_minutes = 0);

    // Current wall clock at a fixed UTC offset (IST = +330)
    static LocalDateTime now(int utc_offset_minutes);
    static LocalDateTime fromTimePoint(Timestamp tp, int utc_offset_minutes);
};

} // namespace utils
} // namespace instflow
