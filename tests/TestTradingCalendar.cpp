#include "calendar/TradingCalendar.h"
#include <cassert>
#include <iostream>

using namespace instflow;

namespace {
utils::LocalDateTime at(int y, int m, int d, int hh, int mm) {
    utils::LocalDateTime t;
    t.date = Date(y, m, d);
    t.minute_of_day = hh * 60 + mm;
    return t;
}
}

int main() {
    std::cout << "[TEST] Starting TradingCalendar Test..." << std::endl;

    engine::CalendarConfig config;
    calendar::TradingCalendar cal(config);

    // 1. Trading days
    assert(cal.isTradingDay(Date(2026, 2, 16)));        // Monday
    assert(!cal.isTradingDay(Date(2026, 2, 14)));       // Saturday
    assert(!cal.isTradingDay(Date(2026, 2, 15)));       // Sunday
    assert(!cal.isTradingDay(Date(2026, 1, 26)));       // Republic Day
    assert(!cal.isTradingDay(Date(2026, 3, 20)));
    assert(cal.cutoffMinutes() == 18 * 60 + 30);

    // 2. After cutoff on a trading day: today closes the window
    {
        auto w = cal.currentWindow(at(2026, 2, 17, 19, 0));
        assert(w.has_value());
        assert(w->to == Date(2026, 2, 17));
        assert(w->from == Date(2026, 2, 10));
        assert(w->trading_days == 6);
        assert(w->complete);
        assert(w->label == "10-02-2026 → 17-02-2026");
    }

    // 3. Exactly at the cutoff counts as past it
    {
        auto w = cal.currentWindow(at(2026, 2, 17, 18, 30));
        assert(w && w->to == Date(2026, 2, 17));
    }

    // 4. Before cutoff: last completed trading day
    {
        auto w = cal.currentWindow(at(2026, 2, 17, 10, 0));
        assert(w.has_value());
        assert(w->to == Date(2026, 2, 16));
        assert(w->from == Date(2026, 2, 9));
        assert(w->label == "09-02-2026 → 16-02-2026");
    }

    // 5. Weekend evening after two holidays
    {
        auto w = cal.currentWindow(at(2026, 3, 21, 20, 0));
        assert(w.has_value());
        assert(w->to == Date(2026, 3, 18));
        assert(w->from == Date(2026, 3, 11));
    }

    // 6. Explicit cutoff overload
    {
        auto w = cal.currentWindow(at(2026, 2, 17, 10, 0), 9 * 60);
        assert(w && w->to == Date(2026, 2, 17));
    }

    // 7. No trading day among the lookback candidates
    {
        engine::CalendarConfig closed;
        closed.holidays[2026] = {"2026-06-05", "2026-06-08", "2026-06-09",
                                 "2026-06-10", "2026-06-11", "2026-06-12"};
        calendar::TradingCalendar closed_cal(closed);
        auto w = closed_cal.currentWindow(at(2026, 6, 15, 9, 0));
        assert(!w.has_value());
    }

    // 8. Calendar-day bound hit: window flagged incomplete
    {
        engine::CalendarConfig tight;
        tight.window_max_calendar_days = 3;
        calendar::TradingCalendar tight_cal(tight);
        auto w = tight_cal.currentWindow(at(2026, 2, 17, 19, 0));
        assert(w.has_value());
        assert(!w->complete);
        assert(w->to == Date(2026, 2, 17));
        assert(w->from == Date(2026, 2, 16));
        assert(w->trading_days == 2);
    }

    // 9. Malformed cutoff falls back to 18:30
    {
        engine::CalendarConfig bad;
        bad.cutoff = "late";
        calendar::TradingCalendar bad_cal(bad);
        assert(bad_cal.cutoffMinutes() == 18 * 60 + 30);
    }

    std::cout << "[TEST] TradingCalendar Test PASSED!" << std::endl;
    return 0;
}
