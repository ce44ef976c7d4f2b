#pragma once

#include "common/DateUtils.h"
#include "common/Types.h"
#include "engine/EngineConfig.h"
#include <optional>
#include <string>

namespace instflow {
namespace calendar {

// Disclosure window handed to the primary deal provider
struct TradingWindow {
    Date from;
    Date to;
    int trading_days = 0;       // inclusive count, 6 when complete
    bool complete = true;       // false when the calendar-day bound was hit
    std::string label;          // "DD-MM-YYYY → DD-MM-YYYY"
};

class TradingCalendar {
public:
    explicit TradingCalendar(const engine::CalendarConfig& config);

    // Weekends and configured exchange holidays are closed
    bool isTradingDay(const Date& date) const;

    // Most recent completed window at the configured cutoff
    std::optional<TradingWindow> currentWindow(const utils::LocalDateTime& now) const;
    std::optional<TradingWindow> currentWindow(const utils::LocalDateTime& now, int cutoff_minutes) const;

    // Wall clock in exchange time
    utils::LocalDateTime exchangeNow() const;

    int cutoffMinutes() const { return cutoff_minutes_; }

private:
    engine::CalendarConfig config_;
    int cutoff_minutes_;
};

} // namespace calendar
} // namespace instflow
