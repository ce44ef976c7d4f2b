#include "calendar/TradingCalendar.h"
#include "common/Logger.h"

namespace instflow {
namespace calendar {

namespace {
constexpr int kDefaultCutoffMinutes = 18 * 60 + 30;
}

TradingCalendar::TradingCalendar(const engine::CalendarConfig& config)
    : config_(config)
    , cutoff_minutes_(utils::DateUtils::parseClock(config.cutoff).value_or(kDefaultCutoffMinutes))
{
}

bool TradingCalendar::isTradingDay(const Date& date) const {
    if (utils::DateUtils::isWeekend(date)) {
        return false;
    }
    auto it = config_.holidays.find(date.year);
    if (it == config_.holidays.end()) {
        return true;
    }
    return it->second.count(utils::DateUtils::formatIso(date)) == 0;
}

std::optional<TradingWindow> TradingCalendar::currentWindow(const utils::LocalDateTime& now) const {
    return currentWindow(now, cutoff_minutes_);
}

std::optional<TradingWindow> TradingCalendar::currentWindow(
    const utils::LocalDateTime& now,
    int cutoff_minutes
) const {
    const Date today = now.date;
    std::optional<Date> to_date;

    if (now.minute_of_day >= cutoff_minutes && isTradingDay(today)) {
        to_date = today;
        LOG_INFO("Past cutoff, today {} is to_date", utils::DateUtils::formatExchange(today));
    } else {
        for (int back = 1; back <= config_.to_date_max_lookback; ++back) {
            const Date candidate = utils::DateUtils::addDays(today, -back);
            if (isTradingDay(candidate)) {
                to_date = candidate;
                break;
            }
        }
        if (!to_date) {
            LOG_WARN("No trading day in the last {} days, window unavailable", config_.to_date_max_lookback);
            return std::nullopt;
        }
        LOG_INFO("Before cutoff or closed today, last trading day {} is to_date",
                 utils::DateUtils::formatExchange(*to_date));
    }

    TradingWindow window;
    window.to = *to_date;
    window.from = *to_date;

    int steps = 0;
    Date candidate = utils::DateUtils::addDays(*to_date, -1);
    while (steps < config_.window_trading_days_back) {
        if (utils::DateUtils::daysBetween(candidate, *to_date) > config_.window_max_calendar_days) {
            LOG_WARN("Could not find {} trading days back within {} days",
                     config_.window_trading_days_back, config_.window_max_calendar_days);
            window.complete = false;
            break;
        }
        if (isTradingDay(candidate)) {
            ++steps;
            window.from = candidate;
        }
        candidate = utils::DateUtils::addDays(candidate, -1);
    }

    window.trading_days = steps + 1;
    window.label = utils::DateUtils::formatExchange(window.from) + " → " +
                   utils::DateUtils::formatExchange(window.to);
    LOG_INFO("Date range: {} ({} trading days)", window.label, window.trading_days);
    return window;
}

utils::LocalDateTime TradingCalendar::exchangeNow() const {
    return utils::DateUtils::now(config_.utc_offset_minutes);
}

} // namespace calendar
} // namespace instflow
