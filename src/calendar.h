#pragma once

#include <ctime>
#include <set>
#include <string>

namespace ds {

/// Calendar date of a daily bar (no time-of-day, no timezone).
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    /// Parse "YYYY-MM-DD". Throws std::invalid_argument on malformed or
    /// impossible dates (e.g. 2025-02-30).
    static Date parse(const std::string& text);

    /// UTC calendar date of an epoch timestamp.
    static Date from_time_t(time_t t);

    /// Current date in the local timezone of the process.
    static Date today();

    std::string to_string() const;

    /// Midnight UTC of this date.
    time_t to_time_t() const;

    Date add_days(int days) const;

    /// 0 = Monday ... 6 = Sunday
    int weekday() const;

    bool is_weekend() const { return weekday() >= 5; }

    bool operator==(const Date& o) const {
        return year == o.year && month == o.month && day == o.day;
    }
    bool operator!=(const Date& o) const { return !(*this == o); }
    bool operator<(const Date& o) const {
        if (year != o.year) return year < o.year;
        if (month != o.month) return month < o.month;
        return day < o.day;
    }
    bool operator>(const Date& o) const { return o < *this; }
    bool operator<=(const Date& o) const { return !(o < *this); }
    bool operator>=(const Date& o) const { return !(*this < o); }
};

/// Trading-day oracle: weekends and listed exchange holidays are closed.
class TradingCalendar {
public:
    TradingCalendar() = default;
    explicit TradingCalendar(std::set<Date> holidays);

    void add_holiday(const Date& date);

    bool is_holiday(const Date& date) const;
    bool is_trading_day(const Date& date) const;

    size_t holiday_count() const { return holidays_.size(); }

private:
    std::set<Date> holidays_;
};

} // namespace ds
