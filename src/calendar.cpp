#include "calendar.h"

#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace ds {

Date Date::parse(const std::string& text) {
    bool well_formed = text.size() == 10;
    for (size_t i = 0; well_formed && i < text.size(); i++) {
        if (i == 4 || i == 7) well_formed = text[i] == '-';
        else well_formed = std::isdigit(static_cast<unsigned char>(text[i])) != 0;
    }
    if (!well_formed) {
        throw std::invalid_argument("Invalid date '" + text + "', expected YYYY-MM-DD");
    }

    Date d;
    d.year = std::stoi(text.substr(0, 4));
    d.month = std::stoi(text.substr(5, 2));
    d.day = std::stoi(text.substr(8, 2));

    // timegm normalizes out-of-range fields; a real date survives the round trip.
    if (d.month < 1 || d.month > 12 || d.day < 1 || Date::from_time_t(d.to_time_t()) != d) {
        throw std::invalid_argument("Invalid calendar date '" + text + "'");
    }
    return d;
}

Date Date::from_time_t(time_t t) {
    struct tm tm;
    gmtime_r(&t, &tm);
    return {tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

Date Date::today() {
    time_t now = std::time(nullptr);
    struct tm tm;
    localtime_r(&now, &tm);
    return {tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

std::string Date::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

time_t Date::to_time_t() const {
    struct tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    return timegm(&tm);
}

Date Date::add_days(int days) const {
    return from_time_t(to_time_t() + static_cast<time_t>(days) * 86400);
}

int Date::weekday() const {
    time_t t = to_time_t();
    struct tm tm;
    gmtime_r(&t, &tm);
    return (tm.tm_wday + 6) % 7;
}


TradingCalendar::TradingCalendar(std::set<Date> holidays)
    : holidays_(std::move(holidays)) {}

void TradingCalendar::add_holiday(const Date& date) {
    holidays_.insert(date);
}

bool TradingCalendar::is_holiday(const Date& date) const {
    return holidays_.count(date) > 0;
}

bool TradingCalendar::is_trading_day(const Date& date) const {
    return !date.is_weekend() && !is_holiday(date);
}

} // namespace ds
