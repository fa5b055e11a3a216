#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fraudit::util {

/*
  Clock and calendar-date helpers.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Date      = std::chrono::year_month_day;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

Date Today();

// Days between two dates (b - a).
int DaysBetween(const Date& a, const Date& b);
Date AddDays(const Date& d, int days);

// ISO-8601 calendar date, "YYYY-MM-DD".
std::string FormatDate(const Date& d);
std::optional<Date> ParseDate(std::string_view text);

double SecondsBetween(TimePoint start, TimePoint end);

} // namespace fraudit::util
