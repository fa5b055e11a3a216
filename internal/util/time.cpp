#include "time.hpp"

#include <spdlog/fmt/fmt.h>

namespace fraudit::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

Date Today() {
  return Date{std::chrono::floor<std::chrono::days>(Clock::now())};
}

int DaysBetween(const Date& a, const Date& b) {
  return static_cast<int>((std::chrono::sys_days{b} - std::chrono::sys_days{a}).count());
}

Date AddDays(const Date& d, int days) {
  return Date{std::chrono::sys_days{d} + std::chrono::days{days}};
}

std::string FormatDate(const Date& d) {
  return fmt::format("{:04d}-{:02d}-{:02d}", static_cast<int>(d.year()), static_cast<unsigned>(d.month()),
                     static_cast<unsigned>(d.day()));
}

std::optional<Date> ParseDate(std::string_view text) {
  if (text.size() < 10) {
    return std::nullopt;
  }

  int      year  = 0;
  unsigned month = 0;
  unsigned day   = 0;
  char     tail  = '\0';
  const std::string value(text.substr(0, 10));
  if (std::sscanf(value.c_str(), "%4d-%2u-%2u%c", &year, &month, &day, &tail) != 3) {
    return std::nullopt;
  }

  Date date{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
  if (!date.ok()) {
    return std::nullopt;
  }
  return date;
}

double SecondsBetween(TimePoint start, TimePoint end) {
  return std::chrono::duration<double>(end - start).count();
}

} // namespace fraudit::util
